// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "matrix/multiply_hwy.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>

#include "absl/base/optimization.h"
#include "hwy/detect_targets.h"

// Highway implementations.
// clang-format off
#undef HWY_TARGET_INCLUDE
#define HWY_TARGET_INCLUDE "matrix/multiply_hwy.cc"
#include "hwy/foreach_target.h"  // IWYU pragma: keep
// clang-format on

// Must come after foreach_target.h to avoid redefinition errors.
#include "hwy/highway.h"

HWY_BEFORE_NAMESPACE();
namespace lhe_pir::internal {
namespace HWY_NAMESPACE {

#if HWY_TARGET == HWY_SCALAR

void MultiplyHwyImpl(const uint32_t* a, const uint32_t* b, uint32_t* out,
                     size_t rows, size_t inner, size_t cols) {
  MultiplyNoHwy(a, b, out, rows, inner, cols);
}

#else

namespace hn = hwy::HWY_NAMESPACE;

// out = a * b for a column vector b, one dot product per row of a.
void MatrixVectorHwy(const uint32_t* a, const uint32_t* b, uint32_t* out,
                     size_t rows, size_t inner) {
  const hn::ScalableTag<uint32_t> d32;
  const size_t N = hn::Lanes(d32);
  for (size_t i = 0; i < rows; ++i) {
    const uint32_t* a_row = a + i * inner;
    auto acc0 = hn::Zero(d32);
    auto acc1 = hn::Zero(d32);
    size_t k = 0;
    for (; k + 2 * N <= inner; k += 2 * N) {
      acc0 = hn::MulAdd(hn::LoadU(d32, a_row + k), hn::LoadU(d32, b + k), acc0);
      acc1 = hn::MulAdd(hn::LoadU(d32, a_row + k + N),
                        hn::LoadU(d32, b + k + N), acc1);
    }
    for (; k + N <= inner; k += N) {
      acc0 = hn::MulAdd(hn::LoadU(d32, a_row + k), hn::LoadU(d32, b + k), acc0);
    }
    uint32_t sum = hn::GetLane(hn::SumOfLanes(d32, hn::Add(acc0, acc1)));
    // Handle the remaining entries that didn't take a full lane.
    for (; k < inner; ++k) {
      sum += a_row[k] * b[k];
    }
    out[i] = sum;
  }
}

void MultiplyHwyImpl(const uint32_t* a, const uint32_t* b, uint32_t* out,
                     size_t rows, size_t inner, size_t cols) {
  const hn::ScalableTag<uint32_t> d32;
  const size_t N = hn::Lanes(d32);

  // Do not run the highway version if the vectors hold less than 4 lanes.
  if (ABSL_PREDICT_FALSE(N < 4)) {
    MultiplyNoHwy(a, b, out, rows, inner, cols);
    return;
  }
  if (cols == 1) {
    MatrixVectorHwy(a, b, out, rows, inner);
    return;
  }

  // Accumulate out[i, :] += a[i, k] * b[k, :] over k, so that all loads from
  // `b` and `out` are contiguous.
  for (size_t i = 0; i < rows; ++i) {
    uint32_t* out_row = out + i * cols;
    std::fill_n(out_row, cols, 0);
    for (size_t k = 0; k < inner; ++k) {
      const uint32_t a_ik = a[i * inner + k];
      const uint32_t* b_row = b + k * cols;
      auto left32 = hn::Set(d32, a_ik);
      size_t j = 0;
      // First, run 4x SIMD multiplication in each iteration.
      for (; j + 4 * N <= cols; j += 4 * N) {
        auto add32_0 = hn::LoadU(d32, out_row + j);
        auto add32_1 = hn::LoadU(d32, out_row + j + N);
        auto add32_2 = hn::LoadU(d32, out_row + j + 2 * N);
        auto add32_3 = hn::LoadU(d32, out_row + j + 3 * N);

        auto right32_0 = hn::LoadU(d32, b_row + j);
        auto right32_1 = hn::LoadU(d32, b_row + j + N);
        auto right32_2 = hn::LoadU(d32, b_row + j + 2 * N);
        auto right32_3 = hn::LoadU(d32, b_row + j + 3 * N);

        hn::StoreU(hn::MulAdd(left32, right32_0, add32_0), d32, out_row + j);
        hn::StoreU(hn::MulAdd(left32, right32_1, add32_1), d32,
                   out_row + j + N);
        hn::StoreU(hn::MulAdd(left32, right32_2, add32_2), d32,
                   out_row + j + 2 * N);
        hn::StoreU(hn::MulAdd(left32, right32_3, add32_3), d32,
                   out_row + j + 3 * N);
      }
      // Next, run 1x per iteration.
      for (; j + N <= cols; j += N) {
        auto add32 = hn::LoadU(d32, out_row + j);
        auto right32 = hn::LoadU(d32, b_row + j);
        hn::StoreU(hn::MulAdd(left32, right32, add32), d32, out_row + j);
      }
      // Handle the remaining columns that didn't take a full lane.
      for (; j < cols; ++j) {
        out_row[j] += a_ik * b_row[j];
      }
    }
  }
}

#endif  // HWY_TARGET == HWY_SCALAR

}  // namespace HWY_NAMESPACE
}  // namespace lhe_pir::internal
HWY_AFTER_NAMESPACE();

#if HWY_ONCE || HWY_IDE
namespace lhe_pir::internal {

void MultiplyNoHwy(const uint32_t* a, const uint32_t* b, uint32_t* out,
                   size_t rows, size_t inner, size_t cols) {
  for (size_t i = 0; i < rows; ++i) {
    uint32_t* out_row = out + i * cols;
    std::fill_n(out_row, cols, 0);
    for (size_t k = 0; k < inner; ++k) {
      const uint32_t a_ik = a[i * inner + k];
      const uint32_t* b_row = b + k * cols;
      for (size_t j = 0; j < cols; ++j) {
        out_row[j] += a_ik * b_row[j];
      }
    }
  }
}

HWY_EXPORT(MultiplyHwyImpl);

void MultiplyHwy(const uint32_t* a, const uint32_t* b, uint32_t* out,
                 size_t rows, size_t inner, size_t cols) {
  HWY_DYNAMIC_DISPATCH(MultiplyHwyImpl)(a, b, out, rows, inner, cols);
}

}  // namespace lhe_pir::internal
#endif  // HWY_ONCE || HWY_IDE
