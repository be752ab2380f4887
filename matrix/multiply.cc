/*
 * Copyright 2024 Google LLC.
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "matrix/multiply.h"

#include <algorithm>
#include <cstdint>
#include <type_traits>

#include "Eigen/Core"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "lwe/status.h"
#include "lwe/types.h"
#include "matrix/matrix.h"
#include "matrix/multiply_hwy.h"
#include "shell_encryption/status_macros.h"

namespace lhe_pir {
namespace {

template <typename T>
void MultiplyReference(MatrixView<T> a, MatrixView<T> b, T* out) {
  const T* a_data = a.Data().data();
  const T* b_data = b.Data().data();
  const uint64_t inner = a.Cols();
  const uint64_t cols = b.Cols();
  for (uint64_t i = 0; i < a.Rows(); ++i) {
    for (uint64_t j = 0; j < cols; ++j) {
      T sum = 0;
      for (uint64_t k = 0; k < inner; ++k) {
        sum += a_data[i * inner + k] * b_data[k * cols + j];
      }
      out[i * cols + j] = sum;
    }
  }
}

template <typename T>
void MultiplyEigen(MatrixView<T> a, MatrixView<T> b, T* out) {
  Eigen::Map<RowMajorMatrix<T>> result(out,
                                       static_cast<Eigen::Index>(a.Rows()),
                                       static_cast<Eigen::Index>(b.Cols()));
  result.noalias() = a.AsEigen() * b.AsEigen();
}

// Writes the rows of `a` * `b` to `out`, which holds a.Rows() rows of
// b.Cols() entries.
template <typename T>
void MultiplyBlock(MultiplyKernel kernel, MatrixView<T> a, MatrixView<T> b,
                   T* out) {
  switch (kernel) {
    case MultiplyKernel::kReference:
      MultiplyReference(a, b, out);
      return;
    case MultiplyKernel::kEigen:
      MultiplyEigen(a, b, out);
      return;
    case MultiplyKernel::kHighway:
      if constexpr (std::is_same_v<T, lwe::Elem32>) {
        internal::MultiplyHwy(a.Data().data(), b.Data().data(), out, a.Rows(),
                              a.Cols(), b.Cols());
      } else {
        MultiplyReference(a, b, out);
      }
      return;
  }
}

bool IsValidKernel(MultiplyKernel kernel) {
  return kernel == MultiplyKernel::kReference ||
         kernel == MultiplyKernel::kEigen ||
         kernel == MultiplyKernel::kHighway;
}

absl::Status CheckNumThreads(int num_threads) {
  if (num_threads < 1) {
    return absl::InvalidArgumentError(absl::StrCat(
        "`num_threads` must be positive, given ", num_threads, "."));
  }
  return absl::OkStatus();
}

}  // namespace

absl::string_view MultiplyKernelName(MultiplyKernel kernel) {
  switch (kernel) {
    case MultiplyKernel::kReference:
      return "reference";
    case MultiplyKernel::kEigen:
      return "eigen";
    case MultiplyKernel::kHighway:
      return "highway";
  }
  return "unknown";
}

template <typename T>
absl::StatusOr<Matrix<T>> Multiply(MatrixView<T> a, MatrixView<T> b,
                                   const MultiplyOptions& options) {
  if (a.Cols() != b.Rows()) {
    return DimensionMismatchError(absl::StrCat(
        "Cannot multiply a ", a.Rows(), " x ", a.Cols(), " matrix by a ",
        b.Rows(), " x ", b.Cols(), " matrix."));
  }
  if (!IsValidKernel(options.kernel)) {
    return absl::InvalidArgumentError("Unknown multiplication kernel.");
  }
  RLWE_RETURN_IF_ERROR(CheckNumThreads(options.num_threads));

  VLOG(2) << "Multiplying " << a.Rows() << " x " << a.Cols() << " by "
          << b.Rows() << " x " << b.Cols() << " with the "
          << MultiplyKernelName(options.kernel) << " kernel on "
          << options.num_threads << " thread(s).";

  Matrix<T> out(a.Rows(), b.Cols());
  T* out_data = out.MutableData().data();
  const int64_t num_blocks = static_cast<int64_t>(
      std::min<uint64_t>(options.num_threads, a.Rows()));
  if (num_blocks <= 1) {
    MultiplyBlock(options.kernel, a, b, out_data);
    return out;
  }

  const uint64_t rows_per_block = (a.Rows() + num_blocks - 1) / num_blocks;
  const T* a_data = a.Data().data();
#pragma omp parallel for num_threads(options.num_threads)
  for (int64_t block = 0; block < num_blocks; ++block) {
    uint64_t begin = static_cast<uint64_t>(block) * rows_per_block;
    uint64_t end = std::min(a.Rows(), begin + rows_per_block);
    if (begin >= end) continue;
    MatrixView<T> a_block(a_data + begin * a.Cols(), end - begin, a.Cols());
    MultiplyBlock(options.kernel, a_block, b, out_data + begin * b.Cols());
  }
  return out;
}

template <typename T>
absl::StatusOr<Matrix<T>> MultiplyPackedVector(MatrixView<T> packed,
                                               MatrixView<T> vec, int basis,
                                               int squishing,
                                               int num_threads) {
  RLWE_RETURN_IF_ERROR(Matrix<T>::CheckPacking(basis, squishing));
  RLWE_RETURN_IF_ERROR(CheckNumThreads(num_threads));
  if (vec.Cols() != 1 || vec.Rows() != packed.Cols() * squishing) {
    return DimensionMismatchError(absl::StrCat(
        "Expected a vector of ", packed.Cols() * squishing, " x 1, given ",
        vec.Rows(), " x ", vec.Cols(), "."));
  }

  const T mask = Matrix<T>::PackingMask(basis);
  const T* packed_data = packed.Data().data();
  const T* vec_data = vec.Data().data();
  const uint64_t packed_cols = packed.Cols();
  const int64_t rows = static_cast<int64_t>(packed.Rows());
  Matrix<T> out(packed.Rows(), 1);
  T* out_data = out.MutableData().data();

#pragma omp parallel for num_threads(num_threads) if (num_threads > 1)
  for (int64_t i = 0; i < rows; ++i) {
    const T* row = packed_data + i * packed_cols;
    T sum = 0;
    for (uint64_t j = 0; j < packed_cols; ++j) {
      const T element = row[j];
      const T* vec_chunk = vec_data + j * squishing;
      // (squishing - 1) * basis < w, so no shift below overflows.
      for (int k = 0; k < squishing; ++k) {
        sum += ((element >> (k * basis)) & mask) * vec_chunk[k];
      }
    }
    out_data[i] = sum;
  }
  return out;
}

template absl::StatusOr<Matrix<lwe::Elem32>> Multiply(
    MatrixView<lwe::Elem32>, MatrixView<lwe::Elem32>, const MultiplyOptions&);
template absl::StatusOr<Matrix<lwe::Elem64>> Multiply(
    MatrixView<lwe::Elem64>, MatrixView<lwe::Elem64>, const MultiplyOptions&);
template absl::StatusOr<Matrix<lwe::Elem32>> MultiplyPackedVector(
    MatrixView<lwe::Elem32>, MatrixView<lwe::Elem32>, int, int, int);
template absl::StatusOr<Matrix<lwe::Elem64>> MultiplyPackedVector(
    MatrixView<lwe::Elem64>, MatrixView<lwe::Elem64>, int, int, int);

}  // namespace lhe_pir
