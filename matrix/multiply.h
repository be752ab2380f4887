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

#ifndef LHE_PIR_MATRIX_MULTIPLY_H_
#define LHE_PIR_MATRIX_MULTIPLY_H_

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "matrix/matrix.h"

namespace lhe_pir {

// Implementations of the matrix product. All of them compute exactly
//
//   out(i, j) = \sum_k a(i, k) * b(k, j)  (mod 2^w),
//
// and return bit-identical results.
enum class MultiplyKernel {
  // The triple loop above, used as the reference for testing.
  kReference,
  // Eigen's cache-blocked product.
  kEigen,
  // SIMD kernel using the highway library. Only 32-bit elements are
  // vectorized; 64-bit elements fall back to the reference kernel.
  kHighway,
};

struct MultiplyOptions {
  MultiplyKernel kernel = MultiplyKernel::kEigen;
  // When larger than 1, the rows of the output are split into this many
  // blocks, computed in parallel with OpenMP.
  int num_threads = 1;
};

absl::string_view MultiplyKernelName(MultiplyKernel kernel);

// Returns `a` * `b`.
template <typename T>
absl::StatusOr<Matrix<T>> Multiply(MatrixView<T> a, MatrixView<T> b,
                                   const MultiplyOptions& options = {});

// Returns `packed` * `vec`, where `packed` is the output of
// Matrix<T>::Squish(basis, squishing) and `vec` is a column vector with
// squishing * packed.Cols() rows. The result equals the product of the
// unpacked matrix, with `vec` truncated to the unpacked columns, whenever the
// padded rows of `vec` are zero.
template <typename T>
absl::StatusOr<Matrix<T>> MultiplyPackedVector(MatrixView<T> packed,
                                               MatrixView<T> vec, int basis,
                                               int squishing,
                                               int num_threads = 1);

}  // namespace lhe_pir

#endif  // LHE_PIR_MATRIX_MULTIPLY_H_
