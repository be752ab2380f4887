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

#ifndef LHE_PIR_MATRIX_MULTIPLY_HWY_H_
#define LHE_PIR_MATRIX_MULTIPLY_HWY_H_

#include <stddef.h>
#include <stdint.h>

namespace lhe_pir {
namespace internal {

// Given row-major matrices `a` (rows x inner) and `b` (inner x cols), writes
// the product `a` * `b` (mod 2^32) to `out` (rows x cols), which must not
// alias the inputs.
// This version is implemented using SIMD instructions via the highway library.
void MultiplyHwy(const uint32_t* a, const uint32_t* b, uint32_t* out,
                 size_t rows, size_t inner, size_t cols);

// Matrix product implemented without using highway SIMD intrinsics.
void MultiplyNoHwy(const uint32_t* a, const uint32_t* b, uint32_t* out,
                   size_t rows, size_t inner, size_t cols);

}  // namespace internal
}  // namespace lhe_pir

#endif  // LHE_PIR_MATRIX_MULTIPLY_HWY_H_
