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

#ifndef LHE_PIR_LWE_STATUS_H_
#define LHE_PIR_LWE_STATUS_H_

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"

namespace lhe_pir {

// Error kinds reported by the matrix library and the PIR protocol. Each kind
// maps to a single canonical status code so callers can tell them apart:
//
//   DimensionMismatch    -> kInvalidArgument
//   IndexOutOfRange      -> kOutOfRange
//   UnsupportedParameter -> kUnimplemented
//   RandomnessFailure    -> kInternal

inline absl::Status DimensionMismatchError(absl::string_view message) {
  return absl::InvalidArgumentError(
      absl::StrCat("Dimension mismatch: ", message));
}

inline absl::Status IndexOutOfRangeError(absl::string_view message) {
  return absl::OutOfRangeError(absl::StrCat("Index out of range: ", message));
}

inline absl::Status UnsupportedParameterError(absl::string_view message) {
  return absl::UnimplementedError(
      absl::StrCat("Unsupported parameter: ", message));
}

// Wraps an error returned by the underlying random source.
inline absl::Status RandomnessFailureError(const absl::Status& cause) {
  return absl::InternalError(
      absl::StrCat("Randomness failure: ", cause.message()));
}

}  // namespace lhe_pir

#endif  // LHE_PIR_LWE_STATUS_H_
