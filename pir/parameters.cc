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

#include "pir/parameters.h"

#include <cstdint>

#include "absl/numeric/int128.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "lwe/status.h"

namespace lhe_pir {

absl::Status ValidateParameters(const Parameters& params, int elem_bit_width) {
  if (!(params.prng_type == rlwe::PRNG_TYPE_HKDF ||
        params.prng_type == rlwe::PRNG_TYPE_CHACHA)) {
    return absl::InvalidArgumentError("Invalid `prng_type`.");
  }
  if (params.lwe_secret_dim <= 0) {
    return absl::InvalidArgumentError("`lwe_secret_dim` must be positive.");
  }
  if (params.db_rows <= 0 || params.db_cols <= 0) {
    return absl::InvalidArgumentError(
        "`db_rows` and `db_cols` must be positive.");
  }
  if (params.db_entry_bit_size <= 0 || params.db_entry_bit_size > 64) {
    return absl::InvalidArgumentError(
        "`db_entry_bit_size` must be in [1, 64].");
  }
  if (params.lwe_modulus_bit_size <= 0 ||
      params.lwe_modulus_bit_size > elem_bit_width) {
    return absl::InvalidArgumentError(absl::StrCat(
        "`lwe_modulus_bit_size` must be in [1, ", elem_bit_width, "]."));
  }
  if (params.plaintext_modulus < 2 ||
      absl::uint128{params.plaintext_modulus} > LweModulus(params)) {
    return absl::InvalidArgumentError(
        "`plaintext_modulus` must be in [2, 2^lwe_modulus_bit_size].");
  }
  if (params.error_dim <= 0) {
    return absl::InvalidArgumentError("`error_dim` must be positive.");
  }
  if (params.squishing <= 0) {
    return absl::InvalidArgumentError("`squishing` must be positive.");
  }
  if (params.multiply_options.num_threads <= 0) {
    return absl::InvalidArgumentError("`num_threads` must be positive.");
  }
  int basis = PlaintextBasis(params);
  if (static_cast<int64_t>(basis) * params.squishing > elem_bit_width) {
    return UnsupportedParameterError(absl::StrCat(
        "Cannot pack ", params.squishing, " entries of ", basis,
        " bits into a ", elem_bit_width, "-bit element."));
  }
  return absl::OkStatus();
}

}  // namespace lhe_pir
