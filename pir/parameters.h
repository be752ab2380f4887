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

#ifndef LHE_PIR_PIR_PARAMETERS_H_
#define LHE_PIR_PIR_PARAMETERS_H_

#include <cstdint>

#include "absl/numeric/bits.h"
#include "absl/numeric/int128.h"
#include "absl/status/status.h"
#include "lwe/encode.h"
#include "lwe/types.h"
#include "matrix/multiply.h"
#include "shell_encryption/serialization.pb.h"

namespace lhe_pir {

// Parameters of the LWE based PIR protocol.
//
// The database is a db_rows x db_cols matrix D with entries in [0, P), where
// P = plaintext_modulus. The client selects a column (or, in the homomorphic
// variant, a linear combination of columns) and learns the matching column of
// D, computed over Z_P.
struct Parameters {
  int lwe_secret_dim;
  int64_t db_rows;
  int64_t db_cols;
  int db_entry_bit_size;
  uint64_t plaintext_modulus;
  int lwe_modulus_bit_size;  // at most the element bit width

  // Number of error vectors per query; only 1 is supported.
  int error_dim = 1;

  // Number of database entries packed into one element by the server.
  int squishing = 1;

  rlwe::PrngType prng_type = rlwe::PRNG_TYPE_HKDF;
  MultiplyOptions multiply_options;
};

// Returns an error unless `params` describe a protocol instance over elements
// of `elem_bit_width` bits.
absl::Status ValidateParameters(const Parameters& params, int elem_bit_width);

template <typename T>
absl::Status ValidateParameters(const Parameters& params) {
  return ValidateParameters(params, lwe::kElemBitWidth<T>);
}

inline bool IsPowerOfTwo(uint64_t x) { return absl::has_single_bit(x); }

// Q = 2^lwe_modulus_bit_size.
inline absl::uint128 LweModulus(const Parameters& params) {
  return lwe::LweModulus(params.lwe_modulus_bit_size);
}

// \Delta = floor(Q / P).
inline uint64_t ScalingFactor(const Parameters& params) {
  return lwe::ScalingFactor(params.lwe_modulus_bit_size,
                            params.plaintext_modulus);
}

// Decodes a noisy encoding \Delta * m + e mod Q into m mod P.
inline uint64_t RoundToPlaintext(const Parameters& params, uint64_t value) {
  return lwe::RemoveError(value, params.lwe_modulus_bit_size,
                          params.plaintext_modulus);
}

// Number of bits needed to store an entry of the database, which is used as
// the packing basis when squishing.
inline int PlaintextBasis(const Parameters& params) {
  return absl::bit_width(params.plaintext_modulus - 1);
}

// The length of a query: db_cols rounded up to a multiple of squishing.
inline int64_t PaddedDbCols(const Parameters& params) {
  return (params.db_cols + params.squishing - 1) / params.squishing *
         params.squishing;
}

}  // namespace lhe_pir

#endif  // LHE_PIR_PIR_PARAMETERS_H_
