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

#ifndef LHE_PIR_LWE_ENCODE_H_
#define LHE_PIR_LWE_ENCODE_H_

#include <cstdint>

#include "absl/numeric/int128.h"

namespace lhe_pir {
namespace lwe {

// Returns the LWE modulus Q = 2^log_modulus, for 1 <= log_modulus <= 64.
inline absl::uint128 LweModulus(int log_modulus) {
  return absl::uint128{1} << log_modulus;
}

// Returns the scaling factor \Delta = floor(Q / p).
inline uint64_t ScalingFactor(int log_modulus, uint64_t plaintext_modulus) {
  return static_cast<uint64_t>(LweModulus(log_modulus) / plaintext_modulus);
}

// Removes the error from `noisy`, which encodes \Delta * m + e mod Q, and
// returns m mod p, i.e. round(noisy / \Delta) mod p.
//
// A value close to Q is closer to Q = \Delta * p (+ Q mod p) than to
// \Delta * (p - 1) and therefore rounds to p, which is reduced to 0.
inline uint64_t RemoveError(uint64_t noisy, int log_modulus,
                            uint64_t plaintext_modulus) {
  absl::uint128 q = LweModulus(log_modulus);
  absl::uint128 delta = q / plaintext_modulus;
  absl::uint128 value = absl::uint128{noisy} % q;
  // = floor(m + 1/2 + e/\Delta) = nearest_int(m + e/\Delta)
  absl::uint128 rounded = (value + delta / 2) / delta;
  return static_cast<uint64_t>(rounded % plaintext_modulus);
}

}  // namespace lwe
}  // namespace lhe_pir

#endif  // LHE_PIR_LWE_ENCODE_H_
