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

#ifndef LHE_PIR_LWE_PRNG_H_
#define LHE_PIR_LWE_PRNG_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/numeric/int128.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "shell_encryption/integral_types.h"
#include "shell_encryption/prng/prng.h"
#include "shell_encryption/serialization.pb.h"

namespace lhe_pir {
namespace lwe {

// A deterministic pseudorandom generator keyed by a seed, which buffers the
// output of an underlying shell-encryption PRNG (HKDF or ChaCha based).
//
// Sampling routines draw many small values; refilling a buffer in large
// chunks amortizes the per-call cost of the underlying PRNG.
//
// A BufferedPrg is stateful and must not be shared between threads without
// external synchronization. Concurrent callers should own independently
// seeded instances.
//
// Once the underlying PRNG reports an error, every subsequent draw fails
// with the same RandomnessFailure error.
class BufferedPrg final : public rlwe::SecurePrng {
 public:
  // Number of bytes generated per refill.
  static constexpr size_t kBufferSize = 4096;

  // Seeds must carry at least 256 bits.
  static constexpr size_t kMinSeedBytes = 32;

  // Returns a fresh seed drawn from the operating system's randomness source.
  static absl::StatusOr<std::string> GenerateSeed(rlwe::PrngType prng_type);

  // Returns the seed length expected by the PRNG of type `prng_type`.
  static absl::StatusOr<int> SeedLength(rlwe::PrngType prng_type);

  // Creates a PRNG expanding `seed`. Two PRNGs created from the same seed and
  // type produce identical streams.
  static absl::StatusOr<std::unique_ptr<BufferedPrg>> Create(
      absl::string_view seed, rlwe::PrngType prng_type);

  // Creates a PRNG keyed with a fresh random seed.
  static absl::StatusOr<std::unique_ptr<BufferedPrg>> CreateWithRandomSeed(
      rlwe::PrngType prng_type);

  // Wraps an existing PRNG. Does not check its seed.
  explicit BufferedPrg(std::unique_ptr<rlwe::SecurePrng> prng);

  BufferedPrg(const BufferedPrg&) = delete;
  BufferedPrg& operator=(const BufferedPrg&) = delete;

  absl::StatusOr<rlwe::Uint8> Rand8() override;
  absl::StatusOr<rlwe::Uint64> Rand64() override;

  // Fills `out` with pseudorandom bytes.
  absl::Status RandBytes(absl::Span<uint8_t> out);

  // Returns a uniformly random integer in [0, bound), for 1 <= bound <= 2^64.
  // Each attempt consumes one Rand64() draw, masked to the bit width of
  // bound - 1, and values >= bound are rejected.
  absl::StatusOr<uint64_t> UniformBelow(absl::uint128 bound);

 private:
  // Makes sure at least `num_bytes` unread bytes are in the buffer.
  absl::Status EnsureAvailable(size_t num_bytes);

  std::unique_ptr<rlwe::SecurePrng> prng_;
  std::vector<uint8_t> buffer_;
  size_t position_;

  // Sticky error from the underlying PRNG.
  absl::Status status_;
};

}  // namespace lwe
}  // namespace lhe_pir

#endif  // LHE_PIR_LWE_PRNG_H_
