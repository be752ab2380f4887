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

#include "lwe/prng.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

#include "absl/numeric/bits.h"
#include "absl/numeric/int128.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "lwe/status.h"
#include "shell_encryption/prng/single_thread_chacha_prng.h"
#include "shell_encryption/prng/single_thread_hkdf_prng.h"
#include "shell_encryption/status_macros.h"

namespace lhe_pir {
namespace lwe {

namespace {

inline absl::Status InvalidPrngTypeError() {
  return absl::InvalidArgumentError("Invalid PRNG type.");
}

}  // namespace

absl::StatusOr<std::string> BufferedPrg::GenerateSeed(
    rlwe::PrngType prng_type) {
  absl::StatusOr<std::string> seed;
  if (prng_type == rlwe::PRNG_TYPE_HKDF) {
    seed = rlwe::SingleThreadHkdfPrng::GenerateSeed();
  } else if (prng_type == rlwe::PRNG_TYPE_CHACHA) {
    seed = rlwe::SingleThreadChaChaPrng::GenerateSeed();
  } else {
    return InvalidPrngTypeError();
  }
  if (!seed.ok()) {
    return RandomnessFailureError(seed.status());
  }
  return seed;
}

absl::StatusOr<int> BufferedPrg::SeedLength(rlwe::PrngType prng_type) {
  if (prng_type == rlwe::PRNG_TYPE_HKDF) {
    return rlwe::SingleThreadHkdfPrng::SeedLength();
  } else if (prng_type == rlwe::PRNG_TYPE_CHACHA) {
    return rlwe::SingleThreadChaChaPrng::SeedLength();
  }
  return InvalidPrngTypeError();
}

absl::StatusOr<std::unique_ptr<BufferedPrg>> BufferedPrg::Create(
    absl::string_view seed, rlwe::PrngType prng_type) {
  if (seed.size() < kMinSeedBytes) {
    return absl::InvalidArgumentError(
        absl::StrCat("The seed has ", seed.size(), " bytes, but at least ",
                     kMinSeedBytes, " are required."));
  }
  std::unique_ptr<rlwe::SecurePrng> prng;
  if (prng_type == rlwe::PRNG_TYPE_HKDF) {
    RLWE_ASSIGN_OR_RETURN(prng, rlwe::SingleThreadHkdfPrng::Create(seed));
  } else if (prng_type == rlwe::PRNG_TYPE_CHACHA) {
    RLWE_ASSIGN_OR_RETURN(prng, rlwe::SingleThreadChaChaPrng::Create(seed));
  } else {
    return InvalidPrngTypeError();
  }
  return std::make_unique<BufferedPrg>(std::move(prng));
}

absl::StatusOr<std::unique_ptr<BufferedPrg>> BufferedPrg::CreateWithRandomSeed(
    rlwe::PrngType prng_type) {
  RLWE_ASSIGN_OR_RETURN(std::string seed, GenerateSeed(prng_type));
  return Create(seed, prng_type);
}

BufferedPrg::BufferedPrg(std::unique_ptr<rlwe::SecurePrng> prng)
    : prng_(std::move(prng)), buffer_(kBufferSize), position_(kBufferSize) {
  if (prng_ == nullptr) {
    status_ = absl::InvalidArgumentError("The prng must not be null.");
  }
}

absl::Status BufferedPrg::EnsureAvailable(size_t num_bytes) {
  if (!status_.ok()) {
    return status_;
  }
  if (buffer_.size() - position_ >= num_bytes) {
    return absl::OkStatus();
  }
  // Unread tail bytes are discarded; refill in 64-bit words.
  for (size_t i = 0; i < buffer_.size(); i += sizeof(uint64_t)) {
    absl::StatusOr<rlwe::Uint64> word = prng_->Rand64();
    if (!word.ok()) {
      status_ = RandomnessFailureError(word.status());
      return status_;
    }
    uint64_t value = *word;
    std::memcpy(&buffer_[i], &value, sizeof(value));
  }
  position_ = 0;
  return absl::OkStatus();
}

absl::StatusOr<rlwe::Uint8> BufferedPrg::Rand8() {
  RLWE_RETURN_IF_ERROR(EnsureAvailable(1));
  return buffer_[position_++];
}

absl::StatusOr<rlwe::Uint64> BufferedPrg::Rand64() {
  RLWE_RETURN_IF_ERROR(EnsureAvailable(sizeof(uint64_t)));
  uint64_t value;
  std::memcpy(&value, &buffer_[position_], sizeof(value));
  position_ += sizeof(value);
  return value;
}

absl::Status BufferedPrg::RandBytes(absl::Span<uint8_t> out) {
  size_t num_filled = 0;
  while (num_filled < out.size()) {
    RLWE_RETURN_IF_ERROR(EnsureAvailable(1));
    size_t num_copied =
        std::min(out.size() - num_filled, buffer_.size() - position_);
    std::memcpy(out.data() + num_filled, &buffer_[position_], num_copied);
    position_ += num_copied;
    num_filled += num_copied;
  }
  return absl::OkStatus();
}

absl::StatusOr<uint64_t> BufferedPrg::UniformBelow(absl::uint128 bound) {
  if (bound == 0) {
    return absl::InvalidArgumentError("`bound` must be positive.");
  }
  if (bound > (absl::uint128{1} << 64)) {
    return absl::InvalidArgumentError("`bound` must be at most 2^64.");
  }
  uint64_t max_value = static_cast<uint64_t>(bound - 1);
  int num_bits = absl::bit_width(max_value);
  if (num_bits == 0) {
    return uint64_t{0};
  }
  uint64_t mask =
      num_bits == 64 ? ~uint64_t{0} : (uint64_t{1} << num_bits) - 1;
  // Each attempt succeeds with probability > 1/2.
  while (true) {
    RLWE_ASSIGN_OR_RETURN(uint64_t r, Rand64());
    r &= mask;
    if (r <= max_value) {
      return r;
    }
  }
}

}  // namespace lwe
}  // namespace lhe_pir
