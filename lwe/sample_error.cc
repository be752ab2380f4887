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

#include "lwe/sample_error.h"

#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

#include "absl/log/check.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "lwe/prng.h"
#include "shell_encryption/status_macros.h"

namespace lhe_pir {
namespace lwe {

namespace {

// Magnitudes beyond kTailCut standard deviations have probability far below
// 2^-64 and never get a table entry.
constexpr double kTailCut = 12.0;

// 2^64 as a long double.
constexpr long double kTwoTo64 = 18446744073709551616.0L;

}  // namespace

absl::StatusOr<DiscreteGaussianSampler> DiscreteGaussianSampler::Create(
    double stddev) {
  if (!(stddev > 0)) {
    return absl::InvalidArgumentError(
        absl::StrCat("The standard deviation, ", stddev,
                     ", must be positive."));
  }
  int64_t tail = static_cast<int64_t>(std::ceil(kTailCut * stddev));
  long double variance = static_cast<long double>(stddev) * stddev;
  long double two_variance = 2.0L * variance;

  // mass[k] is proportional to Pr[|X| = k].
  std::vector<long double> mass(tail + 1);
  long double total = 0;
  for (int64_t k = 0; k <= tail; ++k) {
    long double kk = static_cast<long double>(k);
    mass[k] = (k == 0 ? 1.0L : 2.0L) * std::exp(-kk * kk / two_variance);
    total += mass[k];
  }

  std::vector<uint64_t> cdf_table;
  long double cumulative = 0;
  for (int64_t k = 0; k <= tail; ++k) {
    cumulative += mass[k];
    long double threshold = std::floor(cumulative / total * kTwoTo64);
    if (threshold >= kTwoTo64) {
      break;
    }
    cdf_table.push_back(static_cast<uint64_t>(threshold));
  }
  return DiscreteGaussianSampler(stddev, std::move(cdf_table));
}

absl::StatusOr<int64_t> DiscreteGaussianSampler::Sample(
    BufferedPrg* prg) const {
  if (prg == nullptr) {
    return absl::InvalidArgumentError("The prng must not be null.");
  }
  RLWE_ASSIGN_OR_RETURN(uint64_t u, prg->Rand64());
  RLWE_ASSIGN_OR_RETURN(uint8_t sign_bits, prg->Rand8());

  int64_t magnitude = 0;
  for (uint64_t threshold : cdf_table_) {
    magnitude += static_cast<int64_t>(u >= threshold);
  }
  // Negates `magnitude` iff `sign` is 1.
  int64_t sign = sign_bits & 1;
  return (magnitude ^ -sign) + sign;
}

const DiscreteGaussianSampler& ErrorSampler32() {
  static const DiscreteGaussianSampler sampler = [] {
    auto sampler = DiscreteGaussianSampler::Create(kErrorStdDev32);
    CHECK_OK(sampler.status());
    return *std::move(sampler);
  }();
  return sampler;
}

const DiscreteGaussianSampler& ErrorSampler64() {
  static const DiscreteGaussianSampler sampler = [] {
    auto sampler = DiscreteGaussianSampler::Create(kErrorStdDev64);
    CHECK_OK(sampler.status());
    return *std::move(sampler);
  }();
  return sampler;
}

}  // namespace lwe
}  // namespace lhe_pir
