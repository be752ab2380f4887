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

#ifndef LHE_PIR_LWE_SAMPLE_ERROR_H_
#define LHE_PIR_LWE_SAMPLE_ERROR_H_

#include <cstdint>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/types/span.h"
#include "lwe/prng.h"
#include "lwe/types.h"
#include "shell_encryption/status_macros.h"

namespace lhe_pir {
namespace lwe {

// Standard deviations of the LWE error distribution, per element width.
inline constexpr double kErrorStdDev32 = 6.4;
inline constexpr double kErrorStdDev64 = 64.0;

// Samples integers from the discrete Gaussian distribution centered at 0,
//
//   Pr[X = x] \propto exp(-x^2 / (2 * stddev^2)),
//
// by inversion of a cumulative distribution table.
//
// The table stores, for k = 0, 1, ..., the threshold
//
//   T[k] = floor(2^64 * Pr[|X| <= k]),
//
// for all k where this is below 2^64. A sample draws a uniform 64-bit u and
// sets |X| to the number of thresholds T[k] <= u, scanning the whole table so
// that the running time does not depend on the sample. A random sign is then
// applied.
class DiscreteGaussianSampler {
 public:
  // Returns an error if `stddev` is not positive.
  static absl::StatusOr<DiscreteGaussianSampler> Create(double stddev);

  // Returns a signed sample.
  absl::StatusOr<int64_t> Sample(BufferedPrg* prg) const;

  // Accessors.
  double StdDev() const { return stddev_; }
  absl::Span<const uint64_t> CdfTable() const { return cdf_table_; }

  // The largest magnitude this sampler can return.
  int64_t MaxMagnitude() const {
    return static_cast<int64_t>(cdf_table_.size());
  }

 private:
  DiscreteGaussianSampler(double stddev, std::vector<uint64_t> cdf_table)
      : stddev_(stddev), cdf_table_(std::move(cdf_table)) {}

  double stddev_;
  std::vector<uint64_t> cdf_table_;
};

// Returns the samplers used for 32-bit and 64-bit ring elements. The tables
// are built on first use.
const DiscreteGaussianSampler& ErrorSampler32();
const DiscreteGaussianSampler& ErrorSampler64();

template <typename T>
const DiscreteGaussianSampler& ErrorSamplerFor() {
  static_assert(kIsElem<T>, "T must be Elem32 or Elem64.");
  if constexpr (sizeof(T) == sizeof(Elem32)) {
    return ErrorSampler32();
  } else {
    return ErrorSampler64();
  }
}

// Returns a discrete Gaussian sample represented as an element of Z_{2^w},
// where w is the bit width of T.
template <typename T>
absl::StatusOr<T> SampleError(BufferedPrg* prg) {
  RLWE_ASSIGN_OR_RETURN(int64_t sample, ErrorSamplerFor<T>().Sample(prg));
  return static_cast<T>(sample);
}

}  // namespace lwe
}  // namespace lhe_pir

#endif  // LHE_PIR_LWE_SAMPLE_ERROR_H_
