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

#ifndef LHE_PIR_LWE_TYPES_H_
#define LHE_PIR_LWE_TYPES_H_

// Ring element types used by the LWE-based PIR protocol.

#include <cstdint>
#include <type_traits>

namespace lhe_pir {
namespace lwe {

// Unsigned integer types storing an element of Z_{2^32} or Z_{2^64}. The
// native wraparound of these types is the implicit reduction modulo 2^width.
using Elem32 = uint32_t;
using Elem64 = uint64_t;

template <typename T>
struct IsElem : std::integral_constant<bool, std::is_same_v<T, Elem32> ||
                                                 std::is_same_v<T, Elem64>> {
};

template <typename T>
inline constexpr bool kIsElem = IsElem<T>::value;

// The number of bits in a ring element of type T.
template <typename T>
inline constexpr int kElemBitWidth = 8 * sizeof(T);

}  // namespace lwe
}  // namespace lhe_pir

#endif  // LHE_PIR_LWE_TYPES_H_
