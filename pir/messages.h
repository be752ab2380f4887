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

#ifndef LHE_PIR_PIR_MESSAGES_H_
#define LHE_PIR_PIR_MESSAGES_H_

#include <string>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "lwe/prng.h"
#include "matrix/matrix.h"
#include "pir/parameters.h"
#include "shell_encryption/status_macros.h"

namespace lhe_pir {

template <typename T>
class Client;

// The masked query vector A * s + e + \Delta * x, zero padded to a multiple of
// `squishing` rows.
template <typename T>
struct Query {
  Matrix<T> vector;
};

// The server's answer D * query mod Q, with db_rows rows.
template <typename T>
struct Answer {
  Matrix<T> vector;
};

// The hint D * A mod Q, computed once per database and reused by all queries.
template <typename T>
struct Hint {
  Matrix<T> matrix;
};

// What a server publishes to its clients. The public matrix A is re-derived
// from its seed.
template <typename T>
struct ServerPublicParams {
  std::string public_matrix_seed;
  Hint<T> hint;
};

// Per query client state. It is never sent to the server, and must only be
// used to recover the answer of the query it was generated with.
template <typename T>
class Secret {
 public:
  Secret(Secret&&) = default;
  Secret& operator=(Secret&&) = default;

  Secret Copy() const { return Secret(s_, query_, plaintext_); }

  // The LWE secret vector s.
  const Matrix<T>& LweSecret() const { return s_; }

  // The query vector sent to the server.
  const Matrix<T>& MaskedQuery() const { return query_; }

  // The vector x encoded by the query.
  const Matrix<T>& Plaintext() const { return plaintext_; }

 private:
  friend class Client<T>;

  Secret(Matrix<T> s, Matrix<T> query, Matrix<T> plaintext)
      : s_(std::move(s)),
        query_(std::move(query)),
        plaintext_(std::move(plaintext)) {}

  Matrix<T> s_;
  Matrix<T> query_;
  Matrix<T> plaintext_;
};

// Expands `seed` into the db_cols x lwe_secret_dim public matrix A, with
// entries uniform modulo Q.
template <typename T>
absl::StatusOr<Matrix<T>> ExpandPublicMatrix(const Parameters& params,
                                             absl::string_view seed) {
  RLWE_ASSIGN_OR_RETURN(auto prg,
                        lwe::BufferedPrg::Create(seed, params.prng_type));
  return Matrix<T>::Rand(prg.get(), params.db_cols, params.lwe_secret_dim,
                         params.lwe_modulus_bit_size);
}

}  // namespace lhe_pir

#endif  // LHE_PIR_PIR_MESSAGES_H_
