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

#ifndef LHE_PIR_PIR_CLIENT_H_
#define LHE_PIR_PIR_CLIENT_H_

#include <cstdint>
#include <memory>
#include <utility>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "lwe/prng.h"
#include "matrix/matrix.h"
#include "pir/messages.h"
#include "pir/parameters.h"

namespace lhe_pir {

// The client part of the PIR protocol, over elements of type T.
//
// A client holds the public matrix A and the hint of one preprocessed server,
// and can issue any number of queries against it. Each query comes with its
// own Secret, which the caller keeps until the answer arrives.
template <typename T>
class Client {
 public:
  // Creates a client from the public matrix `public_matrix`
  // (db_cols x lwe_secret_dim) and `hint` (db_rows x lwe_secret_dim). All
  // randomness of the queries is drawn from `prg`.
  static absl::StatusOr<std::unique_ptr<Client>> Create(
      const Parameters& params, Matrix<T> public_matrix, Hint<T> hint,
      std::unique_ptr<lwe::BufferedPrg> prg);

  // As above, but expands the public matrix from the server's seed.
  static absl::StatusOr<std::unique_ptr<Client>> CreateFromSeed(
      const Parameters& params, absl::string_view public_matrix_seed,
      Hint<T> hint, std::unique_ptr<lwe::BufferedPrg> prg);

  // Returns a query encoding the db_cols x 1 vector `plaintext`, whose answer
  // recovers D * plaintext mod P. Requires a power of two plaintext modulus
  // that can hold a database entry.
  absl::StatusOr<std::pair<Secret<T>, Query<T>>> GenerateQuery(
      const Matrix<T>& plaintext);

  // Returns a query for column `index` of the database.
  absl::StatusOr<std::pair<Secret<T>, Query<T>>> GenerateIndexQuery(
      int64_t index);

  // Returns the db_rows x 1 vector in Z_P decoded from `answer`.
  absl::StatusOr<Matrix<T>> Recover(const Secret<T>& secret,
                                    const Answer<T>& answer) const;

  const Matrix<T>& PublicMatrix() const { return public_matrix_; }
  const Hint<T>& GetHint() const { return hint_; }

 private:
  explicit Client(Parameters params, Matrix<T> public_matrix, Hint<T> hint,
                  std::unique_ptr<lwe::BufferedPrg> prg)
      : params_(std::move(params)),
        public_matrix_(std::move(public_matrix)),
        hint_(std::move(hint)),
        prg_(std::move(prg)) {}

  // Encrypts `plaintext`, a db_cols x 1 vector.
  absl::StatusOr<std::pair<Secret<T>, Query<T>>> EncryptQuery(
      Matrix<T> plaintext);

  const Parameters params_;
  const Matrix<T> public_matrix_;
  const Hint<T> hint_;
  std::unique_ptr<lwe::BufferedPrg> prg_;
};

}  // namespace lhe_pir

#endif  // LHE_PIR_PIR_CLIENT_H_
