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

#ifndef LHE_PIR_PIR_SERVER_H_
#define LHE_PIR_PIR_SERVER_H_

#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "matrix/matrix.h"
#include "pir/messages.h"
#include "pir/parameters.h"

namespace lhe_pir {

// The server part of the PIR protocol, over elements of type T.
template <typename T>
class Server {
 public:
  // Creates a server holding the db_rows x db_cols matrix `database`, whose
  // entries must be in [0, plaintext_modulus) and fit in db_entry_bit_size
  // bits.
  static absl::StatusOr<std::unique_ptr<Server>> Create(
      const Parameters& params, Matrix<T> database);

  // Samples a fresh public matrix A and computes the hint D * A mod Q. The
  // database is also squished if the parameters ask for it. This must be
  // called before accepting queries; calling it again replaces the seed, A
  // and the hint.
  absl::Status Preprocess();

  // Returns D * query mod Q.
  absl::StatusOr<Answer<T>> HandleQuery(const Query<T>& query) const;

  // Returns the server's public parameters that are sent to the client.
  absl::StatusOr<ServerPublicParams<T>> GetPublicParams() const;

  // The following return nullptr or an empty seed before `Preprocess()`.
  const Matrix<T>* PublicMatrix() const { return public_matrix_.get(); }
  absl::string_view PublicMatrixSeed() const { return public_matrix_seed_; }
  const Hint<T>* GetHint() const { return hint_.get(); }

  const Matrix<T>& Database() const { return database_; }

  // Returns if the server has been preprocessed to accept queries.
  bool IsPreprocessed() const { return public_matrix_ != nullptr; }

 private:
  explicit Server(Parameters params, Matrix<T> database)
      : params_(std::move(params)), database_(std::move(database)) {}

  const Parameters params_;

  const Matrix<T> database_;

  // The database packed `squishing` entries per element; only set when
  // squishing > 1.
  std::unique_ptr<const Matrix<T>> packed_database_;

  std::string public_matrix_seed_;
  std::unique_ptr<const Matrix<T>> public_matrix_;
  std::unique_ptr<const Hint<T>> hint_;
};

}  // namespace lhe_pir

#endif  // LHE_PIR_PIR_SERVER_H_
