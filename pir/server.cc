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

#include "pir/server.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "lwe/prng.h"
#include "lwe/status.h"
#include "lwe/types.h"
#include "matrix/matrix.h"
#include "matrix/multiply.h"
#include "pir/messages.h"
#include "pir/parameters.h"
#include "shell_encryption/status_macros.h"

namespace lhe_pir {

template <typename T>
absl::StatusOr<std::unique_ptr<Server<T>>> Server<T>::Create(
    const Parameters& params, Matrix<T> database) {
  RLWE_RETURN_IF_ERROR(ValidateParameters<T>(params));
  if (database.Rows() != static_cast<uint64_t>(params.db_rows) ||
      database.Cols() != static_cast<uint64_t>(params.db_cols)) {
    return DimensionMismatchError(absl::StrCat(
        "Expected a ", params.db_rows, " x ", params.db_cols,
        " database, given ", database.Rows(), " x ", database.Cols(), "."));
  }
  for (T value : database.Data()) {
    if (value >= params.plaintext_modulus) {
      return absl::InvalidArgumentError(
          absl::StrCat("Database entry ", value,
                       " is not less than the plaintext modulus ",
                       params.plaintext_modulus, "."));
    }
    if (params.db_entry_bit_size < 64 &&
        (static_cast<uint64_t>(value) >> params.db_entry_bit_size) != 0) {
      return absl::InvalidArgumentError(
          absl::StrCat("Database entry ", value, " does not fit in ",
                       params.db_entry_bit_size, " bits."));
    }
  }
  return absl::WrapUnique(new Server(params, std::move(database)));
}

template <typename T>
absl::Status Server<T>::Preprocess() {
  RLWE_ASSIGN_OR_RETURN(std::string seed,
                        lwe::BufferedPrg::GenerateSeed(params_.prng_type));
  RLWE_ASSIGN_OR_RETURN(Matrix<T> public_matrix,
                        ExpandPublicMatrix<T>(params_, seed));

  RLWE_ASSIGN_OR_RETURN(
      Matrix<T> hint,
      Multiply(database_.View(), public_matrix.View(),
               params_.multiply_options));
  if (params_.lwe_modulus_bit_size < lwe::kElemBitWidth<T>) {
    RLWE_RETURN_IF_ERROR(
        hint.ReduceMod(uint64_t{1} << params_.lwe_modulus_bit_size));
  }

  std::unique_ptr<const Matrix<T>> packed_database;
  if (params_.squishing > 1) {
    RLWE_ASSIGN_OR_RETURN(
        Matrix<T> packed,
        database_.Squish(PlaintextBasis(params_), params_.squishing));
    packed_database = std::make_unique<const Matrix<T>>(std::move(packed));
  }

  VLOG(1) << "Preprocessed a " << database_.Rows() << " x "
          << database_.Cols() << " database; hint is " << hint.Rows() << " x "
          << hint.Cols() << ", squishing " << params_.squishing << ".";

  // Only update the state once everything succeeded.
  public_matrix_seed_ = std::move(seed);
  public_matrix_ = std::make_unique<const Matrix<T>>(std::move(public_matrix));
  hint_ = std::make_unique<const Hint<T>>(Hint<T>{std::move(hint)});
  packed_database_ = std::move(packed_database);
  return absl::OkStatus();
}

template <typename T>
absl::StatusOr<Answer<T>> Server<T>::HandleQuery(const Query<T>& query) const {
  if (!IsPreprocessed()) {
    return absl::FailedPreconditionError(
        "The server must be preprocessed before handling queries.");
  }
  const Matrix<T>& q = query.vector;
  int64_t num_rows = PaddedDbCols(params_);
  if (q.Rows() != static_cast<uint64_t>(num_rows) || q.Cols() != 1) {
    return DimensionMismatchError(
        absl::StrCat("Expected a query of ", num_rows, " x 1, given ",
                     q.Rows(), " x ", q.Cols(), "."));
  }

  Matrix<T> answer;
  if (packed_database_ != nullptr) {
    RLWE_ASSIGN_OR_RETURN(
        answer, MultiplyPackedVector(packed_database_->View(), q.View(),
                                     PlaintextBasis(params_),
                                     params_.squishing,
                                     params_.multiply_options.num_threads));
  } else {
    RLWE_ASSIGN_OR_RETURN(answer, Multiply(database_.View(), q.View(),
                                           params_.multiply_options));
  }
  if (params_.lwe_modulus_bit_size < lwe::kElemBitWidth<T>) {
    RLWE_RETURN_IF_ERROR(
        answer.ReduceMod(uint64_t{1} << params_.lwe_modulus_bit_size));
  }
  VLOG(1) << "Answered a query of " << q.Rows() << " entries.";
  return Answer<T>{std::move(answer)};
}

template <typename T>
absl::StatusOr<ServerPublicParams<T>> Server<T>::GetPublicParams() const {
  if (!IsPreprocessed()) {
    return absl::FailedPreconditionError(
        "The server has no public parameters before preprocessing.");
  }
  return ServerPublicParams<T>{public_matrix_seed_, Hint<T>{hint_->matrix}};
}

template class Server<lwe::Elem32>;
template class Server<lwe::Elem64>;

}  // namespace lhe_pir
