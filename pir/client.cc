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

#include "pir/client.h"

#include <cstdint>
#include <memory>
#include <utility>

#include "absl/log/log.h"
#include "absl/memory/memory.h"
#include "absl/numeric/int128.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "lwe/prng.h"
#include "lwe/status.h"
#include "lwe/types.h"
#include "matrix/matrix.h"
#include "matrix/multiply.h"
#include "pir/messages.h"
#include "pir/parameters.h"
#include "shell_encryption/status_macros.h"

namespace lhe_pir {
namespace {

absl::Status CheckShape(const char* name, uint64_t rows, uint64_t cols,
                        uint64_t expected_rows, uint64_t expected_cols) {
  if (rows != expected_rows || cols != expected_cols) {
    return DimensionMismatchError(absl::StrCat(
        "Expected `", name, "` of ", expected_rows, " x ", expected_cols,
        ", given ", rows, " x ", cols, "."));
  }
  return absl::OkStatus();
}

// Decoding recovers values mod P, so an entry of L bits needs 2^L <= P.
absl::Status CheckEntriesFitPlaintext(const Parameters& params) {
  if (params.db_entry_bit_size < 64 &&
      (absl::uint128{1} << params.db_entry_bit_size) >
          params.plaintext_modulus) {
    return UnsupportedParameterError(absl::StrCat(
        "Entries of ", params.db_entry_bit_size,
        " bits do not fit in the plaintext modulus ",
        params.plaintext_modulus, "."));
  }
  return absl::OkStatus();
}

absl::Status CheckErrorDim(const Parameters& params) {
  if (params.error_dim != 1) {
    return UnsupportedParameterError(
        absl::StrCat("`error_dim` = ", params.error_dim,
                     "; only a single error vector is supported."));
  }
  return absl::OkStatus();
}

}  // namespace

template <typename T>
absl::StatusOr<std::unique_ptr<Client<T>>> Client<T>::Create(
    const Parameters& params, Matrix<T> public_matrix, Hint<T> hint,
    std::unique_ptr<lwe::BufferedPrg> prg) {
  RLWE_RETURN_IF_ERROR(ValidateParameters<T>(params));
  if (prg == nullptr) {
    return absl::InvalidArgumentError("`prg` must not be null.");
  }
  RLWE_RETURN_IF_ERROR(CheckShape("public_matrix", public_matrix.Rows(),
                                  public_matrix.Cols(), params.db_cols,
                                  params.lwe_secret_dim));
  RLWE_RETURN_IF_ERROR(CheckShape("hint", hint.matrix.Rows(),
                                  hint.matrix.Cols(), params.db_rows,
                                  params.lwe_secret_dim));
  return absl::WrapUnique(new Client(params, std::move(public_matrix),
                                     std::move(hint), std::move(prg)));
}

template <typename T>
absl::StatusOr<std::unique_ptr<Client<T>>> Client<T>::CreateFromSeed(
    const Parameters& params, absl::string_view public_matrix_seed,
    Hint<T> hint, std::unique_ptr<lwe::BufferedPrg> prg) {
  RLWE_RETURN_IF_ERROR(ValidateParameters<T>(params));
  RLWE_ASSIGN_OR_RETURN(Matrix<T> public_matrix,
                        ExpandPublicMatrix<T>(params, public_matrix_seed));
  return Create(params, std::move(public_matrix), std::move(hint),
                std::move(prg));
}

template <typename T>
absl::StatusOr<std::pair<Secret<T>, Query<T>>> Client<T>::GenerateQuery(
    const Matrix<T>& plaintext) {
  RLWE_RETURN_IF_ERROR(CheckErrorDim(params_));
  if (!IsPowerOfTwo(params_.plaintext_modulus)) {
    return UnsupportedParameterError(
        "Homomorphic queries need a power of two plaintext modulus.");
  }
  RLWE_RETURN_IF_ERROR(CheckEntriesFitPlaintext(params_));
  RLWE_RETURN_IF_ERROR(CheckShape("plaintext", plaintext.Rows(),
                                  plaintext.Cols(), params_.db_cols, 1));
  return EncryptQuery(plaintext.Copy());
}

template <typename T>
absl::StatusOr<std::pair<Secret<T>, Query<T>>> Client<T>::GenerateIndexQuery(
    int64_t index) {
  RLWE_RETURN_IF_ERROR(CheckErrorDim(params_));
  RLWE_RETURN_IF_ERROR(CheckEntriesFitPlaintext(params_));
  if (index < 0 || index >= params_.db_cols) {
    return IndexOutOfRangeError(absl::StrCat(
        "`index` = ", index, " is not in [0, ", params_.db_cols, ")."));
  }
  Matrix<T> selection(params_.db_cols, 1);
  RLWE_RETURN_IF_ERROR(selection.Set(1, index, 0));
  return EncryptQuery(std::move(selection));
}

template <typename T>
absl::StatusOr<std::pair<Secret<T>, Query<T>>> Client<T>::EncryptQuery(
    Matrix<T> plaintext) {
  // q = A * s + e + \Delta * x mod Q.
  RLWE_ASSIGN_OR_RETURN(
      Matrix<T> s, Matrix<T>::Rand(prg_.get(), params_.lwe_secret_dim, 1,
                                   params_.lwe_modulus_bit_size));
  RLWE_ASSIGN_OR_RETURN(Matrix<T> error,
                        Matrix<T>::Gaussian(prg_.get(), params_.db_cols, 1));
  RLWE_ASSIGN_OR_RETURN(
      Matrix<T> query,
      Multiply(public_matrix_.View(), s.View(), params_.multiply_options));
  RLWE_RETURN_IF_ERROR(query.Add(error));

  Matrix<T> scaled = plaintext.Copy();
  scaled.MulConst(static_cast<T>(ScalingFactor(params_)));
  RLWE_RETURN_IF_ERROR(query.Add(scaled));
  if (params_.lwe_modulus_bit_size < lwe::kElemBitWidth<T>) {
    RLWE_RETURN_IF_ERROR(
        query.ReduceMod(uint64_t{1} << params_.lwe_modulus_bit_size));
  }
  query.AppendZeros(PaddedDbCols(params_) - params_.db_cols);

  VLOG(1) << "Generated a query of " << query.Rows() << " entries.";
  Secret<T> secret(std::move(s), query.Copy(), std::move(plaintext));
  return std::make_pair(std::move(secret), Query<T>{std::move(query)});
}

template <typename T>
absl::StatusOr<Matrix<T>> Client<T>::Recover(const Secret<T>& secret,
                                             const Answer<T>& answer) const {
  RLWE_RETURN_IF_ERROR(CheckErrorDim(params_));
  const Matrix<T>& s = secret.LweSecret();
  RLWE_RETURN_IF_ERROR(
      CheckShape("secret", s.Rows(), s.Cols(), params_.lwe_secret_dim, 1));
  RLWE_RETURN_IF_ERROR(CheckShape("answer", answer.vector.Rows(),
                                  answer.vector.Cols(), params_.db_rows, 1));

  // answer - hint * s = \Delta * (D * x) + D * e mod Q.
  RLWE_ASSIGN_OR_RETURN(
      Matrix<T> hint_s,
      Multiply(hint_.matrix.View(), s.View(), params_.multiply_options));
  Matrix<T> noisy = answer.vector.Copy();
  RLWE_RETURN_IF_ERROR(noisy.Sub(hint_s));

  Matrix<T> result(noisy.Rows(), 1);
  for (uint64_t i = 0; i < noisy.Rows(); ++i) {
    RLWE_ASSIGN_OR_RETURN(T value, noisy.Get(i, 0));
    RLWE_RETURN_IF_ERROR(result.Set(RoundToPlaintext(params_, value), i, 0));
  }
  VLOG(1) << "Recovered " << result.Rows() << " entries.";
  return result;
}

template class Client<lwe::Elem32>;
template class Client<lwe::Elem64>;

}  // namespace lhe_pir
