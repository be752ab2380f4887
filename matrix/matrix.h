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

#ifndef LHE_PIR_MATRIX_MATRIX_H_
#define LHE_PIR_MATRIX_MATRIX_H_

#include <algorithm>
#include <cstdint>
#include <limits>

#include "Eigen/Core"
#include "absl/numeric/int128.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/types/span.h"
#include "lwe/prng.h"
#include "lwe/sample_error.h"
#include "lwe/status.h"
#include "lwe/types.h"
#include "shell_encryption/status_macros.h"

// Dense matrices over Z_{2^32} or Z_{2^64}, stored in row-major order.
//
// Arithmetic relies on the wraparound of the unsigned element type, so every
// operation is implicitly reduced modulo 2^w for the element width w. When a
// protocol works modulo a smaller power of two, the caller reduces explicitly
// with `ReduceMod`.
//
// There are two types:
// - `Matrix<T>` owns its storage.
// - `MatrixView<T>` is a read-only window onto a contiguous range of rows of
//   a `Matrix<T>`. It aliases the matrix it was created from and must not
//   outlive it, nor be used after that matrix is resized.

namespace lhe_pir {

template <typename T>
using RowMajorMatrix =
    Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

template <typename T>
class Matrix;

namespace internal {

inline absl::Status CheckRowRange(uint64_t offset, uint64_t num_rows,
                                  uint64_t rows) {
  if (num_rows > rows || offset > rows - num_rows) {
    return IndexOutOfRangeError(
        absl::StrCat("requested rows [", offset, ", ", offset + num_rows,
                     ") of a matrix with ", rows, " rows."));
  }
  return absl::OkStatus();
}

inline absl::Status CheckIndex(uint64_t i, uint64_t j, uint64_t rows,
                               uint64_t cols) {
  if (i >= rows) {
    return IndexOutOfRangeError(
        absl::StrCat("row ", i, " of a matrix with ", rows, " rows."));
  }
  if (j >= cols) {
    return IndexOutOfRangeError(
        absl::StrCat("col ", j, " of a matrix with ", cols, " cols."));
  }
  return absl::OkStatus();
}

inline absl::Status CheckSameShape(uint64_t rows_a, uint64_t cols_a,
                                   uint64_t rows_b, uint64_t cols_b) {
  if (rows_a != rows_b || cols_a != cols_b) {
    return DimensionMismatchError(absl::StrCat(rows_a, "-by-", cols_a,
                                               " vs. ", rows_b, "-by-",
                                               cols_b, "."));
  }
  return absl::OkStatus();
}

}  // namespace internal

template <typename T>
class MatrixView {
 public:
  using EigenMap = Eigen::Map<const RowMajorMatrix<T>>;

  MatrixView(const T* data, uint64_t rows, uint64_t cols)
      : data_(data), rows_(rows), cols_(cols) {}

  // Views all rows of `matrix`.
  MatrixView(const Matrix<T>& matrix);  // NOLINT(google-explicit-constructor)

  uint64_t Rows() const { return rows_; }
  uint64_t Cols() const { return cols_; }
  uint64_t Size() const { return rows_ * cols_; }

  absl::StatusOr<T> Get(uint64_t i, uint64_t j) const {
    RLWE_RETURN_IF_ERROR(internal::CheckIndex(i, j, rows_, cols_));
    return data_[i * cols_ + j];
  }

  // Returns a view of `num_rows` rows starting at `offset`, aliasing the same
  // storage as this view.
  absl::StatusOr<MatrixView> GetRows(uint64_t offset, uint64_t num_rows) const {
    RLWE_RETURN_IF_ERROR(internal::CheckRowRange(offset, num_rows, rows_));
    return MatrixView(data_ + offset * cols_, num_rows, cols_);
  }

  // Returns an owned copy of the viewed entries.
  Matrix<T> Copy() const;

  bool Equals(const MatrixView& other) const {
    return rows_ == other.rows_ && cols_ == other.cols_ &&
           std::equal(data_, data_ + Size(), other.data_);
  }

  absl::Span<const T> Data() const {
    return absl::MakeConstSpan(data_, Size());
  }

  EigenMap AsEigen() const {
    return EigenMap(data_, static_cast<Eigen::Index>(rows_),
                    static_cast<Eigen::Index>(cols_));
  }

 private:
  const T* data_;
  uint64_t rows_;
  uint64_t cols_;
};

template <typename T>
class Matrix {
  static_assert(lwe::kIsElem<T>, "T must be Elem32 or Elem64.");

 public:
  using Storage = RowMajorMatrix<T>;

  static constexpr int kBitWidth = lwe::kElemBitWidth<T>;

  Matrix() : Matrix(0, 0) {}

  // Returns a zero-filled `rows` x `cols` matrix.
  Matrix(uint64_t rows, uint64_t cols)
      : data_(Storage::Zero(static_cast<Eigen::Index>(rows),
                            static_cast<Eigen::Index>(cols))) {}

  static Matrix Zeros(uint64_t rows, uint64_t cols) {
    return Matrix(rows, cols);
  }

  // Returns a matrix holding `values` in row-major order.
  static absl::StatusOr<Matrix> Create(uint64_t rows, uint64_t cols,
                                       absl::Span<const T> values) {
    if (values.size() != rows * cols) {
      return DimensionMismatchError(
          absl::StrCat(values.size(), " values for a ", rows, "-by-", cols,
                       " matrix."));
    }
    Matrix out(rows, cols);
    std::copy(values.begin(), values.end(), out.data_.data());
    return out;
  }

  // Returns a matrix with entries uniformly random in [0, modulus), or in
  // [0, 2^log_modulus) if `modulus` is 0.
  static absl::StatusOr<Matrix> Rand(lwe::BufferedPrg* prg, uint64_t rows,
                                     uint64_t cols, int log_modulus,
                                     uint64_t modulus = 0) {
    if (prg == nullptr) {
      return absl::InvalidArgumentError("The prng must not be null.");
    }
    absl::uint128 bound = modulus;
    if (modulus == 0) {
      if (log_modulus < 1 || log_modulus > kBitWidth) {
        return absl::InvalidArgumentError(
            absl::StrCat("The log modulus, ", log_modulus,
                         ", must be in [1, ", kBitWidth, "]."));
      }
      bound = absl::uint128{1} << log_modulus;
    } else if (bound - 1 > std::numeric_limits<T>::max()) {
      return absl::InvalidArgumentError(
          absl::StrCat("The modulus, ", modulus, ", does not fit in ",
                       kBitWidth, " bits."));
    }
    Matrix out(rows, cols);
    T* data = out.data_.data();
    for (uint64_t i = 0; i < out.Size(); ++i) {
      RLWE_ASSIGN_OR_RETURN(uint64_t value, prg->UniformBelow(bound));
      data[i] = static_cast<T>(value);
    }
    return out;
  }

  // Returns a matrix with i.i.d. discrete Gaussian entries, using the error
  // distribution for the element width.
  static absl::StatusOr<Matrix> Gaussian(lwe::BufferedPrg* prg, uint64_t rows,
                                         uint64_t cols) {
    if (prg == nullptr) {
      return absl::InvalidArgumentError("The prng must not be null.");
    }
    Matrix out(rows, cols);
    T* data = out.data_.data();
    for (uint64_t i = 0; i < out.Size(); ++i) {
      RLWE_ASSIGN_OR_RETURN(data[i], lwe::SampleError<T>(prg));
    }
    return out;
  }

  uint64_t Rows() const { return static_cast<uint64_t>(data_.rows()); }
  uint64_t Cols() const { return static_cast<uint64_t>(data_.cols()); }
  uint64_t Size() const { return static_cast<uint64_t>(data_.size()); }

  absl::StatusOr<T> Get(uint64_t i, uint64_t j) const {
    RLWE_RETURN_IF_ERROR(internal::CheckIndex(i, j, Rows(), Cols()));
    return data_(i, j);
  }

  // Sets entry (i, j) to `value` mod 2^w.
  absl::Status Set(uint64_t value, uint64_t i, uint64_t j) {
    RLWE_RETURN_IF_ERROR(internal::CheckIndex(i, j, Rows(), Cols()));
    data_(i, j) = static_cast<T>(value);
    return absl::OkStatus();
  }

  absl::Status Add(MatrixView<T> other) {
    RLWE_RETURN_IF_ERROR(internal::CheckSameShape(Rows(), Cols(), other.Rows(),
                                                  other.Cols()));
    data_ += other.AsEigen();
    return absl::OkStatus();
  }

  absl::Status Sub(MatrixView<T> other) {
    RLWE_RETURN_IF_ERROR(internal::CheckSameShape(Rows(), Cols(), other.Rows(),
                                                  other.Cols()));
    data_ -= other.AsEigen();
    return absl::OkStatus();
  }

  void MulConst(T scalar) { data_ *= scalar; }

  // Reduces every entry into [0, modulus). Reduction modulo 2^w is implicit,
  // so this is a no-op for moduli of at least 2^w.
  absl::Status ReduceMod(uint64_t modulus) {
    if (modulus == 0) {
      return absl::InvalidArgumentError("The modulus must be positive.");
    }
    if (modulus - 1 >= std::numeric_limits<T>::max()) {
      return absl::OkStatus();
    }
    T mod = static_cast<T>(modulus);
    data_ = data_.unaryExpr([mod](T x) -> T { return x % mod; });
    return absl::OkStatus();
  }

  // Stacks `other` below this matrix. An empty 0 x 0 matrix takes the shape
  // and the contents of `other`.
  absl::Status Concat(MatrixView<T> other) {
    if (Rows() == 0 && Cols() == 0) {
      data_ = other.AsEigen();
      return absl::OkStatus();
    }
    if (Cols() != other.Cols()) {
      return DimensionMismatchError(
          absl::StrCat(Rows(), "-by-", Cols(), " vs. ", other.Rows(), "-by-",
                       other.Cols(), "."));
    }
    // `other` may alias this matrix, so build the result before replacing.
    Storage stacked(data_.rows() + static_cast<Eigen::Index>(other.Rows()),
                    data_.cols());
    stacked.topRows(data_.rows()) = data_;
    stacked.bottomRows(static_cast<Eigen::Index>(other.Rows())) =
        other.AsEigen();
    data_.swap(stacked);
    return absl::OkStatus();
  }

  // Appends `num_rows` rows of zeros. An empty 0 x 0 matrix becomes a column.
  void AppendZeros(uint64_t num_rows) {
    Eigen::Index extra_rows = static_cast<Eigen::Index>(num_rows);
    if (Rows() == 0 && Cols() == 0) {
      data_ = Storage::Zero(extra_rows, 1);
      return;
    }
    data_.conservativeResize(data_.rows() + extra_rows, Eigen::NoChange);
    data_.bottomRows(extra_rows).setZero();
  }

  absl::Status DropLastRows(uint64_t num_rows) {
    if (num_rows > Rows()) {
      return IndexOutOfRangeError(absl::StrCat(
          "cannot drop ", num_rows, " rows of a matrix with ", Rows(),
          " rows."));
    }
    data_.conservativeResize(
        data_.rows() - static_cast<Eigen::Index>(num_rows), Eigen::NoChange);
    return absl::OkStatus();
  }

  // Returns a read-only view of `num_rows` rows starting at `offset`. The view
  // aliases this matrix.
  absl::StatusOr<MatrixView<T>> GetRows(uint64_t offset,
                                        uint64_t num_rows) const {
    return View().GetRows(offset, num_rows);
  }

  // Returns an independent copy of `num_rows` rows starting at `offset`.
  absl::StatusOr<Matrix> DeepCopyRows(uint64_t offset,
                                      uint64_t num_rows) const {
    RLWE_ASSIGN_OR_RETURN(MatrixView<T> rows, GetRows(offset, num_rows));
    return rows.Copy();
  }

  Matrix Copy() const { return *this; }

  bool Equals(const Matrix& other) const { return View().Equals(other); }
  bool operator==(const Matrix& other) const { return Equals(other); }
  bool operator!=(const Matrix& other) const { return !Equals(other); }

  // Packs `squishing` consecutive entries of each row into one element, using
  // `basis` bits per entry. The result has ceil(cols / squishing) columns.
  absl::StatusOr<Matrix> Squish(int basis, int squishing) const {
    RLWE_RETURN_IF_ERROR(CheckPacking(basis, squishing));
    const T mask = PackingMask(basis);
    uint64_t packed_cols = (Cols() + squishing - 1) / squishing;
    Matrix out(Rows(), packed_cols);
    for (uint64_t i = 0; i < Rows(); ++i) {
      for (uint64_t j = 0; j < Cols(); ++j) {
        T value = data_(i, j);
        if ((value & mask) != value) {
          return absl::InvalidArgumentError(absl::StrCat(
              "Entry (", i, ", ", j, ") does not fit in ", basis, " bits."));
        }
        int shift = static_cast<int>(j % squishing) * basis;
        out.data_(i, j / squishing) |= static_cast<T>(value << shift);
      }
    }
    return out;
  }

  // Inverts `Squish`, returning a matrix with `cols` columns.
  absl::StatusOr<Matrix> Unsquish(int basis, int squishing,
                                  uint64_t cols) const {
    RLWE_RETURN_IF_ERROR(CheckPacking(basis, squishing));
    if ((cols + squishing - 1) / squishing != Cols()) {
      return DimensionMismatchError(
          absl::StrCat(Cols(), " packed cols cannot hold ", cols,
                       " entries at ", squishing, " entries per element."));
    }
    const T mask = PackingMask(basis);
    Matrix out(Rows(), cols);
    for (uint64_t i = 0; i < Rows(); ++i) {
      for (uint64_t j = 0; j < cols; ++j) {
        int shift = static_cast<int>(j % squishing) * basis;
        out.data_(i, j) = (data_(i, j / squishing) >> shift) & mask;
      }
    }
    return out;
  }

  MatrixView<T> View() const { return MatrixView<T>(*this); }

  absl::Span<const T> Data() const {
    return absl::MakeConstSpan(data_.data(), Size());
  }
  absl::Span<T> MutableData() { return absl::MakeSpan(data_.data(), Size()); }

  const Storage& AsEigen() const { return data_; }

  // Returns the mask of the lowest `basis` bits.
  static T PackingMask(int basis) {
    return basis >= kBitWidth ? std::numeric_limits<T>::max()
                              : static_cast<T>((T{1} << basis) - 1);
  }

  // Returns an error unless `squishing` entries of `basis` bits fit in one
  // element.
  static absl::Status CheckPacking(int basis, int squishing) {
    if (basis < 1 || squishing < 1) {
      return absl::InvalidArgumentError(
          "`basis` and `squishing` must be positive.");
    }
    if (static_cast<int64_t>(basis) * squishing > kBitWidth) {
      return UnsupportedParameterError(
          absl::StrCat(squishing, " entries of ", basis,
                       " bits do not fit in a ", kBitWidth, "-bit element."));
    }
    return absl::OkStatus();
  }

 private:
  Storage data_;
};

template <typename T>
MatrixView<T>::MatrixView(const Matrix<T>& matrix)
    : data_(matrix.Data().data()), rows_(matrix.Rows()), cols_(matrix.Cols()) {}

template <typename T>
Matrix<T> MatrixView<T>::Copy() const {
  Matrix<T> out(rows_, cols_);
  std::copy(data_, data_ + Size(), out.MutableData().data());
  return out;
}

}  // namespace lhe_pir

#endif  // LHE_PIR_MATRIX_MATRIX_H_
