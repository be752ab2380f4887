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

#include "matrix/multiply.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "lwe/prng.h"
#include "lwe/types.h"
#include "matrix/matrix.h"
#include "matrix/multiply_hwy.h"
#include "shell_encryption/testing/status_matchers.h"
#include "shell_encryption/testing/status_testing.h"

namespace lhe_pir {
namespace {

using rlwe::testing::StatusIs;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

constexpr MultiplyKernel kKernels[] = {MultiplyKernel::kReference,
                                       MultiplyKernel::kEigen,
                                       MultiplyKernel::kHighway};
constexpr int kNumThreads[] = {1, 2, 3, 8};

// (rows, inner, cols) of the products under test. The shapes cover a column
// vector, widths below and above the SIMD lane count, and more threads than
// rows.
struct Shape {
  uint64_t rows;
  uint64_t inner;
  uint64_t cols;
};
constexpr Shape kShapes[] = {
    {1, 1, 1}, {2, 3, 1}, {17, 33, 1}, {7, 37, 70}, {64, 16, 5}, {3, 0, 4},
};

template <typename T>
class MultiplyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    std::string seed(lwe::BufferedPrg::kMinSeedBytes, 'x');
    prg_ = lwe::BufferedPrg::Create(seed, rlwe::PRNG_TYPE_HKDF).value();
  }

  Matrix<T> Random(uint64_t rows, uint64_t cols) {
    return Matrix<T>::Rand(prg_.get(), rows, cols, Matrix<T>::kBitWidth)
        .value();
  }

  std::unique_ptr<lwe::BufferedPrg> prg_;
};

using ElemTypes = ::testing::Types<lwe::Elem32, lwe::Elem64>;
TYPED_TEST_SUITE(MultiplyTest, ElemTypes);

TYPED_TEST(MultiplyTest, SmallProduct) {
  std::vector<TypeParam> a_values = {1, 2, 3, 4, 5, 6};
  std::vector<TypeParam> b_values = {7, 8, 9, 10, 11, 12};
  ASSERT_OK_AND_ASSIGN(auto a, Matrix<TypeParam>::Create(2, 3, a_values));
  ASSERT_OK_AND_ASSIGN(auto b, Matrix<TypeParam>::Create(3, 2, b_values));
  for (MultiplyKernel kernel : kKernels) {
    ASSERT_OK_AND_ASSIGN(auto c,
                         Multiply(a.View(), b.View(), {.kernel = kernel}));
    EXPECT_THAT(c.Data(), ElementsAre(58, 64, 139, 154))
        << MultiplyKernelName(kernel);
  }
}

TYPED_TEST(MultiplyTest, ProductWrapsAround) {
  Matrix<TypeParam> a(1, 2);
  Matrix<TypeParam> b(2, 1);
  TypeParam half = TypeParam{1} << (Matrix<TypeParam>::kBitWidth - 1);
  ASSERT_OK(a.Set(half, 0, 0));
  ASSERT_OK(a.Set(3, 0, 1));
  ASSERT_OK(b.Set(2, 0, 0));
  ASSERT_OK(b.Set(5, 1, 0));
  for (MultiplyKernel kernel : kKernels) {
    ASSERT_OK_AND_ASSIGN(auto c,
                         Multiply(a.View(), b.View(), {.kernel = kernel}));
    EXPECT_THAT(c.Data(), ElementsAre(15)) << MultiplyKernelName(kernel);
  }
}

TYPED_TEST(MultiplyTest, AllKernelsMatchReference) {
  for (const Shape& shape : kShapes) {
    Matrix<TypeParam> a = this->Random(shape.rows, shape.inner);
    Matrix<TypeParam> b = this->Random(shape.inner, shape.cols);
    ASSERT_OK_AND_ASSIGN(
        auto expected,
        Multiply(a.View(), b.View(), {.kernel = MultiplyKernel::kReference}));
    EXPECT_EQ(expected.Rows(), shape.rows);
    EXPECT_EQ(expected.Cols(), shape.cols);
    for (MultiplyKernel kernel : kKernels) {
      for (int num_threads : kNumThreads) {
        ASSERT_OK_AND_ASSIGN(
            auto c, Multiply(a.View(), b.View(),
                             {.kernel = kernel, .num_threads = num_threads}));
        EXPECT_EQ(c, expected)
            << MultiplyKernelName(kernel) << " with " << num_threads
            << " threads, shape " << shape.rows << " x " << shape.inner
            << " x " << shape.cols;
      }
    }
  }
}

TYPED_TEST(MultiplyTest, MultiplyViews) {
  Matrix<TypeParam> a = this->Random(6, 4);
  Matrix<TypeParam> b = this->Random(4, 3);
  ASSERT_OK_AND_ASSIGN(MatrixView<TypeParam> rows, a.GetRows(2, 3));
  ASSERT_OK_AND_ASSIGN(auto c, Multiply(rows, b.View()));
  ASSERT_OK_AND_ASSIGN(auto full, Multiply(a.View(), b.View()));
  ASSERT_OK_AND_ASSIGN(auto expected, full.DeepCopyRows(2, 3));
  EXPECT_EQ(c, expected);
}

TYPED_TEST(MultiplyTest, FailsOnDimensionMismatch) {
  Matrix<TypeParam> a(2, 3);
  Matrix<TypeParam> b(2, 3);
  EXPECT_THAT(Multiply(a.View(), b.View()),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Dimension mismatch")));
}

TYPED_TEST(MultiplyTest, FailsOnInvalidOptions) {
  Matrix<TypeParam> a(2, 2);
  EXPECT_THAT(Multiply(a.View(), a.View(), {.num_threads = 0}),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("num_threads")));
  EXPECT_THAT(
      Multiply(a.View(), a.View(),
               {.kernel = static_cast<MultiplyKernel>(42)}),
      StatusIs(absl::StatusCode::kInvalidArgument, HasSubstr("kernel")));
}

TYPED_TEST(MultiplyTest, PackedVectorMatchesPlainProduct) {
  constexpr int kBasis = 5;
  constexpr int kSquishing = 3;
  constexpr uint64_t kRows = 9;
  constexpr uint64_t kCols = 13;  // not a multiple of kSquishing
  constexpr uint64_t kPaddedCols = 15;

  ASSERT_OK_AND_ASSIGN(auto d, Matrix<TypeParam>::Rand(this->prg_.get(), kRows,
                                                       kCols, kBasis));
  ASSERT_OK_AND_ASSIGN(auto packed, d.Squish(kBasis, kSquishing));
  Matrix<TypeParam> v = this->Random(kCols, 1);
  ASSERT_OK_AND_ASSIGN(auto expected, Multiply(d.View(), v.View()));

  Matrix<TypeParam> padded = v.Copy();
  padded.AppendZeros(kPaddedCols - kCols);
  for (int num_threads : kNumThreads) {
    ASSERT_OK_AND_ASSIGN(
        auto c, MultiplyPackedVector(packed.View(), padded.View(), kBasis,
                                     kSquishing, num_threads));
    EXPECT_EQ(c, expected) << num_threads << " threads";
  }
}

TYPED_TEST(MultiplyTest, PackedVectorFullWidthBasis) {
  Matrix<TypeParam> d = this->Random(4, 6);
  Matrix<TypeParam> v = this->Random(6, 1);
  ASSERT_OK_AND_ASSIGN(
      auto c, MultiplyPackedVector(d.View(), v.View(),
                                   Matrix<TypeParam>::kBitWidth, 1));
  ASSERT_OK_AND_ASSIGN(auto expected, Multiply(d.View(), v.View()));
  EXPECT_EQ(c, expected);
}

TYPED_TEST(MultiplyTest, PackedVectorFailures) {
  Matrix<TypeParam> packed(2, 3);
  Matrix<TypeParam> v(8, 1);
  EXPECT_THAT(MultiplyPackedVector(packed.View(), v.View(), 4, 3),
              StatusIs(absl::StatusCode::kInvalidArgument,
                       HasSubstr("Dimension mismatch")));
  Matrix<TypeParam> w(9, 1);
  EXPECT_THAT(MultiplyPackedVector(packed.View(), w.View(),
                                   Matrix<TypeParam>::kBitWidth, 3),
              StatusIs(absl::StatusCode::kUnimplemented));
  EXPECT_THAT(MultiplyPackedVector(packed.View(), w.View(), 4, 3, 0),
              StatusIs(absl::StatusCode::kInvalidArgument));
}

TEST(MultiplyHwyTest, MatchesNoHwy) {
  std::string seed(lwe::BufferedPrg::kMinSeedBytes, 'h');
  ASSERT_OK_AND_ASSIGN(auto prg,
                       lwe::BufferedPrg::Create(seed, rlwe::PRNG_TYPE_HKDF));
  for (const Shape& shape : kShapes) {
    ASSERT_OK_AND_ASSIGN(auto a, Matrix<lwe::Elem32>::Rand(
                                     prg.get(), shape.rows, shape.inner, 32));
    ASSERT_OK_AND_ASSIGN(auto b, Matrix<lwe::Elem32>::Rand(
                                     prg.get(), shape.inner, shape.cols, 32));
    std::vector<uint32_t> expected(shape.rows * shape.cols, 1);
    std::vector<uint32_t> actual(shape.rows * shape.cols, 2);
    internal::MultiplyNoHwy(a.Data().data(), b.Data().data(), expected.data(),
                            shape.rows, shape.inner, shape.cols);
    internal::MultiplyHwy(a.Data().data(), b.Data().data(), actual.data(),
                          shape.rows, shape.inner, shape.cols);
    EXPECT_EQ(actual, expected);
  }
}

}  // namespace
}  // namespace lhe_pir
