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

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "lwe/prng.h"
#include "lwe/types.h"
#include "matrix/matrix.h"
#include "matrix/multiply.h"
#include "pir/client.h"
#include "pir/messages.h"
#include "pir/parameters.h"
#include "pir/server.h"
#include "shell_encryption/status_macros.h"
#include "shell_encryption/testing/status_matchers.h"
#include "shell_encryption/testing/status_testing.h"

namespace lhe_pir {
namespace {

using lwe::Elem32;
using lwe::Elem64;

template <typename T>
using ServerAndClient =
    std::pair<std::unique_ptr<Server<T>>, std::unique_ptr<Client<T>>>;

// Creates a preprocessed server holding `database` and a client connected to
// it through the server's public parameters.
template <typename T>
absl::StatusOr<ServerAndClient<T>> CreateServerAndClient(
    const Parameters& params, Matrix<T> database) {
  RLWE_ASSIGN_OR_RETURN(auto server,
                        Server<T>::Create(params, std::move(database)));
  RLWE_RETURN_IF_ERROR(server->Preprocess());
  RLWE_ASSIGN_OR_RETURN(ServerPublicParams<T> public_params,
                        server->GetPublicParams());
  RLWE_ASSIGN_OR_RETURN(
      auto prg, lwe::BufferedPrg::CreateWithRandomSeed(params.prng_type));
  RLWE_ASSIGN_OR_RETURN(
      auto client,
      Client<T>::CreateFromSeed(params, public_params.public_matrix_seed,
                                std::move(public_params.hint), std::move(prg)));
  return std::make_pair(std::move(server), std::move(client));
}

// Returns a database with entries of db_entry_bit_size bits below the
// plaintext modulus.
template <typename T>
absl::StatusOr<Matrix<T>> RandomDatabase(const Parameters& params) {
  RLWE_ASSIGN_OR_RETURN(
      auto prg, lwe::BufferedPrg::CreateWithRandomSeed(params.prng_type));
  uint64_t bound = params.plaintext_modulus;
  if (params.db_entry_bit_size < 64) {
    bound = std::min(bound, uint64_t{1} << params.db_entry_bit_size);
  }
  return Matrix<T>::Rand(prg.get(), params.db_rows, params.db_cols, 0, bound);
}

// Retrieves every column of `database` and checks it against the database.
template <typename T>
void ExpectRetrievesAllColumns(const Parameters& params,
                               const Matrix<T>& database) {
  ASSERT_OK_AND_ASSIGN(auto server_and_client,
                       CreateServerAndClient(params, database.Copy()));
  auto& [server, client] = server_and_client;
  for (int64_t j = 0; j < params.db_cols; ++j) {
    ASSERT_OK_AND_ASSIGN(auto secret_and_query, client->GenerateIndexQuery(j));
    ASSERT_OK_AND_ASSIGN(Answer<T> answer,
                         server->HandleQuery(secret_and_query.second));
    ASSERT_OK_AND_ASSIGN(Matrix<T> column,
                         client->Recover(secret_and_query.first, answer));
    ASSERT_EQ(column.Rows(), params.db_rows);
    for (int64_t i = 0; i < params.db_rows; ++i) {
      ASSERT_OK_AND_ASSIGN(T expected, database.Get(i, j));
      ASSERT_OK_AND_ASSIGN(T actual, column.Get(i, 0));
      EXPECT_EQ(actual, expected) << "entry (" << i << ", " << j << ")";
    }
  }
}

TEST(PirTest, RetrievesEveryBitOfSmallDatabase) {
  const Parameters params{
      .lwe_secret_dim = 64,
      .db_rows = 1,
      .db_cols = 8,
      .db_entry_bit_size = 1,
      .plaintext_modulus = 2,
      .lwe_modulus_bit_size = 32,
  };
  const std::vector<Elem32> bits = {0, 1, 1, 0, 1, 0, 0, 1};
  ASSERT_OK_AND_ASSIGN(auto database, Matrix<Elem32>::Create(1, 8, bits));
  ASSERT_OK_AND_ASSIGN(auto server_and_client,
                       CreateServerAndClient(params, database.Copy()));
  auto& [server, client] = server_and_client;

  // The hint is reused by every query.
  for (int round = 0; round < 16; ++round) {
    for (int64_t j = 0; j < params.db_cols; ++j) {
      ASSERT_OK_AND_ASSIGN(auto secret_and_query,
                           client->GenerateIndexQuery(j));
      ASSERT_OK_AND_ASSIGN(Answer<Elem32> answer,
                           server->HandleQuery(secret_and_query.second));
      ASSERT_OK_AND_ASSIGN(Matrix<Elem32> bit,
                           client->Recover(secret_and_query.first, answer));
      EXPECT_THAT(bit.Data(), ::testing::ElementsAre(bits[j]))
          << "round " << round << ", index " << j;
    }
  }
}

TEST(PirTest, RetrievesColumns) {
  const Parameters params{
      .lwe_secret_dim = 128,
      .db_rows = 24,
      .db_cols = 40,
      .db_entry_bit_size = 8,
      .plaintext_modulus = 256,
      .lwe_modulus_bit_size = 32,
  };
  ASSERT_OK_AND_ASSIGN(auto database, RandomDatabase<Elem32>(params));
  ExpectRetrievesAllColumns(params, database);
}

TEST(PirTest, RetrievesColumnsFromSquishedDatabase) {
  const Parameters params{
      .lwe_secret_dim = 64,
      .db_rows = 10,
      .db_cols = 20,  // padded to 21
      .db_entry_bit_size = 4,
      .plaintext_modulus = 16,
      .lwe_modulus_bit_size = 32,
      .squishing = 3,
  };
  ASSERT_OK_AND_ASSIGN(auto database, RandomDatabase<Elem32>(params));
  ExpectRetrievesAllColumns(params, database);
}

TEST(PirTest, RetrievesColumnsWithSmallModulus) {
  const Parameters params{
      .lwe_secret_dim = 64,
      .db_rows = 12,
      .db_cols = 16,
      .db_entry_bit_size = 4,
      .plaintext_modulus = 16,
      .lwe_modulus_bit_size = 28,
      .squishing = 2,
  };
  ASSERT_OK_AND_ASSIGN(auto database, RandomDatabase<Elem32>(params));
  ExpectRetrievesAllColumns(params, database);
}

TEST(PirTest, RetrievesColumnsWithNonPowerOfTwoModulus) {
  const Parameters params{
      .lwe_secret_dim = 64,
      .db_rows = 8,
      .db_cols = 12,
      .db_entry_bit_size = 3,  // 2^3 <= 10
      .plaintext_modulus = 10,
      .lwe_modulus_bit_size = 32,
      .squishing = 3,
  };
  ASSERT_OK_AND_ASSIGN(auto database, RandomDatabase<Elem32>(params));
  ExpectRetrievesAllColumns(params, database);
}

TEST(PirTest, RetrievesColumnsWith64BitElements) {
  const Parameters params{
      .lwe_secret_dim = 64,
      .db_rows = 8,
      .db_cols = 16,
      .db_entry_bit_size = 16,
      .plaintext_modulus = uint64_t{1} << 16,
      .lwe_modulus_bit_size = 64,
      .squishing = 4,
  };
  ASSERT_OK_AND_ASSIGN(auto database, RandomDatabase<Elem64>(params));
  ExpectRetrievesAllColumns(params, database);
}

TEST(PirTest, RetrievesColumnsWithEveryKernel) {
  for (MultiplyKernel kernel : {MultiplyKernel::kReference,
                                MultiplyKernel::kEigen,
                                MultiplyKernel::kHighway}) {
    for (int num_threads : {1, 4}) {
      SCOPED_TRACE(MultiplyKernelName(kernel));
      const Parameters params{
          .lwe_secret_dim = 64,
          .db_rows = 16,
          .db_cols = 24,
          .db_entry_bit_size = 8,
          .plaintext_modulus = 256,
          .lwe_modulus_bit_size = 32,
          .squishing = 4,
          .prng_type = rlwe::PRNG_TYPE_CHACHA,
          .multiply_options = {.kernel = kernel, .num_threads = num_threads},
      };
      ASSERT_OK_AND_ASSIGN(auto database, RandomDatabase<Elem32>(params));
      ExpectRetrievesAllColumns(params, database);
    }
  }
}

// Evaluates D * x mod P for a vector x of the client's choice.
TEST(PirTest, EvaluatesLinearFunctionOfDatabase) {
  const Parameters params{
      .lwe_secret_dim = 128,
      .db_rows = 32,
      .db_cols = 64,
      .db_entry_bit_size = 8,
      .plaintext_modulus = 256,
      .lwe_modulus_bit_size = 32,
      .squishing = 2,
  };
  ASSERT_OK_AND_ASSIGN(auto database, RandomDatabase<Elem32>(params));
  ASSERT_OK_AND_ASSIGN(auto server_and_client,
                       CreateServerAndClient(params, database.Copy()));
  auto& [server, client] = server_and_client;

  ASSERT_OK_AND_ASSIGN(
      auto prg, lwe::BufferedPrg::CreateWithRandomSeed(params.prng_type));
  for (int round = 0; round < 4; ++round) {
    ASSERT_OK_AND_ASSIGN(
        auto x, Matrix<Elem32>::Rand(prg.get(), params.db_cols, 1, 0,
                                     params.plaintext_modulus));
    ASSERT_OK_AND_ASSIGN(auto expected, Multiply(database.View(), x.View()));
    ASSERT_OK(expected.ReduceMod(params.plaintext_modulus));

    ASSERT_OK_AND_ASSIGN(auto secret_and_query, client->GenerateQuery(x));
    ASSERT_OK_AND_ASSIGN(Answer<Elem32> answer,
                         server->HandleQuery(secret_and_query.second));
    ASSERT_OK_AND_ASSIGN(Matrix<Elem32> result,
                         client->Recover(secret_and_query.first, answer));
    EXPECT_EQ(result, expected) << "round " << round;
  }
}

TEST(PirTest, EvaluatesLinearFunctionWith64BitElements) {
  const Parameters params{
      .lwe_secret_dim = 64,
      .db_rows = 8,
      .db_cols = 32,
      .db_entry_bit_size = 16,
      .plaintext_modulus = uint64_t{1} << 16,
      .lwe_modulus_bit_size = 64,
  };
  ASSERT_OK_AND_ASSIGN(auto database, RandomDatabase<Elem64>(params));
  ASSERT_OK_AND_ASSIGN(auto server_and_client,
                       CreateServerAndClient(params, database.Copy()));
  auto& [server, client] = server_and_client;

  ASSERT_OK_AND_ASSIGN(
      auto prg, lwe::BufferedPrg::CreateWithRandomSeed(params.prng_type));
  ASSERT_OK_AND_ASSIGN(
      auto x, Matrix<Elem64>::Rand(prg.get(), params.db_cols, 1, 0,
                                   params.plaintext_modulus));
  ASSERT_OK_AND_ASSIGN(auto expected, Multiply(database.View(), x.View()));
  ASSERT_OK(expected.ReduceMod(params.plaintext_modulus));

  ASSERT_OK_AND_ASSIGN(auto secret_and_query, client->GenerateQuery(x));
  ASSERT_OK_AND_ASSIGN(Answer<Elem64> answer,
                       server->HandleQuery(secret_and_query.second));
  ASSERT_OK_AND_ASSIGN(Matrix<Elem64> result,
                       client->Recover(secret_and_query.first, answer));
  EXPECT_EQ(result, expected);
}

// Answers do not depend on the public matrix, so a client keeps decoding
// with its hint after the server draws a new one.
TEST(PirTest, ClientOutlivesServerRefresh) {
  const Parameters params{
      .lwe_secret_dim = 64,
      .db_rows = 16,
      .db_cols = 16,
      .db_entry_bit_size = 8,
      .plaintext_modulus = 256,
      .lwe_modulus_bit_size = 32,
  };
  ASSERT_OK_AND_ASSIGN(auto database, RandomDatabase<Elem32>(params));
  ASSERT_OK_AND_ASSIGN(auto server_and_client,
                       CreateServerAndClient(params, database.Copy()));
  auto& [server, client] = server_and_client;
  ASSERT_OK(server->Preprocess());
  EXPECT_NE(client->PublicMatrix(), *server->PublicMatrix());

  ASSERT_OK_AND_ASSIGN(auto secret_and_query, client->GenerateIndexQuery(3));
  ASSERT_OK_AND_ASSIGN(Answer<Elem32> answer,
                       server->HandleQuery(secret_and_query.second));
  ASSERT_OK_AND_ASSIGN(Matrix<Elem32> column,
                       client->Recover(secret_and_query.first, answer));
  for (int64_t i = 0; i < params.db_rows; ++i) {
    ASSERT_OK_AND_ASSIGN(Elem32 expected, database.Get(i, 3));
    ASSERT_OK_AND_ASSIGN(Elem32 actual, column.Get(i, 0));
    EXPECT_EQ(actual, expected);
  }
}

}  // namespace
}  // namespace lhe_pir
