/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/poseidon.hpp"

#include <gtest/gtest.h>

#include <vector>

using attestor::Felt;
using attestor::crypto::poseidonHash;
using attestor::crypto::poseidonHashMany;
using attestor::crypto::poseidonHashSingle;

Felt hex(std::string_view str) {
  return Felt::fromHex(str).value();
}

TEST(PoseidonTest, HashPair) {
  EXPECT_EQ(poseidonHash(1, 2),
            hex("0x5d44a3decb2b2e0cc71071f7b802f45dd792d064f0fc7316c46514f70f98"
                "91a"));
}

TEST(PoseidonTest, HashSingle) {
  EXPECT_EQ(poseidonHashSingle(1),
            hex("0x6d226d4c804cd74567f5ac59c6a4af1fe2a6eced19fb7560a9124579877d"
                "a25"));
}

TEST(PoseidonTest, HashMany) {
  EXPECT_EQ(poseidonHashMany({}),
            hex("0x2272be0f580fd156823304800919530eaa97430e972d7213ee13f4fbf7a5"
                "dbc"));

  std::vector<Felt> one{1};
  EXPECT_EQ(poseidonHashMany(one),
            hex("0x579e8877c7755365d5ec1ec7d3a94a457eff5d1f40482bbe9729c064cdea"
                "d2"));

  std::vector<Felt> two{1, 2};
  EXPECT_EQ(poseidonHashMany(two),
            hex("0x371cb6995ea5e7effcd2e174de264b5b407027a75a231a70c2c8d196107f"
                "0e7"));

  std::vector<Felt> three{1, 2, 3};
  EXPECT_EQ(poseidonHashMany(three),
            hex("0x2f0d8840bcf3bc629598d8a6cc80cb7c0d9e52d93dab244bbf9cd0dca0ad"
                "082"));
}
