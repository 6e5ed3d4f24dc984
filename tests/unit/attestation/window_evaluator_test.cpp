/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/impl/window_evaluator_impl.hpp"

#include <gtest/gtest.h>

#include "qtils/test/outcome.hpp"

using attestor::AttestationInfo;
using attestor::Epoch;
using attestor::Felt;
using attestor::attestation::AttestationWindow;
using attestor::attestation::WindowError;
using attestor::attestation::WindowEvaluatorImpl;

AttestationInfo makeInfo(Felt stake,
                         Epoch epoch,
                         Felt staker,
                         uint64_t attestation_window) {
  return AttestationInfo{
      .staker_address = staker,
      .operational_address = Felt{0xa11ce},
      .stake = stake,
      .epoch = epoch,
      .attestation_window = attestation_window,
  };
}

/**
 * @given staking parameters with a known poseidon hash
 * @when the window is evaluated
 * @then the assigned block is the hash modulo the assignable range
 */
TEST(WindowEvaluatorTest, AssignedBlockFromPoseidonHash) {
  WindowEvaluatorImpl evaluator;

  ASSERT_OUTCOME_SUCCESS(
      window,
      evaluator.evaluate(makeInfo(
          Felt{1000000},
          Epoch{.id = 7, .length = 40, .starting_block = 1000},
          Felt{0x57a4e},
          16)));
  EXPECT_EQ(window, (AttestationWindow{.assigned_block = 1022,
                                       .window_end = 1038}));
}

TEST(WindowEvaluatorTest, SepoliaLikeParameters) {
  WindowEvaluatorImpl evaluator;

  ASSERT_OUTCOME_SUCCESS(stake, Felt::fromHex("0x10f0cf064dd59200000"));
  ASSERT_OUTCOME_SUCCESS(
      staker,
      Felt::fromHex("0x2e216b191ac966ba1d35cb6cfddfaf9c12aec4dfe869d9fa623361"
                    "1bb334ee9"));
  ASSERT_OUTCOME_SUCCESS(
      window,
      evaluator.evaluate(makeInfo(
          stake,
          Epoch{.id = 300, .length = 231, .starting_block = 5000},
          staker,
          60)));
  EXPECT_EQ(window.assigned_block, 5072);
  EXPECT_EQ(window.window_end, 5132);
}

/**
 * @given the same parameters
 * @when evaluated twice
 * @then the result is identical, while another epoch may differ
 */
TEST(WindowEvaluatorTest, Deterministic) {
  WindowEvaluatorImpl evaluator;
  auto info = makeInfo(Felt{42},
                       Epoch{.id = 1, .length = 100, .starting_block = 0},
                       Felt{0xabc},
                       10);

  ASSERT_OUTCOME_SUCCESS(first, evaluator.evaluate(info));
  ASSERT_OUTCOME_SUCCESS(second, evaluator.evaluate(info));
  EXPECT_EQ(first, second);
  EXPECT_GE(first.assigned_block, 0);
  EXPECT_LT(first.assigned_block, 90);
  EXPECT_EQ(first.window_end, first.assigned_block + 10);
}

TEST(WindowEvaluatorTest, WindowNotShorterThanEpochIsRejected) {
  WindowEvaluatorImpl evaluator;
  auto info = makeInfo(Felt{42},
                       Epoch{.id = 1, .length = 10, .starting_block = 0},
                       Felt{0xabc},
                       10);

  auto res = evaluator.evaluate(info);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), WindowError::EMPTY_ASSIGNMENT_RANGE);
}
