/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/confirmation_tracker.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock/app/configuration_mock.hpp"
#include "mock/chain/chain_client_mock.hpp"
#include "qtils/test/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using attestor::Epoch;
using attestor::Felt;
using attestor::app::Configuration;
using attestor::app::ConfigurationMock;
using attestor::attestation::AttemptStatus;
using attestor::attestation::AttestationObligation;
using attestor::attestation::ConfirmationStatus;
using attestor::attestation::ConfirmationTracker;
using attestor::attestation::SubmissionAttempt;
using attestor::chain::AttestationEvent;
using attestor::chain::ChainClientMock;
using attestor::chain::ChainQueryError;
using attestor::chain::ExecutionStatus;
using attestor::chain::FinalityStatus;
using attestor::chain::TransactionStatus;
using testing::_;
using testing::Return;
using testing::ReturnRef;

class ConfirmationTrackerTest : public testing::Test {
 protected:
  void SetUp() override {
    attestation_config_.confirmation_poll_interval = 3;
    ON_CALL(*config_, attestation())
        .WillByDefault(ReturnRef(attestation_config_));

    obligation_.epoch_id = 12;
    obligation_.assigned_block = 510;
    obligation_.window_end = 526;
    obligation_.info.staker_address = Felt{0x57a4e};
    obligation_.info.epoch = Epoch{.id = 12, .length = 40, .starting_block = 480};
  }

  static SubmissionAttempt attempt(uint64_t hash, uint64_t nonce) {
    return SubmissionAttempt{
        .epoch_id = 12,
        .nonce = Felt{nonce},
        .transaction_hash = Felt{hash},
        .submitted_at = 511,
        .status = AttemptStatus::Pending,
    };
  }

  static TransactionStatus status(FinalityStatus finality,
                                  std::optional<ExecutionStatus> execution) {
    return TransactionStatus{
        .finality_status = finality,
        .execution_status = execution,
        .failure_reason = std::nullopt,
    };
  }

  Configuration::AttestationConfig attestation_config_;
  AttestationObligation obligation_;
  std::shared_ptr<testing::NiceMock<ConfigurationMock>> config_ =
      std::make_shared<testing::NiceMock<ConfigurationMock>>();
  std::shared_ptr<ChainClientMock> chain_client_ =
      std::make_shared<ChainClientMock>();
  ConfirmationTracker tracker_{
      testutil::prepareLoggers(), config_, chain_client_};
};

TEST_F(ConfirmationTrackerTest, NothingSubmittedNothingObserved) {
  std::vector<SubmissionAttempt> attempts;
  EXPECT_CALL(*chain_client_, attestationEvents(Felt{0x57a4e}, 480))
      .WillOnce(Return(std::vector<AttestationEvent>{}));

  ASSERT_OUTCOME_SUCCESS(result, tracker_.check(obligation_, attempts));
  EXPECT_EQ(result, ConfirmationStatus::NotYet);
}

/**
 * @given two attempts of which the latest is accepted
 * @when checked
 * @then the epoch is confirmed by self without looking at events
 */
TEST_F(ConfirmationTrackerTest, OwnTransactionAccepted) {
  std::vector<SubmissionAttempt> attempts{attempt(0x1, 3), attempt(0x2, 4)};
  EXPECT_CALL(*chain_client_, transactionStatus(Felt{0x2}))
      .WillOnce(Return(status(FinalityStatus::ACCEPTED_ON_L2,
                              ExecutionStatus::SUCCEEDED)));
  EXPECT_CALL(*chain_client_, attestationEvents(_, _)).Times(0);

  ASSERT_OUTCOME_SUCCESS(result, tracker_.check(obligation_, attempts));
  EXPECT_EQ(result, ConfirmationStatus::ConfirmedBySelf);
  EXPECT_EQ(attempts[1].status, AttemptStatus::Included);
  EXPECT_EQ(attempts[0].status, AttemptStatus::Pending);
}

/**
 * @given an attestation event from a transaction not sent by this agent
 * @when checked
 * @then the epoch is confirmed by other
 */
TEST_F(ConfirmationTrackerTest, AttestedByOtherTransaction) {
  std::vector<SubmissionAttempt> attempts{attempt(0x1, 3)};
  EXPECT_CALL(*chain_client_, transactionStatus(Felt{0x1}))
      .WillOnce(Return(ChainQueryError::TRANSACTION_NOT_FOUND));
  EXPECT_CALL(*chain_client_, attestationEvents(_, _))
      .WillOnce(Return(std::vector<AttestationEvent>{
          {.staker_address = Felt{0x57a4e},
           .epoch_id = 11,
           .transaction_hash = Felt{0x1},
           .block_number = 470},
          {.staker_address = Felt{0x57a4e},
           .epoch_id = 12,
           .transaction_hash = Felt{0x99},
           .block_number = 515},
      }));

  ASSERT_OUTCOME_SUCCESS(result, tracker_.check(obligation_, attempts));
  EXPECT_EQ(result, ConfirmationStatus::ConfirmedByOther);
  EXPECT_EQ(attempts[0].status, AttemptStatus::Pending);
}

TEST_F(ConfirmationTrackerTest, EventOfOwnTransaction) {
  std::vector<SubmissionAttempt> attempts{attempt(0x1, 3)};
  EXPECT_CALL(*chain_client_, transactionStatus(_))
      .WillOnce(Return(status(FinalityStatus::RECEIVED, std::nullopt)));
  EXPECT_CALL(*chain_client_, attestationEvents(_, _))
      .WillOnce(Return(std::vector<AttestationEvent>{
          {.staker_address = Felt{0x57a4e},
           .epoch_id = 12,
           .transaction_hash = Felt{0x1},
           .block_number = 515},
      }));

  ASSERT_OUTCOME_SUCCESS(result, tracker_.check(obligation_, attempts));
  EXPECT_EQ(result, ConfirmationStatus::ConfirmedBySelf);
  EXPECT_EQ(attempts[0].status, AttemptStatus::Included);
}

/**
 * @given every attempt rejected or reverted
 * @when checked
 * @then the obligation needs a new submission
 */
TEST_F(ConfirmationTrackerTest, AllAttemptsFailed) {
  std::vector<SubmissionAttempt> attempts{attempt(0x1, 3), attempt(0x2, 3)};
  EXPECT_CALL(*chain_client_, transactionStatus(Felt{0x2}))
      .WillOnce(Return(status(FinalityStatus::REJECTED, std::nullopt)));
  EXPECT_CALL(*chain_client_, transactionStatus(Felt{0x1}))
      .WillOnce(Return(status(FinalityStatus::ACCEPTED_ON_L2,
                              ExecutionStatus::REVERTED)));
  EXPECT_CALL(*chain_client_, attestationEvents(_, _))
      .WillOnce(Return(std::vector<AttestationEvent>{}));

  ASSERT_OUTCOME_SUCCESS(result, tracker_.check(obligation_, attempts));
  EXPECT_EQ(result, ConfirmationStatus::Rejected);
  EXPECT_EQ(attempts[0].status, AttemptStatus::Reverted);
  EXPECT_EQ(attempts[1].status, AttemptStatus::Rejected);
}

/**
 * @given a poll interval of 3 blocks
 * @when polled on consecutive blocks
 * @then the node is queried only every third block
 */
TEST_F(ConfirmationTrackerTest, PollIsRateLimited) {
  std::vector<SubmissionAttempt> attempts{attempt(0x1, 3)};
  EXPECT_CALL(*chain_client_, transactionStatus(_))
      .Times(2)
      .WillRepeatedly(Return(ChainQueryError::TRANSACTION_NOT_FOUND));
  EXPECT_CALL(*chain_client_, attestationEvents(_, _))
      .Times(2)
      .WillRepeatedly(Return(std::vector<AttestationEvent>{}));

  for (uint64_t block = 512; block < 518; ++block) {
    ASSERT_OUTCOME_SUCCESS(result, tracker_.poll(obligation_, attempts, block));
    EXPECT_EQ(result, ConfirmationStatus::Pending);
  }
}

/**
 * @given a rejected attempt reported by a poll
 * @when a replacement is added within the poll interval
 * @then the next poll queries the node instead of repeating the rejection
 */
TEST_F(ConfirmationTrackerTest, NewAttemptInvalidatesPoll) {
  std::vector<SubmissionAttempt> attempts{attempt(0x1, 3)};
  EXPECT_CALL(*chain_client_, transactionStatus(Felt{0x1}))
      .WillOnce(Return(status(FinalityStatus::REJECTED, std::nullopt)));
  EXPECT_CALL(*chain_client_, transactionStatus(Felt{0x2}))
      .WillOnce(Return(ChainQueryError::TRANSACTION_NOT_FOUND));
  EXPECT_CALL(*chain_client_, attestationEvents(_, _))
      .Times(2)
      .WillRepeatedly(Return(std::vector<AttestationEvent>{}));

  ASSERT_OUTCOME_SUCCESS(first, tracker_.poll(obligation_, attempts, 512));
  EXPECT_EQ(first, ConfirmationStatus::Rejected);

  attempts.push_back(attempt(0x2, 3));
  ASSERT_OUTCOME_SUCCESS(second, tracker_.poll(obligation_, attempts, 512));
  EXPECT_EQ(second, ConfirmationStatus::Pending);
  ASSERT_OUTCOME_SUCCESS(cached, tracker_.poll(obligation_, attempts, 513));
  EXPECT_EQ(cached, ConfirmationStatus::Pending);
}

TEST_F(ConfirmationTrackerTest, QueryErrorPropagates) {
  std::vector<SubmissionAttempt> attempts{attempt(0x1, 3)};
  EXPECT_CALL(*chain_client_, transactionStatus(_))
      .WillOnce(Return(ChainQueryError::TIMEOUT));

  auto res = tracker_.check(obligation_, attempts);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), ChainQueryError::TIMEOUT);
  EXPECT_EQ(attempts[0].status, AttemptStatus::Pending);
}
