/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/account_state.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock/app/configuration_mock.hpp"
#include "mock/chain/chain_client_mock.hpp"
#include "mock/metrics_mock.hpp"
#include "qtils/test/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using attestor::Felt;
using attestor::uint256_t;
using attestor::app::Configuration;
using attestor::app::ConfigurationMock;
using attestor::attestation::AccountState;
using attestor::chain::ChainClientMock;
using attestor::chain::ChainQueryError;
using testing::_;
using testing::Return;
using testing::ReturnRef;

class AccountStateTest : public testing::Test {
 protected:
  void SetUp() override {
    staking_config_.operational_address = Felt{0xa11ce};
    ON_CALL(*config_, staking()).WillByDefault(ReturnRef(staking_config_));
    account_ = std::make_shared<AccountState>(
        testutil::prepareLoggers(), config_, chain_client_, metrics_);
  }

  Configuration::StakingConfig staking_config_;
  std::shared_ptr<testing::NiceMock<ConfigurationMock>> config_ =
      std::make_shared<testing::NiceMock<ConfigurationMock>>();
  std::shared_ptr<ChainClientMock> chain_client_ =
      std::make_shared<ChainClientMock>();
  std::shared_ptr<attestor::metrics::MetricsMock> metrics_ =
      std::make_shared<attestor::metrics::MetricsMock>();
  std::shared_ptr<AccountState> account_;
};

/**
 * @given an account with nonce 9 and 2.5 STRK
 * @when the reservation is refreshed and committed
 * @then the local nonce moves to 10 without another node query
 */
TEST_F(AccountStateTest, CommitAdvancesNonce) {
  EXPECT_CALL(*chain_client_, accountNonce(Felt{0xa11ce}))
      .WillOnce(Return(Felt{9}));
  EXPECT_CALL(*chain_client_, accountBalance(Felt{0xa11ce}))
      .WillOnce(Return(uint256_t{2500000000000000000ull}));

  EXPECT_EQ(account_->lastKnownNonce(), std::nullopt);
  {
    auto reservation = account_->reserve();
    EXPECT_OUTCOME_SUCCESS(reservation.refresh());
    ASSERT_OUTCOME_SUCCESS(nonce, reservation.nonce());
    EXPECT_EQ(nonce, Felt{9});
    reservation.commit();
  }
  EXPECT_EQ(account_->lastKnownNonce(), Felt{10});
  EXPECT_EQ(account_->balance(), uint256_t{2500000000000000000ull});
  EXPECT_DOUBLE_EQ(metrics_->operational_balance()->value(), 2.5);

  auto reservation = account_->reserve();
  ASSERT_OUTCOME_SUCCESS(nonce, reservation.nonce());
  EXPECT_EQ(nonce, Felt{10});
}

/**
 * @given a reservation that is never committed
 * @when it is released
 * @then the nonce stays available for the next transaction
 */
TEST_F(AccountStateTest, UncommittedReservationKeepsNonce) {
  EXPECT_CALL(*chain_client_, accountNonce(_)).WillOnce(Return(Felt{4}));
  EXPECT_CALL(*chain_client_, accountBalance(_))
      .WillOnce(Return(ChainQueryError::TIMEOUT));

  {
    auto reservation = account_->reserve();
    ASSERT_OUTCOME_SUCCESS(nonce, reservation.nonce());
    EXPECT_EQ(nonce, Felt{4});
  }
  EXPECT_EQ(account_->lastKnownNonce(), Felt{4});
  EXPECT_EQ(account_->balance(), std::nullopt);
}

TEST_F(AccountStateTest, NonceQueryFailure) {
  EXPECT_CALL(*chain_client_, accountNonce(_))
      .WillOnce(Return(ChainQueryError::TRANSPORT_FAILED));
  EXPECT_CALL(*chain_client_, accountBalance(_)).Times(0);

  auto reservation = account_->reserve();
  auto res = reservation.nonce();
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), ChainQueryError::TRANSPORT_FAILED);
  EXPECT_EQ(account_->address(), Felt{0xa11ce});
}

/**
 * @given a node that keeps reporting nonce 5 after an own transaction with
 *   nonce 5 was accepted
 * @when the account is refreshed before the next transaction
 * @then nonce 6 is used until the node catches up or a conflict forces a
 *   resync
 */
TEST_F(AccountStateTest, RefreshKeepsAcceptedNonce) {
  EXPECT_CALL(*chain_client_, accountNonce(_))
      .WillRepeatedly(Return(Felt{5}));
  EXPECT_CALL(*chain_client_, accountBalance(_))
      .WillRepeatedly(Return(uint256_t{0}));

  {
    auto reservation = account_->reserve();
    EXPECT_OUTCOME_SUCCESS(reservation.refresh());
    ASSERT_OUTCOME_SUCCESS(nonce, reservation.nonce());
    EXPECT_EQ(nonce, Felt{5});
    reservation.commit();
  }
  {
    auto reservation = account_->reserve();
    EXPECT_OUTCOME_SUCCESS(reservation.refresh());
    ASSERT_OUTCOME_SUCCESS(nonce, reservation.nonce());
    EXPECT_EQ(nonce, Felt{6});

    EXPECT_OUTCOME_SUCCESS(reservation.resync());
    ASSERT_OUTCOME_SUCCESS(resynced, reservation.nonce());
    EXPECT_EQ(resynced, Felt{5});
  }
  EXPECT_EQ(account_->lastKnownNonce(), Felt{5});
}

/**
 * @given an accepted transaction with nonce 5 that later failed
 * @when the pending nonce is discarded and the account refreshed
 * @then nonce 5 is reused
 */
TEST_F(AccountStateTest, DiscardPendingReusesChainNonce) {
  EXPECT_CALL(*chain_client_, accountNonce(_))
      .WillRepeatedly(Return(Felt{5}));
  EXPECT_CALL(*chain_client_, accountBalance(_))
      .WillRepeatedly(Return(uint256_t{0}));

  {
    auto reservation = account_->reserve();
    EXPECT_OUTCOME_SUCCESS(reservation.refresh());
    reservation.commit();
  }
  EXPECT_EQ(account_->lastKnownNonce(), Felt{6});

  account_->discardPending();
  auto reservation = account_->reserve();
  EXPECT_OUTCOME_SUCCESS(reservation.refresh());
  ASSERT_OUTCOME_SUCCESS(nonce, reservation.nonce());
  EXPECT_EQ(nonce, Felt{5});
}
