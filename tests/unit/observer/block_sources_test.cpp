/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "app/impl/state_manager_impl.hpp"
#include "mock/app/configuration_mock.hpp"
#include "mock/chain/chain_client_mock.hpp"
#include "observer/block_poller.hpp"
#include "observer/latest_block.hpp"
#include "observer/new_heads_subscription.hpp"
#include "testutil/dummy_error.hpp"
#include "testutil/prepare_loggers.hpp"

using attestor::app::Configuration;
using attestor::app::ConfigurationMock;
using attestor::app::StateManagerImpl;
using attestor::chain::ChainClientMock;
using attestor::observer::BlockPoller;
using attestor::observer::LatestBlock;
using attestor::observer::NewHeadsSubscription;
using testing::NiceMock;
using testing::Return;
using testing::ReturnRef;

class BlockSourcesTest : public testing::Test {
 protected:
  void SetUp() override {
    ON_CALL(*config_, node()).WillByDefault(ReturnRef(node_config_));
  }

  qtils::SharedRef<attestor::log::LoggingSystem> logsys_ =
      testutil::prepareLoggers();
  Configuration::NodeConfig node_config_;
  std::shared_ptr<NiceMock<ConfigurationMock>> config_ =
      std::make_shared<NiceMock<ConfigurationMock>>();
  std::shared_ptr<StateManagerImpl> state_manager_ =
      std::make_shared<StateManagerImpl>(logsys_);
  std::shared_ptr<NiceMock<ChainClientMock>> chain_client_ =
      std::make_shared<NiceMock<ChainClientMock>>();
  std::shared_ptr<LatestBlock> latest_block_ = std::make_shared<LatestBlock>();
};

TEST_F(BlockSourcesTest, PollerFeedsLatestBlock) {
  BlockPoller poller{
      logsys_, state_manager_, config_, chain_client_, latest_block_};

  EXPECT_CALL(*chain_client_, latestBlockNumber())
      .WillOnce(Return(100))
      .WillOnce(Return(testutil::DummyError::ERROR))
      .WillOnce(Return(99));
  poller.pollOnce();
  EXPECT_EQ(latest_block_->get(), 100);
  poller.pollOnce();
  EXPECT_EQ(latest_block_->get(), 100);
  poller.pollOnce();
  EXPECT_EQ(latest_block_->get(), 100);
}

/**
 * @given a new heads subscription
 * @when the node sends the subscription id, heads and a reorg
 * @then heads advance the latest block and nothing fails the subscription
 */
TEST_F(BlockSourcesTest, NewHeadsMessages) {
  auto subscription = std::make_shared<NewHeadsSubscription>(
      logsys_, state_manager_, config_, latest_block_);

  EXPECT_TRUE(subscription->onMessage(
      R"({"jsonrpc":"2.0","id":1,"result":"0x3a"})"));
  EXPECT_EQ(latest_block_->get(), std::nullopt);

  EXPECT_TRUE(subscription->onMessage(
      R"({"jsonrpc":"2.0","method":"starknet_subscriptionNewHeads",)"
      R"("params":{"subscription_id":"0x3a","result":{"block_hash":"0xb1",)"
      R"("block_number":1021,"parent_hash":"0xb0","timestamp":1700000000,)"
      R"("sequencer_address":"0x1"}}})"));
  EXPECT_EQ(latest_block_->get(), 1021);

  EXPECT_TRUE(subscription->onMessage(
      R"({"jsonrpc":"2.0","method":"starknet_subscriptionReorg",)"
      R"("params":{"subscription_id":"0x3a","result":{)"
      R"("starting_block_number":1019,"ending_block_number":1021}}})"));
  EXPECT_EQ(latest_block_->get(), 1021);

  // malformed frames are skipped
  EXPECT_TRUE(subscription->onMessage("not json"));
  EXPECT_TRUE(subscription->onMessage(
      R"({"jsonrpc":"2.0","method":"starknet_subscriptionNewHeads",)"
      R"("params":{"result":{"block_number":"x"}}})"));
  EXPECT_EQ(latest_block_->get(), 1021);
}

TEST_F(BlockSourcesTest, RefusedSubscription) {
  auto subscription = std::make_shared<NewHeadsSubscription>(
      logsys_, state_manager_, config_, latest_block_);
  EXPECT_FALSE(subscription->onMessage(
      R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found"}})"));
}

TEST_F(BlockSourcesTest, SubscriptionInactiveWithoutWebsocket) {
  auto subscription = std::make_shared<NewHeadsSubscription>(
      logsys_, state_manager_, config_, latest_block_);
  subscription->start();
  subscription->stop();
  EXPECT_EQ(latest_block_->get(), std::nullopt);
}
