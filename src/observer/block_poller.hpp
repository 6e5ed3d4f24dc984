/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <optional>
#include <thread>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace attestor::app {
  class Configuration;
  class StateManager;
}  // namespace attestor::app

namespace attestor::chain {
  class ChainClient;
}  // namespace attestor::chain

namespace attestor::observer {
  class LatestBlock;

  /// Feeds `starknet_blockNumber` into the latest block slot periodically
  class BlockPoller {
   public:
    BlockPoller(qtils::SharedRef<log::LoggingSystem> logsys,
                qtils::SharedRef<app::StateManager> state_manager,
                qtils::SharedRef<app::Configuration> app_config,
                qtils::SharedRef<chain::ChainClient> chain_client,
                qtils::SharedRef<LatestBlock> latest_block);
    ~BlockPoller();

    void start();
    void stop();

    /// Single poll, failures are logged and skipped
    void pollOnce();

   private:
    log::Logger log_;
    qtils::SharedRef<app::Configuration> app_config_;
    qtils::SharedRef<chain::ChainClient> chain_client_;
    qtils::SharedRef<LatestBlock> latest_block_;
    std::atomic_bool stopped_ = false;
    utils::WaitForSingleObject stop_event_;
    std::optional<std::thread> thread_;
  };

}  // namespace attestor::observer
