/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"

namespace boost::asio {
  class io_context;
}  // namespace boost::asio

namespace attestor::app {
  class Configuration;
  class StateManager;
}  // namespace attestor::app

namespace attestor::observer {
  class LatestBlock;

  /**
   * `starknet_subscribeNewHeads` over a websocket, running on its own
   * io_context thread. Reconnects after any failure. Inactive when no
   * websocket url is configured.
   */
  class NewHeadsSubscription
      : public std::enable_shared_from_this<NewHeadsSubscription> {
   public:
    NewHeadsSubscription(qtils::SharedRef<log::LoggingSystem> logsys,
                         qtils::SharedRef<app::StateManager> state_manager,
                         qtils::SharedRef<app::Configuration> app_config,
                         qtils::SharedRef<LatestBlock> latest_block);
    ~NewHeadsSubscription();

    void start();
    void stop();

    /**
     * Handles one websocket frame: new heads advance the latest block,
     * reorgs are logged, an error reply fails the subscription
     * @return false if the subscription was refused
     */
    bool onMessage(std::string_view message);

   private:
    log::Logger log_;
    qtils::SharedRef<app::Configuration> app_config_;
    qtils::SharedRef<LatestBlock> latest_block_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::optional<std::thread> io_thread_;
  };

}  // namespace attestor::observer
