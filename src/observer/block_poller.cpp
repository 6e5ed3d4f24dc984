/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "observer/block_poller.hpp"

#include "app/configuration.hpp"
#include "app/state_manager.hpp"
#include "chain/chain_client.hpp"
#include "observer/latest_block.hpp"

namespace attestor::observer {

  BlockPoller::BlockPoller(qtils::SharedRef<log::LoggingSystem> logsys,
                           qtils::SharedRef<app::StateManager> state_manager,
                           qtils::SharedRef<app::Configuration> app_config,
                           qtils::SharedRef<chain::ChainClient> chain_client,
                           qtils::SharedRef<LatestBlock> latest_block)
      : log_{logsys->getLogger("BlockPoller", "observer")},
        app_config_{std::move(app_config)},
        chain_client_{std::move(chain_client)},
        latest_block_{std::move(latest_block)} {
    state_manager->takeControl(*this);
  }

  BlockPoller::~BlockPoller() {
    stop();
  }

  void BlockPoller::start() {
    auto interval = app_config_->node().block_poll_interval;
    SL_INFO(log_, "Polling latest block every {}ms", interval.count());
    thread_.emplace([this, interval] {
      while (not stopped_) {
        pollOnce();
        stop_event_.wait(interval);
      }
    });
  }

  void BlockPoller::stop() {
    stopped_ = true;
    stop_event_.set();
    if (thread_.has_value() and thread_->joinable()) {
      thread_->join();
    }
  }

  void BlockPoller::pollOnce() {
    auto number_res = chain_client_->latestBlockNumber();
    if (not number_res.has_value()) {
      SL_WARN(log_, "Failed to fetch latest block: {}", number_res.error());
      return;
    }
    if (latest_block_->update(number_res.value())) {
      SL_DEBUG(log_, "New block #{}", number_res.value());
    }
  }

}  // namespace attestor::observer
