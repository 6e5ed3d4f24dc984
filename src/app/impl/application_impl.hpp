/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "app/application.hpp"

namespace attestor::app {
  class Configuration;
  class HttpServer;
  class StateManager;
}  // namespace attestor::app

namespace attestor::chain {
  class ChainClient;
}  // namespace attestor::chain

namespace attestor::clock {
  class SystemClock;
}  // namespace attestor::clock

namespace attestor::log {
  class LoggingSystem;
}  // namespace attestor::log

namespace attestor::metrics {
  class Handler;
  class Metrics;
  class Registry;
}  // namespace attestor::metrics

namespace attestor::observer {
  class BlockPoller;
  class NewHeadsSubscription;
}  // namespace attestor::observer

namespace attestor::signer {
  class Signer;
}  // namespace attestor::signer

namespace soralog {
  class Logger;
}  // namespace soralog

namespace attestor::app {

  class ApplicationImpl final : public Application {
   public:
    ApplicationImpl(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<Configuration> config,
        qtils::SharedRef<StateManager> state_manager,
        qtils::SharedRef<chain::ChainClient> chain_client,
        qtils::SharedRef<signer::Signer> signer,
        qtils::SharedRef<metrics::Registry> metrics_registry,
        qtils::SharedRef<metrics::Handler> metrics_handler,
        qtils::SharedRef<metrics::Metrics> metrics,
        qtils::SharedRef<observer::BlockPoller> block_poller,
        qtils::SharedRef<observer::NewHeadsSubscription> new_heads,
        qtils::SharedRef<HttpServer> http_server);

    outcome::result<void> run() override;

   private:
    outcome::result<void> checkNode();
    void checkSigner();

    qtils::SharedRef<soralog::Logger> logger_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<StateManager> state_manager_;
    qtils::SharedRef<chain::ChainClient> chain_client_;
    qtils::SharedRef<signer::Signer> signer_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    qtils::SharedRef<observer::BlockPoller> block_poller_;
    qtils::SharedRef<observer::NewHeadsSubscription> new_heads_;
    qtils::SharedRef<HttpServer> http_server_;
  };

}  // namespace attestor::app
