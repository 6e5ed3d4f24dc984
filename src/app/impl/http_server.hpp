/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <thread>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "utils/http.hpp"

namespace boost::asio {
  class io_context;
}  // namespace boost::asio

namespace attestor::attestation {
  class AttestationScheduler;
}  // namespace attestor::attestation

namespace attestor::metrics {
  class Handler;
}  // namespace attestor::metrics

namespace attestor::observer {
  class LatestBlock;
}  // namespace attestor::observer

namespace attestor::app {
  class Configuration;
  class StateManager;

  /// Serves `/metrics` (Prometheus text format) and `/health` (JSON)
  class HttpServer : public std::enable_shared_from_this<HttpServer> {
   public:
    HttpServer(
        qtils::SharedRef<log::LoggingSystem> logsys,
        qtils::SharedRef<StateManager> state_manager,
        qtils::SharedRef<Configuration> app_config,
        qtils::SharedRef<metrics::Handler> metrics_handler,
        qtils::SharedRef<observer::LatestBlock> latest_block,
        qtils::SharedRef<attestation::AttestationScheduler> scheduler);
    ~HttpServer();

    bool start();
    void stop();

    http::Response handle(const http::Request &request) const;

   private:
    std::string health() const;

    log::Logger log_;
    qtils::SharedRef<Configuration> app_config_;
    qtils::SharedRef<metrics::Handler> metrics_handler_;
    qtils::SharedRef<observer::LatestBlock> latest_block_;
    qtils::SharedRef<attestation::AttestationScheduler> scheduler_;
    std::shared_ptr<boost::asio::io_context> io_context_;
    std::optional<std::thread> io_thread_;
  };
}  // namespace attestor::app
