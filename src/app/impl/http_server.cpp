/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/http_server.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <soralog/util.hpp>

#include "app/configuration.hpp"
#include "app/state_manager.hpp"
#include "attestation/attestation_scheduler.hpp"
#include "metrics/handler.hpp"
#include "observer/latest_block.hpp"
#include "serde/json.hpp"

namespace attestor::app {
  namespace {
    struct HealthReport {
      std::string status;
      std::string version;
      std::optional<BlockNumber> latest_block;
      std::optional<EpochId> epoch_id;
      std::optional<std::string> obligation;

      JSON_FIELDS(status, version, latest_block, epoch_id, obligation)
    };
  }  // namespace

  HttpServer::HttpServer(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<StateManager> state_manager,
      qtils::SharedRef<Configuration> app_config,
      qtils::SharedRef<metrics::Handler> metrics_handler,
      qtils::SharedRef<observer::LatestBlock> latest_block,
      qtils::SharedRef<attestation::AttestationScheduler> scheduler)
      : log_{logsys->getLogger("HttpServer", "http")},
        app_config_{std::move(app_config)},
        metrics_handler_{std::move(metrics_handler)},
        latest_block_{std::move(latest_block)},
        scheduler_{std::move(scheduler)} {
    state_manager->takeControl(*this);
  }

  HttpServer::~HttpServer() {
    stop();
  }

  bool HttpServer::start() {
    if (not app_config_->metrics().enabled.value_or(false)) {
      SL_INFO(log_, "Metrics endpoint is disabled");
      return true;
    }
    io_context_ = std::make_shared<boost::asio::io_context>();
    http::ServerConfig config{
        .endpoint = app_config_->metrics().endpoint,
        .on_request =
            [weak_self{weak_from_this()}](http::Request request) {
              auto self = weak_self.lock();
              if (not self) {
                http::Response response;
                response.result(boost::beast::http::status::bad_gateway);
                return response;
              }
              return self->handle(request);
            },
    };
    auto listen_res = http::serve(log_, *io_context_, config);
    if (not listen_res.has_value()) {
      SL_ERROR(log_,
               "Can't listen on {}: {}",
               app_config_->metrics().endpoint.address().to_string(),
               listen_res.error());
      return false;
    }
    SL_INFO(log_,
            "Serving /metrics and /health on {}:{}",
            app_config_->metrics().endpoint.address().to_string(),
            app_config_->metrics().endpoint.port());
    io_thread_.emplace([io_context{io_context_}] {
      soralog::util::setThreadName("http");
      auto work_guard = boost::asio::make_work_guard(*io_context);
      io_context->run();
    });
    return true;
  }

  void HttpServer::stop() {
    if (io_thread_.has_value() and io_thread_->joinable()) {
      io_context_->stop();
      io_thread_->join();
    }
  }

  http::Response HttpServer::handle(const http::Request &request) const {
    http::Response response;
    std::string_view url{request.target()};
    SL_DEBUG(log_, "{} {}", std::string_view{request.method_string()}, url);
    if (request.method() != boost::beast::http::verb::get) {
      response.result(boost::beast::http::status::method_not_allowed);
      return response;
    }
    if (url == "/metrics") {
      response.set(boost::beast::http::field::content_type,
                   "text/plain; version=0.0.4; charset=utf-8");
      response.body() = metrics_handler_->collect();
      return response;
    }
    if (url == "/health") {
      response.set(boost::beast::http::field::content_type,
                   "application/json");
      response.body() = health();
      return response;
    }
    response.result(boost::beast::http::status::not_found);
    return response;
  }

  std::string HttpServer::health() const {
    HealthReport report{
        .status = "healthy",
        .version = app_config_->nodeVersion(),
        .latest_block = latest_block_->get(),
        .epoch_id = std::nullopt,
        .obligation = std::nullopt,
    };
    if (auto obligation = scheduler_->obligation()) {
      report.epoch_id = obligation->epoch_id;
      report.obligation = fmt::format("{}", scheduler_->state());
    }
    if (not report.latest_block.has_value()) {
      report.status = "syncing";
    }
    return json::encode(report);
  }
}  // namespace attestor::app
