/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/application_impl.hpp"

#include <unistd.h>

#include "app/configuration.hpp"
#include "app/impl/http_server.hpp"
#include "app/state_manager.hpp"
#include "chain/chain_client.hpp"
#include "log/logger.hpp"
#include "metrics/handler.hpp"
#include "metrics/metrics.hpp"
#include "metrics/registry.hpp"
#include "observer/block_poller.hpp"
#include "observer/new_heads_subscription.hpp"
#include "signer/signer.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(attestor::app, ApplicationError, e) {
  using E = attestor::app::ApplicationError;
  switch (e) {
    case E::NODE_UNREACHABLE:
      return "Starknet node is unreachable";
    case E::CHAIN_ID_MISMATCH:
      return "Starknet node serves another network";
  }
  return "Unknown app::ApplicationError";
}

namespace attestor::app {

  ApplicationImpl::ApplicationImpl(
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
      qtils::SharedRef<HttpServer> http_server)
      : logger_(logsys->getLogger("Application", "application")),
        app_config_(std::move(config)),
        state_manager_(std::move(state_manager)),
        chain_client_(std::move(chain_client)),
        signer_(std::move(signer)),
        metrics_(std::move(metrics)),
        block_poller_(std::move(block_poller)),
        new_heads_(std::move(new_heads)),
        http_server_(std::move(http_server)) {
    metrics_registry->setHandler(*metrics_handler);
  }

  outcome::result<void> ApplicationImpl::run() {
    logger_->info("Start as agent version '{}' named as '{}' with PID {}",
                  app_config_->nodeVersion(),
                  app_config_->nodeName(),
                  getpid());

    OUTCOME_TRY(checkNode());
    checkSigner();

    state_manager_->run();

    return outcome::success();
  }

  outcome::result<void> ApplicationImpl::checkNode() {
    const auto &staking = app_config_->staking();

    auto chain_id_res = chain_client_->chainId();
    if (chain_id_res.has_error()) {
      SL_CRITICAL(logger_,
                  "Can't query chain id of node {}: {}",
                  app_config_->node().url,
                  chain_id_res.error());
      return ApplicationError::NODE_UNREACHABLE;
    }
    if (chain_id_res.value() != staking.chain_id) {
      SL_CRITICAL(logger_,
                  "Node {} serves chain {}, but network '{}' expects {}",
                  app_config_->node().url,
                  chain_id_res.value(),
                  staking.network,
                  staking.chain_id);
      return ApplicationError::CHAIN_ID_MISMATCH;
    }
    SL_INFO(logger_,
            "Connected to {} ({}); operational account {}",
            app_config_->node().url,
            staking.network,
            staking.operational_address);

    // not fatal, the balance is refreshed before every submission
    if (auto balance_res =
            chain_client_->accountBalance(staking.operational_address)) {
      metrics_->operational_balance()->set(
          static_cast<double>(balance_res.value()) / 1e18);
    } else {
      SL_WARN(logger_,
              "Can't read balance of operational account: {}",
              balance_res.error());
    }
    return outcome::success();
  }

  void ApplicationImpl::checkSigner() {
    const auto &signer = app_config_->signer();
    if (signer.remote_url.has_value() and not signer.remote_legacy) {
      SL_INFO(logger_, "Using remote signer {}", *signer.remote_url);
      return;
    }
    auto public_key_res = signer_->publicKey();
    if (public_key_res.has_error()) {
      SL_WARN(logger_,
              "Can't get public key of the signer: {}",
              public_key_res.error());
      return;
    }
    SL_INFO(logger_,
            "Using {} signer with public key {}",
            signer.remote_url.has_value() ? "remote" : "local",
            public_key_res.value());
  }

}  // namespace attestor::app
