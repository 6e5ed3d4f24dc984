/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#define BOOST_DI_CFG_DIAGNOSTICS_LEVEL 2
#define BOOST_DI_CFG_CTOR_LIMIT_SIZE 32

#include "injector/node_injector.hpp"

#include <memory>
#include <vector>

#include <boost/di.hpp>
#include <boost/di/extension/scopes/shared.hpp>

#include "app/configuration.hpp"
#include "app/impl/application_impl.hpp"
#include "app/impl/http_server.hpp"
#include "app/impl/state_manager_impl.hpp"
#include "attestation/account_state.hpp"
#include "attestation/attestation_scheduler.hpp"
#include "attestation/confirmation_tracker.hpp"
#include "attestation/epoch_tracker.hpp"
#include "attestation/impl/obligation_metrics.hpp"
#include "attestation/impl/window_evaluator_impl.hpp"
#include "attestation/transaction_submitter.hpp"
#include "chain/impl/json_rpc_client.hpp"
#include "clock/impl/clock_impl.hpp"
#include "injector/bind_by_lambda.hpp"
#include "log/logger.hpp"
#include "metrics/impl/metrics_impl.hpp"
#include "metrics/impl/prometheus/handler_impl.hpp"
#include "metrics/impl/prometheus/registry_impl.hpp"
#include "observer/block_poller.hpp"
#include "observer/latest_block.hpp"
#include "observer/new_heads_subscription.hpp"
#include "signer/local_signer.hpp"
#include "signer/remote_signer.hpp"

namespace {
  namespace di = boost::di;
  using namespace attestor;  // NOLINT

  using injector::bind_by_lambda;

  template <typename... Ts>
  auto makeApplicationInjector(std::shared_ptr<log::LoggingSystem> logsys,
                               std::shared_ptr<app::Configuration> config,
                               Ts &&...args) {
    // clang-format off
    return di::make_injector(
        di::bind<app::Configuration>.to(config),
        di::bind<log::LoggingSystem>.to(logsys),
        di::bind<app::StateManager>.to<app::StateManagerImpl>(),
        di::bind<app::Application>.to<app::ApplicationImpl>(),
        di::bind<clock::SystemClock>.to<clock::SystemClockImpl>(),
        di::bind<clock::SteadyClock>.to<clock::SteadyClockImpl>(),
        di::bind<metrics::Handler>.to<metrics::PrometheusHandler>(),
        di::bind<metrics::Registry>.to<metrics::PrometheusRegistry>(),
        di::bind<metrics::Metrics>.to<metrics::MetricsImpl>(),
        di::bind<chain::ChainClient>.to<chain::JsonRpcClient>(),
        di::bind<attestation::WindowEvaluator>.to<attestation::WindowEvaluatorImpl>(),
        bind_by_lambda<signer::Signer>([](const auto &injector) {
          auto logsys = injector.template create<std::shared_ptr<log::LoggingSystem>>();
          auto config = injector.template create<std::shared_ptr<app::Configuration>>();
          const auto &signer_config = config->signer();
          if (signer_config.remote_url.has_value()) {
            return std::static_pointer_cast<signer::Signer>(
                std::make_shared<signer::RemoteSigner>(logsys, config));
          }
          return std::static_pointer_cast<signer::Signer>(
              std::make_shared<signer::LocalSigner>(
                  logsys, signer_config.private_key.value()));
        }),
        bind_by_lambda<attestation::AttestationScheduler::Observers>([](const auto &injector) {
          return std::make_shared<attestation::AttestationScheduler::Observers>(
              attestation::AttestationScheduler::Observers{
                  injector.template create<std::shared_ptr<attestation::ObligationMetrics>>(),
              });
        }),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
    // clang-format on
  }

  template <typename... Ts>
  auto makeNodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                        std::shared_ptr<app::Configuration> config,
                        Ts &&...args) {
    return di::make_injector<boost::di::extension::shared_config>(
        makeApplicationInjector(std::move(logsys), std::move(config)),

        // user-defined overrides...
        std::forward<decltype(args)>(args)...);
  }
}  // namespace

namespace attestor::injector {
  class NodeInjectorImpl {
   public:
    using Injector =
        decltype(makeNodeInjector(std::shared_ptr<log::LoggingSystem>(),
                                  std::shared_ptr<app::Configuration>()));

    explicit NodeInjectorImpl(Injector injector)
        : injector_{std::move(injector)} {}

    Injector injector_;
  };

  NodeInjector::NodeInjector(std::shared_ptr<log::LoggingSystem> logsys,
                             std::shared_ptr<app::Configuration> config)
      : pimpl_{std::make_unique<NodeInjectorImpl>(
            makeNodeInjector(std::move(logsys), std::move(config)))} {}

  std::shared_ptr<app::Application> NodeInjector::injectApplication() {
    return pimpl_->injector_
        .template create<std::shared_ptr<app::Application>>();
  }
}  // namespace attestor::injector
