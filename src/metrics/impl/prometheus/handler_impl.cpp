/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/handler_impl.hpp"

#include <algorithm>

#include <prometheus/text_serializer.h>

#include "metrics/impl/prometheus/registry_impl.hpp"

using prometheus::Collectable;
using prometheus::MetricFamily;
using prometheus::TextSerializer;

namespace attestor::metrics {
  namespace {
    std::vector<MetricFamily> collectMetrics(
        const std::vector<std::weak_ptr<Collectable>> &collectables) {
      auto collected_metrics = std::vector<MetricFamily>{};

      for (auto &&wcollectable : collectables) {
        auto collectable = wcollectable.lock();
        if (!collectable) {
          continue;
        }

        auto &&metrics = collectable->Collect();
        collected_metrics.insert(collected_metrics.end(),
                                 std::make_move_iterator(metrics.begin()),
                                 std::make_move_iterator(metrics.end()));
      }

      return collected_metrics;
    }
  }  // namespace

  PrometheusHandler::PrometheusHandler(
      qtils::SharedRef<log::LoggingSystem> logsys)
      : logger_{logsys->getLogger("PrometheusHandler", "metrics")} {}

  std::string PrometheusHandler::collect() {
    std::vector<MetricFamily> metrics;

    {
      std::lock_guard<std::mutex> lock{collectables_mutex_};
      metrics = collectMetrics(collectables_);
    }

    const TextSerializer serializer;

    return serializer.Serialize(metrics);
  }

  // it is called once on init
  void PrometheusHandler::registerCollectable(Registry &registry) {
    auto *pregistry = dynamic_cast<PrometheusRegistry *>(&registry);
    if (pregistry) {
      registerCollectable(pregistry->registry());
    } else {
      SL_WARN(logger_, "Registry is not backed by prometheus, ignored");
    }
  }

  void PrometheusHandler::registerCollectable(
      const std::weak_ptr<Collectable> &collectable) {
    std::lock_guard<std::mutex> lock{collectables_mutex_};
    cleanupStalePointers(collectables_);
    collectables_.push_back(collectable);
  }

  void PrometheusHandler::cleanupStalePointers(
      std::vector<std::weak_ptr<Collectable>> &collectables) {
    std::erase_if(collectables, [](const std::weak_ptr<Collectable> &candidate) {
      return candidate.expired();
    });
  }

}  // namespace attestor::metrics
