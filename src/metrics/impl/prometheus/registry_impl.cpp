/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/registry_impl.hpp"

#include <stdexcept>

#include "metrics/handler.hpp"

namespace attestor::metrics {

  PrometheusRegistry::PrometheusRegistry()
      : registry_{std::make_shared<prometheus::Registry>()} {}

  void PrometheusRegistry::setHandler(Handler &handler) {
    handler.registerCollectable(*this);
  }

  void PrometheusRegistry::registerCounterFamily(const std::string &name,
                                                 const std::string &help,
                                                 const Labels &labels) {
    std::lock_guard lock{mutex_};
    if (counters_.contains(name)) {
      return;
    }
    auto &family = prometheus::BuildCounter()
                       .Name(name)
                       .Help(help)
                       .Labels(labels)
                       .Register(*registry_);
    counters_.emplace(name, FamilyEntry<prometheus::Counter>{&family, {}});
  }

  void PrometheusRegistry::registerGaugeFamily(const std::string &name,
                                               const std::string &help,
                                               const Labels &labels) {
    std::lock_guard lock{mutex_};
    if (gauges_.contains(name)) {
      return;
    }
    auto &family = prometheus::BuildGauge()
                       .Name(name)
                       .Help(help)
                       .Labels(labels)
                       .Register(*registry_);
    gauges_.emplace(name, FamilyEntry<prometheus::Gauge>{&family, {}});
  }

  Counter *PrometheusRegistry::registerCounterMetric(const std::string &name,
                                                     const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto it = counters_.find(name);
    if (it == counters_.end()) {
      throw std::logic_error("Counter family " + name + " is not registered");
    }
    auto &metric = it->second.metrics[labels];
    if (not metric) {
      metric = std::make_unique<PrometheusCounter>(
          it->second.family->Add(labels));
    }
    return metric.get();
  }

  Gauge *PrometheusRegistry::registerGaugeMetric(const std::string &name,
                                                 const Labels &labels) {
    std::lock_guard lock{mutex_};
    auto it = gauges_.find(name);
    if (it == gauges_.end()) {
      throw std::logic_error("Gauge family " + name + " is not registered");
    }
    auto &metric = it->second.metrics[labels];
    if (not metric) {
      metric =
          std::make_unique<PrometheusGauge>(it->second.family->Add(labels));
    }
    return metric.get();
  }

}  // namespace attestor::metrics
