/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <type_traits>
#include <unordered_map>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

#include "metrics/impl/prometheus/metrics_impl.hpp"
#include "metrics/registry.hpp"

namespace attestor::metrics {

  /// Registry over `prometheus::Registry`, families are looked up by name
  class PrometheusRegistry : public Registry {
   public:
    PrometheusRegistry();

    void setHandler(Handler &handler) override;

    void registerCounterFamily(const std::string &name,
                               const std::string &help,
                               const Labels &labels) override;

    void registerGaugeFamily(const std::string &name,
                             const std::string &help,
                             const Labels &labels) override;

    Counter *registerCounterMetric(const std::string &name,
                                   const Labels &labels) override;

    Gauge *registerGaugeMetric(const std::string &name,
                               const Labels &labels) override;

    std::weak_ptr<prometheus::Registry> registry() const {
      return registry_;
    }

   private:
    template <typename T>
    struct FamilyEntry {
      prometheus::Family<T> *family;
      // prometheus keeps one child per label set, so do we
      std::map<Labels, std::unique_ptr<std::conditional_t<
                           std::is_same_v<T, prometheus::Counter>,
                           PrometheusCounter,
                           PrometheusGauge>>>
          metrics;
    };

    std::shared_ptr<prometheus::Registry> registry_;
    std::mutex mutex_;
    std::unordered_map<std::string, FamilyEntry<prometheus::Counter>>
        counters_;
    std::unordered_map<std::string, FamilyEntry<prometheus::Gauge>> gauges_;
  };

}  // namespace attestor::metrics
