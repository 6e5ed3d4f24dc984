/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <qtils/shared_ref.hpp>

#include "metrics/metrics.hpp"

namespace attestor::app {
  class Configuration;
}  // namespace attestor::app

namespace attestor::metrics {
  class Registry;

  /**
   * @brief Metrics implementation that holds all agent metrics
   *
   * Families are registered once in the constructor with the constant
   * `network` label; unlabelled metrics are created there too.
   */
  class MetricsImpl : public Metrics {
   public:
    MetricsImpl(std::shared_ptr<Registry> registry,
                qtils::SharedRef<app::Configuration> app_config);

   private:
    std::shared_ptr<Registry> registry_;

   public:
#define METRIC_GAUGE(field, name, help) \
 private:                               \
  Gauge *metric_##field##_;             \
                                        \
 public:                                \
  Gauge *field() override;
#define METRIC_GAUGE_LABELS(field, name, help, ...) \
 public:                                            \
  Gauge *field(const Labels &labels) override;
#define METRIC_COUNTER(field, name, help) \
 private:                                 \
  Counter *metric_##field##_;             \
                                          \
 public:                                  \
  Counter *field() override;
#define METRIC_COUNTER_LABELS(field, name, help, ...) \
 public:                                              \
  Counter *field(const Labels &labels) override;

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS
  };

}  // namespace attestor::metrics
