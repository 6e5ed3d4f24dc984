/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <string>

namespace attestor::metrics {
  using Labels = std::map<std::string, std::string>;

  /// Monotonic count, exposed as a Prometheus counter
  class Counter {
   public:
    virtual ~Counter() = default;

    [[nodiscard]] virtual double value() const = 0;

    virtual void inc() = 0;
  };

  /// Last observed value, exposed as a Prometheus gauge
  class Gauge {
   public:
    virtual ~Gauge() = default;

    [[nodiscard]] virtual double value() const = 0;

    virtual void set(double val) = 0;

    /// Block numbers, ids and timestamps are exported as doubles
    template <typename T>
    void set(T val) {
      set(static_cast<double>(val));
    }
  };

  /**
   * @brief Metrics interface that holds all agent metrics
   *
   * Components only touch metrics at observation points (new block, epoch
   * change, submission outcome, confirmation), never on a hot path.
   */
  class Metrics {
   public:
    virtual ~Metrics() = default;

#define METRIC_GAUGE(field, name, help) virtual Gauge *field() = 0;
#define METRIC_GAUGE_LABELS(field, name, help, ...) \
  virtual Gauge *field(const Labels &labels) = 0;
#define METRIC_COUNTER(field, name, help) virtual Counter *field() = 0;
#define METRIC_COUNTER_LABELS(field, name, help, ...) \
  virtual Counter *field(const Labels &labels) = 0;

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS
  };
}  // namespace attestor::metrics
