/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "metrics/metrics.hpp"

namespace prometheus {
  class Counter;
  class Gauge;
}  // namespace prometheus

namespace attestor::metrics {

  /// Counter over a time series owned by the prometheus family
  class PrometheusCounter : public Counter {
   public:
    explicit PrometheusCounter(prometheus::Counter &counter);

    [[nodiscard]] double value() const override;
    void inc() override;

   private:
    prometheus::Counter &counter_;
  };

  class PrometheusGauge : public Gauge {
   public:
    explicit PrometheusGauge(prometheus::Gauge &gauge);

    [[nodiscard]] double value() const override;
    void set(double val) override;

   private:
    prometheus::Gauge &gauge_;
  };

}  // namespace attestor::metrics
