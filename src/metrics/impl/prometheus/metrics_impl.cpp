/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/prometheus/metrics_impl.hpp"

#include <prometheus/counter.h>
#include <prometheus/gauge.h>

namespace attestor::metrics {

  PrometheusCounter::PrometheusCounter(prometheus::Counter &counter)
      : counter_(counter) {}

  double PrometheusCounter::value() const {
    return counter_.Value();
  }

  void PrometheusCounter::inc() {
    counter_.Increment();
  }

  PrometheusGauge::PrometheusGauge(prometheus::Gauge &gauge) : gauge_(gauge) {}

  double PrometheusGauge::value() const {
    return gauge_.Value();
  }

  void PrometheusGauge::set(double val) {
    gauge_.Set(val);
  }

}  // namespace attestor::metrics
