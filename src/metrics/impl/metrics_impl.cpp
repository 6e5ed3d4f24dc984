/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "metrics/impl/metrics_impl.hpp"

#include "app/configuration.hpp"
#include "metrics/registry.hpp"

namespace attestor::metrics {

  MetricsImpl::MetricsImpl(std::shared_ptr<Registry> registry,
                           qtils::SharedRef<app::Configuration> app_config)
      : registry_{std::move(registry)} {
    const Labels network{{"network", app_config->staking().network}};
#define METRIC_GAUGE(field, name, help)                \
  registry_->registerGaugeFamily(name, help, network); \
  metric_##field##_ = registry_->registerGaugeMetric(name);
#define METRIC_GAUGE_LABELS(field, name, help, label_names) \
  registry_->registerGaugeFamily(name, help, network);
#define METRIC_COUNTER(field, name, help)                \
  registry_->registerCounterFamily(name, help, network); \
  metric_##field##_ = registry_->registerCounterMetric(name);
#define METRIC_COUNTER_LABELS(field, name, help, label_names) \
  registry_->registerCounterFamily(name, help, network);

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS

    build_info({{"version", app_config->nodeVersion()}})->set(1);
  }

#define METRIC_GAUGE(field, name, help) \
  Gauge *MetricsImpl::field() {         \
    return metric_##field##_;           \
  }
#define METRIC_GAUGE_LABELS(field, name, help, label_names) \
  Gauge *MetricsImpl::field(const Labels &labels) {         \
    return registry_->registerGaugeMetric(name, labels);    \
  }
#define METRIC_COUNTER(field, name, help) \
  Counter *MetricsImpl::field() {         \
    return metric_##field##_;             \
  }
#define METRIC_COUNTER_LABELS(field, name, help, label_names) \
  Counter *MetricsImpl::field(const Labels &labels) {         \
    return registry_->registerCounterMetric(name, labels);    \
  }

#include "metrics/all_metrics.def"

#undef METRIC_GAUGE
#undef METRIC_GAUGE_LABELS
#undef METRIC_COUNTER
#undef METRIC_COUNTER_LABELS
}  // namespace attestor::metrics
