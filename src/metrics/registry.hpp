/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "metrics/metrics.hpp"

namespace attestor::metrics {

  class Handler;

  /**
   * @brief the class stores metrics, provides interface to create metrics and
   * families of metrics
   * @param name Set the metric name.
   * @param help Set an additional description.
   * @param labels Assign a set of key-value pairs (= labels) to the
   * metric. All these labels are propagated to each time series within the
   * metric.
   */
  class Registry {
   public:
    virtual ~Registry() = default;

    virtual void setHandler(Handler &handler) = 0;

    virtual void registerCounterFamily(const std::string &name,
                                       const std::string &help = "",
                                       const Labels &labels = {}) = 0;

    virtual void registerGaugeFamily(const std::string &name,
                                     const std::string &help = "",
                                     const Labels &labels = {}) = 0;

    /**
     * @brief create counter metrics object
     * @param name the name given at call `registerCounterFamily`
     * @return pointer without ownership
     * @note throws if the family is not registered
     */
    virtual Counter *registerCounterMetric(const std::string &name,
                                           const Labels &labels = {}) = 0;

    /**
     * @brief create gauge metrics object
     * @param name the name given at call `registerGaugeFamily`
     * @return pointer without ownership
     * @note throws if the family is not registered
     */
    virtual Gauge *registerGaugeMetric(const std::string &name,
                                       const Labels &labels = {}) = 0;
  };

}  // namespace attestor::metrics
