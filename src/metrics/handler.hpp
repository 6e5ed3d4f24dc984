/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace attestor::metrics {

  class Registry;

  /**
   * @brief collects registries and renders them for the `/metrics` endpoint
   */
  class Handler {
   public:
    virtual ~Handler() = default;
    /**
     * @brief registers general type metrics registry for metrics collection
     */
    virtual void registerCollectable(Registry &registry) = 0;

    /// Text exposition format of all registered collectables
    virtual std::string collect() = 0;
  };

}  // namespace attestor::metrics
