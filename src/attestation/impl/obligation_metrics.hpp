/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "attestation/obligation.hpp"

namespace attestor::clock {
  class SystemClock;
}  // namespace attestor::clock

namespace attestor::metrics {
  class Metrics;
}  // namespace attestor::metrics

namespace attestor::attestation {

  /// Mirrors obligation life cycle into the epoch and attestation metrics
  class ObligationMetrics : public ObligationObserver {
   public:
    ObligationMetrics(qtils::SharedRef<metrics::Metrics> metrics,
                      qtils::SharedRef<clock::SystemClock> clock);

    void onObligationEvent(const ObligationEvent &event) override;

   private:
    qtils::SharedRef<metrics::Metrics> metrics_;
    qtils::SharedRef<clock::SystemClock> clock_;
  };

}  // namespace attestor::attestation
