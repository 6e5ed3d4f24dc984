/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/impl/obligation_metrics.hpp"

#include "clock/clock.hpp"
#include "metrics/metrics.hpp"

namespace attestor::attestation {

  ObligationMetrics::ObligationMetrics(
      qtils::SharedRef<metrics::Metrics> metrics,
      qtils::SharedRef<clock::SystemClock> clock)
      : metrics_{std::move(metrics)}, clock_{std::move(clock)} {}

  void ObligationMetrics::onObligationEvent(const ObligationEvent &event) {
    const auto &obligation = event.obligation;
    switch (event.state) {
      case ObligationState::WaitingForAssignedBlock: {
        const auto &epoch = obligation.info.epoch;
        metrics_->epoch_id()->set(epoch.id);
        metrics_->epoch_length()->set(epoch.length);
        metrics_->epoch_starting_block()->set(epoch.starting_block);
        metrics_->assigned_block()->set(obligation.assigned_block);
        break;
      }
      case ObligationState::Confirmed:
        if (not event.by_other) {
          metrics_->attestations_confirmed()->inc();
        }
        metrics_
            ->confirmations_observed(
                {{"source", event.by_other ? "other" : "self"}})
            ->inc();
        metrics_->last_attestation_timestamp()->set(clock_->nowSec());
        break;
      case ObligationState::Missed:
        metrics_->missed_epochs()->inc();
        break;
      default:
        break;
    }
  }

}  // namespace attestor::attestation
