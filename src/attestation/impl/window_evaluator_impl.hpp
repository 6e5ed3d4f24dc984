/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "attestation/window_evaluator.hpp"

namespace attestor::attestation {

  /**
   * Assignment of the attestation contract:
   *   h = poseidon_hash_many([stake, epoch_id, staker_address])
   *   assigned = start + h mod (epoch_length - attestation_window)
   *   window_end = min(assigned + attestation_window, start + epoch_length)
   */
  class WindowEvaluatorImpl final : public WindowEvaluator {
   public:
    outcome::result<AttestationWindow> evaluate(
        const AttestationInfo &info) const override;
  };

}  // namespace attestor::attestation
