/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/attestation_info.hpp"

namespace attestor::attestation {

  enum class WindowError : uint8_t {
    EMPTY_ASSIGNMENT_RANGE = 1,
  };

  /// Attestation window `[assigned_block, window_end)`
  struct AttestationWindow {
    BlockNumber assigned_block = 0;
    BlockNumber window_end = 0;

    bool operator==(const AttestationWindow &) const = default;
  };

  /**
   * Computes where in an epoch the staker has to attest. The result is a
   * pure function of the staking parameters.
   */
  class WindowEvaluator {
   public:
    virtual ~WindowEvaluator() = default;

    virtual outcome::result<AttestationWindow> evaluate(
        const AttestationInfo &info) const = 0;
  };

}  // namespace attestor::attestation

OUTCOME_HPP_DECLARE_ERROR(attestor::attestation, WindowError);
