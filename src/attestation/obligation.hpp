/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <fmt/format.h>

#include "types/attestation_info.hpp"

namespace attestor::attestation {

  enum class ObligationState : uint8_t {
    Idle,
    WaitingForAssignedBlock,
    Attesting,
    AwaitingConfirmation,
    Confirmed,
    Missed,
  };

  inline bool isTerminal(ObligationState state) {
    return state == ObligationState::Confirmed
        or state == ObligationState::Missed;
  }

  /**
   * @struct AttestationObligation
   * Duty of the staker for one epoch: attest the hash of `assigned_block`
   * while the latest block is in `[assigned_block, window_end)`
   */
  struct AttestationObligation {
    EpochId epoch_id = 0;
    BlockNumber assigned_block = 0;
    BlockNumber window_end = 0;
    /// Known once the assigned block is accepted
    std::optional<Felt> target_block_hash;
    AttestationInfo info;

    bool operator==(const AttestationObligation &) const = default;
  };

  enum class AttemptStatus : uint8_t {
    Pending,
    Included,
    Rejected,
    Reverted,
  };

  /// One transaction sent for an obligation
  struct SubmissionAttempt {
    /// Refers to the obligation by epoch only, it may outlive it
    EpochId epoch_id = 0;
    Nonce nonce;
    TransactionHash transaction_hash;
    BlockNumber submitted_at = 0;
    AttemptStatus status = AttemptStatus::Pending;

    bool operator==(const SubmissionAttempt &) const = default;
  };

  /// Published by the scheduler on every state change
  struct ObligationEvent {
    AttestationObligation obligation;
    ObligationState state = ObligationState::Idle;
    /// Block that triggered the change
    BlockNumber block = 0;
    /// Set for submissions and own confirmations
    std::optional<SubmissionAttempt> attempt;
    /// Set for confirmations: the attestation came from another source
    bool by_other = false;
  };

  class ObligationObserver {
   public:
    virtual ~ObligationObserver() = default;

    virtual void onObligationEvent(const ObligationEvent &event) = 0;
  };

}  // namespace attestor::attestation

template <>
struct fmt::formatter<attestor::attestation::ObligationState>
    : fmt::formatter<std::string_view> {
  auto format(attestor::attestation::ObligationState state,
              format_context &ctx) const {
    using S = attestor::attestation::ObligationState;
    std::string_view name = "?";
    switch (state) {
      case S::Idle:
        name = "Idle";
        break;
      case S::WaitingForAssignedBlock:
        name = "WaitingForAssignedBlock";
        break;
      case S::Attesting:
        name = "Attesting";
        break;
      case S::AwaitingConfirmation:
        name = "AwaitingConfirmation";
        break;
      case S::Confirmed:
        name = "Confirmed";
        break;
      case S::Missed:
        name = "Missed";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
