/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <vector>

#include <fmt/format.h>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "attestation/obligation.hpp"
#include "log/logger.hpp"

namespace attestor::app {
  class Configuration;
}  // namespace attestor::app

namespace attestor::chain {
  class ChainClient;
}  // namespace attestor::chain

namespace attestor::attestation {

  enum class ConfirmationStatus : uint8_t {
    /// Nothing sent and no attestation seen
    NotYet,
    /// Own transaction known to the node but not included
    Pending,
    ConfirmedBySelf,
    /// Attestation event of another transaction, e.g. sent before a restart
    ConfirmedByOther,
    /// Every own transaction was rejected or reverted
    Rejected,
  };

  inline bool isConfirmed(ConfirmationStatus status) {
    return status == ConfirmationStatus::ConfirmedBySelf
        or status == ConfirmationStatus::ConfirmedByOther;
  }

  /**
   * Finds out whether the obligation of an epoch is fulfilled: by the status
   * of own transactions first, then by `StakerAttestationSuccessful` events
   * of the staker since the epoch start.
   */
  class ConfirmationTracker {
   public:
    ConfirmationTracker(qtils::SharedRef<log::LoggingSystem> logsys,
                        qtils::SharedRef<app::Configuration> app_config,
                        qtils::SharedRef<chain::ChainClient> chain_client);

    /**
     * Rate-limited `check`: queries the chain at most once per
     * `confirmation_poll_interval` blocks of one epoch, in between the
     * previous answer is repeated. A new attempt invalidates the answer.
     */
    outcome::result<ConfirmationStatus> poll(
        const AttestationObligation &obligation,
        std::vector<SubmissionAttempt> &attempts,
        BlockNumber block);

    /// Queries the chain now; updates the status of @param attempts
    outcome::result<ConfirmationStatus> check(
        const AttestationObligation &obligation,
        std::vector<SubmissionAttempt> &attempts);

    /// Status of a single transaction; unknown to the node is Pending
    outcome::result<AttemptStatus> attemptStatus(
        const SubmissionAttempt &attempt);

   private:
    struct LastPoll {
      EpochId epoch_id;
      size_t attempts;
      BlockNumber block;
      ConfirmationStatus status;
    };

    log::Logger log_;
    qtils::SharedRef<app::Configuration> app_config_;
    qtils::SharedRef<chain::ChainClient> chain_client_;
    std::optional<LastPoll> last_poll_;
  };

}  // namespace attestor::attestation

template <>
struct fmt::formatter<attestor::attestation::ConfirmationStatus>
    : fmt::formatter<std::string_view> {
  auto format(attestor::attestation::ConfirmationStatus status,
              format_context &ctx) const {
    using S = attestor::attestation::ConfirmationStatus;
    std::string_view name = "?";
    switch (status) {
      case S::NotYet:
        name = "NotYet";
        break;
      case S::Pending:
        name = "Pending";
        break;
      case S::ConfirmedBySelf:
        name = "ConfirmedBySelf";
        break;
      case S::ConfirmedByOther:
        name = "ConfirmedByOther";
        break;
      case S::Rejected:
        name = "Rejected";
        break;
    }
    return fmt::formatter<std::string_view>::format(name, ctx);
  }
};
