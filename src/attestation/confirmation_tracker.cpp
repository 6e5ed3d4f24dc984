/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/confirmation_tracker.hpp"

#include <algorithm>

#include "app/configuration.hpp"
#include "chain/chain_client.hpp"

namespace attestor::attestation {

  ConfirmationTracker::ConfirmationTracker(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config,
      qtils::SharedRef<chain::ChainClient> chain_client)
      : log_{logsys->getLogger("Confirmation", "attestation")},
        app_config_{std::move(app_config)},
        chain_client_{std::move(chain_client)} {}

  outcome::result<ConfirmationStatus> ConfirmationTracker::poll(
      const AttestationObligation &obligation,
      std::vector<SubmissionAttempt> &attempts,
      BlockNumber block) {
    const auto interval =
        std::max<uint64_t>(app_config_->attestation().confirmation_poll_interval,
                           1);
    if (last_poll_.has_value() and last_poll_->epoch_id == obligation.epoch_id
        and last_poll_->attempts == attempts.size()
        and block < last_poll_->block + interval) {
      return last_poll_->status;
    }
    OUTCOME_TRY(status, check(obligation, attempts));
    last_poll_ = LastPoll{
        .epoch_id = obligation.epoch_id,
        .attempts = attempts.size(),
        .block = block,
        .status = status,
    };
    return status;
  }

  outcome::result<AttemptStatus> ConfirmationTracker::attemptStatus(
      const SubmissionAttempt &attempt) {
    auto status_res =
        chain_client_->transactionStatus(attempt.transaction_hash);
    if (not status_res.has_value()) {
      if (status_res.error()
          == chain::ChainQueryError::TRANSACTION_NOT_FOUND) {
        return AttemptStatus::Pending;
      }
      return status_res.error();
    }
    auto &status = status_res.value();
    if (status.finality_status == chain::FinalityStatus::REJECTED) {
      return AttemptStatus::Rejected;
    }
    if (status.reverted()) {
      SL_DEBUG(log_,
               "Tx {} reverted: {}",
               attempt.transaction_hash,
               status.failure_reason.value_or(""));
      return AttemptStatus::Reverted;
    }
    if (status.accepted()) {
      return AttemptStatus::Included;
    }
    return AttemptStatus::Pending;
  }

  outcome::result<ConfirmationStatus> ConfirmationTracker::check(
      const AttestationObligation &obligation,
      std::vector<SubmissionAttempt> &attempts) {
    for (auto it = attempts.rbegin(); it != attempts.rend(); ++it) {
      if (it->status != AttemptStatus::Pending) {
        continue;
      }
      OUTCOME_TRY(status, attemptStatus(*it));
      it->status = status;
      if (status == AttemptStatus::Included) {
        return ConfirmationStatus::ConfirmedBySelf;
      }
    }

    OUTCOME_TRY(events,
                chain_client_->attestationEvents(
                    obligation.info.staker_address,
                    obligation.info.epoch.starting_block));
    for (auto &event : events) {
      if (event.epoch_id != obligation.epoch_id) {
        continue;
      }
      auto own = std::ranges::find_if(attempts, [&](const auto &attempt) {
        return attempt.transaction_hash == event.transaction_hash;
      });
      if (own != attempts.end()) {
        own->status = AttemptStatus::Included;
        return ConfirmationStatus::ConfirmedBySelf;
      }
      SL_DEBUG(log_,
               "Epoch {} attested by tx {}",
               obligation.epoch_id,
               event.transaction_hash);
      return ConfirmationStatus::ConfirmedByOther;
    }

    if (attempts.empty()) {
      return ConfirmationStatus::NotYet;
    }
    auto pending = std::ranges::any_of(attempts, [](const auto &attempt) {
      return attempt.status == AttemptStatus::Pending;
    });
    return pending ? ConfirmationStatus::Pending : ConfirmationStatus::Rejected;
  }

}  // namespace attestor::attestation
