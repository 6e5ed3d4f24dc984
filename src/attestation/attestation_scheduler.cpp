/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/attestation_scheduler.hpp"

#include <algorithm>

#include "app/configuration.hpp"
#include "app/state_manager.hpp"
#include "attestation/epoch_tracker.hpp"
#include "attestation/transaction_submitter.hpp"
#include "attestation/window_evaluator.hpp"
#include "chain/chain_client.hpp"
#include "metrics/metrics.hpp"
#include "observer/latest_block.hpp"

namespace attestor::attestation {

  AttestationScheduler::AttestationScheduler(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::StateManager> state_manager,
      qtils::SharedRef<app::Configuration> app_config,
      qtils::SharedRef<clock::SteadyClock> clock,
      qtils::SharedRef<observer::LatestBlock> latest_block,
      qtils::SharedRef<chain::ChainClient> chain_client,
      qtils::SharedRef<EpochTracker> epoch_tracker,
      qtils::SharedRef<WindowEvaluator> window_evaluator,
      qtils::SharedRef<TransactionSubmitter> submitter,
      qtils::SharedRef<ConfirmationTracker> confirmation_tracker,
      qtils::SharedRef<metrics::Metrics> metrics,
      Observers observers)
      : log_{logsys->getLogger("Scheduler", "attestation")},
        app_config_{std::move(app_config)},
        clock_{std::move(clock)},
        latest_block_{std::move(latest_block)},
        chain_client_{std::move(chain_client)},
        epoch_tracker_{std::move(epoch_tracker)},
        window_evaluator_{std::move(window_evaluator)},
        submitter_{std::move(submitter)},
        confirmation_tracker_{std::move(confirmation_tracker)},
        metrics_{std::move(metrics)},
        observers_{std::move(observers)},
        retry_policy_{app_config_->attestation().retry_initial_backoff,
                      app_config_->attestation().retry_max_backoff} {
    state_manager->takeControl(*this);
  }

  AttestationScheduler::~AttestationScheduler() {
    stop();
  }

  void AttestationScheduler::start() {
    const auto idle_timeout = app_config_->node().block_poll_interval;
    thread_.emplace([this, idle_timeout] {
      while (not stopped_) {
        auto timeout = idle_timeout;
        {
          std::lock_guard lock{mutex_};
          if (next_retry_at_.has_value()) {
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    *next_retry_at_ - clock_->now());
            if (remaining <= std::chrono::milliseconds::zero()) {
              // one immediate pass, a new failure schedules the next one
              next_retry_at_.reset();
            }
            timeout = std::clamp(
                remaining, std::chrono::milliseconds::zero(), idle_timeout);
          }
        }
        auto latest = latest_block_->wait(timeout);
        if (stopped_) {
          break;
        }
        if (latest.has_value()) {
          onBlock(latest.value());
        }
      }
    });
  }

  void AttestationScheduler::stop() {
    stopped_ = true;
    latest_block_->wakeUp();
    if (thread_.has_value() and thread_->joinable()) {
      thread_->join();
    }
  }

  ObligationState AttestationScheduler::state() const {
    return snapshot_.sharedAccess(
        [](const Snapshot &snapshot) { return snapshot.state; });
  }

  std::optional<AttestationObligation> AttestationScheduler::obligation()
      const {
    return snapshot_.sharedAccess(
        [](const Snapshot &snapshot) { return snapshot.obligation; });
  }

  std::vector<SubmissionAttempt> AttestationScheduler::attempts() const {
    std::lock_guard lock{mutex_};
    return attempts_;
  }

  std::vector<SubmissionAttempt> AttestationScheduler::abandoned() const {
    std::lock_guard lock{mutex_};
    return abandoned_;
  }

  void AttestationScheduler::onBlock(BlockNumber block) {
    std::lock_guard lock{mutex_};
    metrics_->latest_block_number()->set(block);

    closeWindow(block);

    auto info_res = epoch_tracker_->epochAt(block);
    if (not info_res.has_value()) {
      SL_WARN(log_,
              "Staking parameters for block {} unavailable: {}",
              block,
              info_res.error());
      return;
    }
    if (not enterEpoch(info_res.value(), block)) {
      return;
    }
    resolveAbandoned(block);
    advance(block);
  }

  void AttestationScheduler::closeWindow(BlockNumber block) {
    if (not obligation_.has_value() or isTerminal(state_)
        or block < obligation_->window_end) {
      return;
    }
    // an attestation may have landed in the last blocks of the window
    auto status_res = confirmation_tracker_->check(*obligation_, attempts_);
    if (status_res.has_value() and isConfirmed(status_res.value())) {
      confirm(status_res.value(), block);
      return;
    }
    if (not status_res.has_value()) {
      SL_WARN(log_,
              "Final confirmation check of epoch {} failed: {}",
              obligation_->epoch_id,
              status_res.error());
    }
    setState(ObligationState::Missed, block);
  }

  bool AttestationScheduler::enterEpoch(const AttestationInfo &info,
                                        BlockNumber block) {
    if (obligation_.has_value()) {
      if (info.epoch.id < obligation_->epoch_id) {
        SL_DEBUG(log_,
                 "Ignoring stale {} while in epoch {}",
                 info.epoch,
                 obligation_->epoch_id);
        return false;
      }
      if (info.epoch.id == obligation_->epoch_id) {
        return true;
      }
    }

    auto window_res = window_evaluator_->evaluate(info);
    if (not window_res.has_value()) {
      if (unassignable_epoch_ != info.epoch.id) {
        SL_ERROR(log_,
                 "No attestation assignment in {}: {}",
                 info.epoch,
                 window_res.error());
        unassignable_epoch_ = info.epoch.id;
      }
      return false;
    }

    if (obligation_.has_value()) {
      if (not isTerminal(state_)) {
        SL_WARN(log_,
                "Epoch {} superseded by {} in state {}",
                obligation_->epoch_id,
                info.epoch.id,
                state_);
        setState(ObligationState::Missed, block);
      }
      for (auto &attempt : attempts_) {
        if (attempt.status == AttemptStatus::Pending) {
          abandoned_.push_back(attempt);
        }
      }
    }

    state_ = ObligationState::Idle;
    obligation_ = AttestationObligation{
        .epoch_id = info.epoch.id,
        .assigned_block = window_res.value().assigned_block,
        .window_end = window_res.value().window_end,
        .target_block_hash = std::nullopt,
        .info = info,
    };
    attempts_.clear();
    checked_existing_ = false;
    gave_up_ = false;
    retry_count_ = 0;
    next_retry_at_.reset();
    last_submit_block_ = 0;

    setState(ObligationState::WaitingForAssignedBlock, block);
    closeWindow(block);
    return true;
  }

  void AttestationScheduler::resolveAbandoned(BlockNumber block) {
    const auto ttl = obligation_->info.epoch.length;
    std::erase_if(abandoned_, [&](const SubmissionAttempt &attempt) {
      auto status_res = confirmation_tracker_->attemptStatus(attempt);
      if (not status_res.has_value()) {
        return false;
      }
      switch (status_res.value()) {
        case AttemptStatus::Pending:
          if (block >= attempt.submitted_at + 2 * ttl) {
            SL_WARN(log_,
                    "Gave up tracking tx {} of epoch {}",
                    attempt.transaction_hash,
                    attempt.epoch_id);
            metrics_->attestations_failed()->inc();
            return true;
          }
          return false;
        case AttemptStatus::Included:
          SL_INFO(log_,
                  "Tx {} of epoch {} included after the epoch closed",
                  attempt.transaction_hash,
                  attempt.epoch_id);
          metrics_->confirmations_observed({{"source", "self"}})->inc();
          return true;
        case AttemptStatus::Rejected:
        case AttemptStatus::Reverted:
          SL_INFO(log_,
                  "Tx {} of epoch {} failed after the epoch closed",
                  attempt.transaction_hash,
                  attempt.epoch_id);
          metrics_->attestations_failed()->inc();
          if (status_res.value() == AttemptStatus::Rejected
              and not hasPendingAttempt()) {
            submitter_->discardPending();
          }
          return true;
      }
      return true;
    });
  }

  void AttestationScheduler::advance(BlockNumber block) {
    const auto &config = app_config_->attestation();

    if (state_ == ObligationState::WaitingForAssignedBlock) {
      if (block < obligation_->assigned_block + config.min_attestation_delay) {
        return;
      }
      setState(ObligationState::Attesting, block);
    }

    if (state_ == ObligationState::AwaitingConfirmation) {
      auto status_res =
          confirmation_tracker_->poll(*obligation_, attempts_, block);
      if (not status_res.has_value()) {
        SL_WARN(log_,
                "Confirmation poll of epoch {} failed: {}",
                obligation_->epoch_id,
                status_res.error());
        return;
      }
      auto status = status_res.value();
      if (isConfirmed(status)) {
        confirm(status, block);
        return;
      }
      if (status == ConfirmationStatus::Rejected) {
        SL_WARN(log_,
                "Attestation of epoch {} rejected, resubmitting",
                obligation_->epoch_id);
        submitter_->discardPending();
      } else if (block >= last_submit_block_ + config.resubmit_interval) {
        SL_INFO(log_,
                "Attestation of epoch {} not included since block {}, "
                "resubmitting",
                obligation_->epoch_id,
                last_submit_block_);
      } else {
        return;
      }
      setState(ObligationState::Attesting, block);
    }

    if (state_ == ObligationState::Attesting) {
      attest(block);
    }
  }

  void AttestationScheduler::attest(BlockNumber block) {
    if (gave_up_) {
      return;
    }
    if (next_retry_at_.has_value() and clock_->now() < *next_retry_at_) {
      return;
    }

    if (not checked_existing_) {
      auto status_res = confirmation_tracker_->check(*obligation_, attempts_);
      if (not status_res.has_value()) {
        onFailure(status_res.error());
        return;
      }
      if (isConfirmed(status_res.value())) {
        confirm(status_res.value(), block);
        return;
      }
      checked_existing_ = true;
    }

    if (not obligation_->target_block_hash.has_value()) {
      auto header_res = chain_client_->blockByNumber(obligation_->assigned_block);
      if (not header_res.has_value()) {
        onFailure(header_res.error());
        return;
      }
      obligation_->target_block_hash = header_res.value().hash;
      publish();
    }

    auto attempt_res = submitter_->submit(*obligation_, block);
    if (not attempt_res.has_value()) {
      onFailure(attempt_res.error());
      return;
    }
    attempts_.push_back(attempt_res.value());
    retry_count_ = 0;
    next_retry_at_.reset();
    last_submit_block_ = block;
    setState(ObligationState::AwaitingConfirmation, block, attempt_res.value());
  }

  void AttestationScheduler::confirm(ConfirmationStatus status,
                                     BlockNumber block) {
    std::optional<SubmissionAttempt> own;
    auto it = std::ranges::find_if(attempts_, [](const auto &attempt) {
      return attempt.status == AttemptStatus::Included;
    });
    if (it != attempts_.end()) {
      own = *it;
    }
    setState(ObligationState::Confirmed,
             block,
             own,
             status == ConfirmationStatus::ConfirmedByOther);
  }

  void AttestationScheduler::onFailure(const std::error_code &error) {
    if (RetryPolicy::classify(error) == ErrorClass::Terminal) {
      SL_ERROR(log_,
               "Giving up attestation of epoch {}: {}",
               obligation_->epoch_id,
               error);
      gave_up_ = true;
      next_retry_at_.reset();
      return;
    }
    auto delay = retry_policy_.delay(retry_count_++);
    next_retry_at_ = clock_->now() + delay;
    SL_WARN(log_,
            "Attestation of epoch {} failed: {}, retry {} in {}ms",
            obligation_->epoch_id,
            error,
            retry_count_,
            delay.count());
  }

  bool AttestationScheduler::hasPendingAttempt() const {
    return std::ranges::any_of(attempts_, [](const auto &attempt) {
      return attempt.status == AttemptStatus::Pending;
    });
  }

  void AttestationScheduler::publish() {
    snapshot_.exclusiveAccess([&](Snapshot &snapshot) {
      snapshot.state = state_;
      snapshot.obligation = obligation_;
    });
  }

  void AttestationScheduler::setState(ObligationState state,
                                      BlockNumber block,
                                      std::optional<SubmissionAttempt> attempt,
                                      bool by_other) {
    state_ = state;
    if (isTerminal(state)) {
      next_retry_at_.reset();
    }
    publish();
    const auto &obligation = obligation_.value();
    switch (state) {
      case ObligationState::WaitingForAssignedBlock:
        SL_INFO(log_,
                "Epoch {}: assigned block {}, window ends at {}",
                obligation.epoch_id,
                obligation.assigned_block,
                obligation.window_end);
        break;
      case ObligationState::Confirmed:
        SL_INFO(log_,
                "Epoch {} attested{} at block {}",
                obligation.epoch_id,
                by_other ? " by another transaction" : "",
                block);
        break;
      case ObligationState::Missed:
        SL_WARN(log_,
                "Epoch {} missed: window [{}, {}) closed at block {}",
                obligation.epoch_id,
                obligation.assigned_block,
                obligation.window_end,
                block);
        break;
      default:
        SL_DEBUG(log_,
                 "Epoch {} is {} at block {}",
                 obligation.epoch_id,
                 state,
                 block);
        break;
    }
    ObligationEvent event{
        .obligation = obligation,
        .state = state,
        .block = block,
        .attempt = std::move(attempt),
        .by_other = by_other,
    };
    for (auto &observer : observers_) {
      observer->onObligationEvent(event);
    }
  }

}  // namespace attestor::attestation
