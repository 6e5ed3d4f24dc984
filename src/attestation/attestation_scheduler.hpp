/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <qtils/shared_ref.hpp>

#include "attestation/confirmation_tracker.hpp"
#include "attestation/obligation.hpp"
#include "attestation/retry_policy.hpp"
#include "clock/clock.hpp"
#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace attestor::app {
  class Configuration;
  class StateManager;
}  // namespace attestor::app

namespace attestor::chain {
  class ChainClient;
}  // namespace attestor::chain

namespace attestor::metrics {
  class Metrics;
}  // namespace attestor::metrics

namespace attestor::observer {
  class LatestBlock;
}  // namespace attestor::observer

namespace attestor::attestation {
  class EpochTracker;
  class TransactionSubmitter;
  class WindowEvaluator;

  /**
   * Per-epoch attestation state machine:
   *
   *   Idle -> WaitingForAssignedBlock -> Attesting -> AwaitingConfirmation
   *        -> Confirmed | Missed
   *
   * Driven by `onBlock` from its own worker thread, which wakes on a new
   * block in the latest block slot or on a retry timeout. At most one
   * obligation is non-terminal at a time; epochs only move forward.
   */
  class AttestationScheduler {
   public:
    using Observers = std::vector<std::shared_ptr<ObligationObserver>>;

    AttestationScheduler(
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
        Observers observers);
    ~AttestationScheduler();

    void start();
    void stop();

    /// Processes @param block as the latest known block
    void onBlock(BlockNumber block);

    /// Does not wait for a block being processed
    ObligationState state() const;

    std::optional<AttestationObligation> obligation() const;

    std::vector<SubmissionAttempt> attempts() const;

    /// Own transactions of superseded epochs still awaiting a final status
    std::vector<SubmissionAttempt> abandoned() const;

   private:
    void closeWindow(BlockNumber block);
    bool enterEpoch(const AttestationInfo &info, BlockNumber block);
    void resolveAbandoned(BlockNumber block);
    void advance(BlockNumber block);
    void attest(BlockNumber block);
    void confirm(ConfirmationStatus status, BlockNumber block);
    void onFailure(const std::error_code &error);
    bool hasPendingAttempt() const;
    /// Copies state and obligation to the snapshot read by status queries
    void publish();
    void setState(ObligationState state,
                  BlockNumber block,
                  std::optional<SubmissionAttempt> attempt = std::nullopt,
                  bool by_other = false);

    log::Logger log_;
    qtils::SharedRef<app::Configuration> app_config_;
    qtils::SharedRef<clock::SteadyClock> clock_;
    qtils::SharedRef<observer::LatestBlock> latest_block_;
    qtils::SharedRef<chain::ChainClient> chain_client_;
    qtils::SharedRef<EpochTracker> epoch_tracker_;
    qtils::SharedRef<WindowEvaluator> window_evaluator_;
    qtils::SharedRef<TransactionSubmitter> submitter_;
    qtils::SharedRef<ConfirmationTracker> confirmation_tracker_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    Observers observers_;
    RetryPolicy retry_policy_;

    mutable std::mutex mutex_;
    ObligationState state_ = ObligationState::Idle;
    std::optional<AttestationObligation> obligation_;
    std::vector<SubmissionAttempt> attempts_;
    std::vector<SubmissionAttempt> abandoned_;
    /// Existing attestations were looked up before the first submission
    bool checked_existing_ = false;
    /// A terminal error stopped submissions until the window closes
    bool gave_up_ = false;
    size_t retry_count_ = 0;
    std::optional<clock::SteadyClock::TimePoint> next_retry_at_;
    BlockNumber last_submit_block_ = 0;
    std::optional<EpochId> unassignable_epoch_;

    struct Snapshot {
      ObligationState state = ObligationState::Idle;
      std::optional<AttestationObligation> obligation;
    };
    utils::SafeObject<Snapshot> snapshot_;

    std::atomic_bool stopped_ = false;
    std::optional<std::thread> thread_;
  };

}  // namespace attestor::attestation
