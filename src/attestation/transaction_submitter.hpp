/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "attestation/obligation.hpp"
#include "log/logger.hpp"
#include "types/invoke_transaction.hpp"

namespace attestor::app {
  class Configuration;
}  // namespace attestor::app

namespace attestor::chain {
  class ChainClient;
  struct FeeEstimate;
}  // namespace attestor::chain

namespace attestor::metrics {
  class Metrics;
}  // namespace attestor::metrics

namespace attestor::signer {
  class Signer;
}  // namespace attestor::signer

namespace attestor::attestation {
  class AccountState;
  class NonceReservation;

  /**
   * Builds, signs and sends the `attest` invoke transaction of an
   * obligation. Holds the account nonce for the whole attempt; the nonce
   * is consumed only when the node accepts the transaction.
   */
  class TransactionSubmitter {
   public:
    TransactionSubmitter(qtils::SharedRef<log::LoggingSystem> logsys,
                         qtils::SharedRef<app::Configuration> app_config,
                         qtils::SharedRef<chain::ChainClient> chain_client,
                         qtils::SharedRef<signer::Signer> signer,
                         qtils::SharedRef<AccountState> account_state,
                         qtils::SharedRef<metrics::Metrics> metrics);

    /**
     * On a nonce conflict the account is re-read and the transaction is
     * rebuilt once. Every surfaced error counts as a failure.
     * @param block latest block, recorded as submission block
     */
    outcome::result<SubmissionAttempt> submit(
        const AttestationObligation &obligation, BlockNumber block);

    /// Earlier accepted transactions failed, the next nonce comes from chain
    void discardPending();

    /// Unsigned transaction attesting @param block_hash, without fee fields
    InvokeTransactionV3 buildTransaction(const Felt &block_hash,
                                         const Nonce &nonce) const;

    /// Resource bounds scaled by the configured fee multiplier
    ResourceBoundsMapping resourceBounds(
        const chain::FeeEstimate &estimate) const;

   private:
    outcome::result<SubmissionAttempt> trySubmit(
        const AttestationObligation &obligation,
        BlockNumber block,
        NonceReservation &reservation);

    uint64_t currentTip();

    log::Logger log_;
    qtils::SharedRef<app::Configuration> app_config_;
    qtils::SharedRef<chain::ChainClient> chain_client_;
    qtils::SharedRef<signer::Signer> signer_;
    qtils::SharedRef<AccountState> account_state_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    Felt attest_selector_;
  };

}  // namespace attestor::attestation
