/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <mutex>
#include <optional>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/types.hpp"
#include "utils/ctor_limiters.hpp"

namespace attestor::app {
  class Configuration;
}  // namespace attestor::app

namespace attestor::chain {
  class ChainClient;
}  // namespace attestor::chain

namespace attestor::metrics {
  class Metrics;
}  // namespace attestor::metrics

namespace attestor::attestation {
  class AccountState;

  /**
   * Exclusive right to use the account nonce, held for one submission
   * attempt. Nonce reads and the increment after an accepted transaction
   * happen under the same lock.
   */
  class NonceReservation : NonCopyable {
   public:
    NonceReservation(NonceReservation &&) = default;

    /**
     * Re-reads nonce and balance from the chain. While an own accepted
     * transaction is not reflected by the node yet, the local nonce is
     * kept if it is ahead of the chain.
     */
    outcome::result<void> refresh();

    /// Takes the chain nonce as is, e.g. after the node reported a conflict
    outcome::result<void> resync();

    /// Nonce for the next transaction; refreshes once if still unknown
    outcome::result<Nonce> nonce();

    /// Marks the current nonce as used by an accepted transaction
    void commit();

   private:
    friend class AccountState;
    NonceReservation(AccountState &state, std::unique_lock<std::mutex> lock);

    AccountState *state_;
    std::unique_lock<std::mutex> lock_;
  };

  /// Operational account, the single place nonces are allocated from
  class AccountState {
   public:
    AccountState(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<app::Configuration> app_config,
                 qtils::SharedRef<chain::ChainClient> chain_client,
                 qtils::SharedRef<metrics::Metrics> metrics);

    /// Blocks while another attempt holds the nonce
    NonceReservation reserve();

    const ContractAddress &address() const {
      return address_;
    }

    std::optional<Nonce> lastKnownNonce() const;

    std::optional<uint256_t> balance() const;

    /// Own accepted transactions will not land, trust the chain nonce again
    void discardPending();

   private:
    friend class NonceReservation;

    outcome::result<void> refreshLocked(bool keep_pending);

    log::Logger log_;
    qtils::SharedRef<chain::ChainClient> chain_client_;
    qtils::SharedRef<metrics::Metrics> metrics_;
    ContractAddress address_;

    mutable std::mutex mutex_;
    std::optional<Nonce> nonce_;
    /// Nonce after the last accepted own transaction
    std::optional<Nonce> pending_next_;
    std::optional<uint256_t> balance_;
  };

}  // namespace attestor::attestation
