/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/account_state.hpp"

#include "app/configuration.hpp"
#include "chain/chain_client.hpp"
#include "metrics/metrics.hpp"

namespace attestor::attestation {

  // 1 STRK = 10^18 fri
  constexpr double kFriPerStrk = 1e18;

  NonceReservation::NonceReservation(AccountState &state,
                                     std::unique_lock<std::mutex> lock)
      : state_{&state}, lock_{std::move(lock)} {}

  outcome::result<void> NonceReservation::refresh() {
    return state_->refreshLocked(true);
  }

  outcome::result<void> NonceReservation::resync() {
    return state_->refreshLocked(false);
  }

  outcome::result<Nonce> NonceReservation::nonce() {
    if (not state_->nonce_.has_value()) {
      OUTCOME_TRY(refresh());
    }
    return state_->nonce_.value();
  }

  void NonceReservation::commit() {
    if (state_->nonce_.has_value()) {
      state_->nonce_ = state_->nonce_.value() + Felt{1};
      state_->pending_next_ = state_->nonce_;
    }
  }

  AccountState::AccountState(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config,
      qtils::SharedRef<chain::ChainClient> chain_client,
      qtils::SharedRef<metrics::Metrics> metrics)
      : log_{logsys->getLogger("AccountState", "attestation")},
        chain_client_{std::move(chain_client)},
        metrics_{std::move(metrics)},
        address_{app_config->staking().operational_address} {}

  NonceReservation AccountState::reserve() {
    return NonceReservation{*this, std::unique_lock{mutex_}};
  }

  std::optional<Nonce> AccountState::lastKnownNonce() const {
    std::lock_guard lock{mutex_};
    return nonce_;
  }

  std::optional<uint256_t> AccountState::balance() const {
    std::lock_guard lock{mutex_};
    return balance_;
  }

  void AccountState::discardPending() {
    std::lock_guard lock{mutex_};
    if (pending_next_.has_value()) {
      SL_DEBUG(log_, "Dropped pending nonce {}", pending_next_.value());
      pending_next_.reset();
    }
  }

  outcome::result<void> AccountState::refreshLocked(bool keep_pending) {
    OUTCOME_TRY(chain_nonce, chain_client_->accountNonce(address_));
    Nonce nonce = chain_nonce;
    if (keep_pending and pending_next_.has_value()
        and nonce < pending_next_.value()) {
      SL_DEBUG(log_,
               "Node reports nonce {}, keeping pending {}",
               nonce,
               pending_next_.value());
      nonce = pending_next_.value();
    } else {
      pending_next_.reset();
    }
    if (nonce_.has_value() and nonce != nonce_.value()) {
      SL_DEBUG(log_, "Nonce moved from {} to {}", nonce_.value(), nonce);
    }
    nonce_ = nonce;

    // balance is informational, a failed read keeps the previous value
    auto balance_res = chain_client_->accountBalance(address_);
    if (balance_res.has_value()) {
      balance_ = balance_res.value();
      metrics_->operational_balance()->set(
          balance_res.value().convert_to<double>() / kFriPerStrk);
    } else {
      SL_DEBUG(log_, "Balance read failed: {}", balance_res.error());
    }
    return outcome::success();
  }

}  // namespace attestor::attestation
