/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/transaction_submitter.hpp"

#include "app/configuration.hpp"
#include "attestation/account_state.hpp"
#include "attestation/tip.hpp"
#include "chain/chain_client.hpp"
#include "crypto/selector.hpp"
#include "metrics/metrics.hpp"
#include "signer/signer.hpp"

namespace attestor::attestation {

  TransactionSubmitter::TransactionSubmitter(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config,
      qtils::SharedRef<chain::ChainClient> chain_client,
      qtils::SharedRef<signer::Signer> signer,
      qtils::SharedRef<AccountState> account_state,
      qtils::SharedRef<metrics::Metrics> metrics)
      : log_{logsys->getLogger("Submitter", "attestation")},
        app_config_{std::move(app_config)},
        chain_client_{std::move(chain_client)},
        signer_{std::move(signer)},
        account_state_{std::move(account_state)},
        metrics_{std::move(metrics)},
        attest_selector_{crypto::selectorFromName("attest")} {}

  InvokeTransactionV3 TransactionSubmitter::buildTransaction(
      const Felt &block_hash, const Nonce &nonce) const {
    InvokeTransactionV3 tx;
    tx.sender_address = account_state_->address();
    tx.calldata = encodeExecuteCalldata({
        Call{
            .to = app_config_->staking().attestation_contract,
            .selector = attest_selector_,
            .calldata = {block_hash},
        },
    });
    tx.nonce = nonce;
    return tx;
  }

  ResourceBoundsMapping TransactionSubmitter::resourceBounds(
      const chain::FeeEstimate &estimate) const {
    const auto percent = app_config_->attestation().fee_multiplier_percent;
    auto scale = [&](const Felt &value) {
      return Felt::fromBig(value.value() * percent / 100);
    };
    auto bounds = [&](const Felt &amount, const Felt &price) {
      return ResourceBounds{
          .max_amount = scale(amount),
          .max_price_per_unit = scale(price),
      };
    };
    return {
        .l1_gas = bounds(estimate.l1_gas_consumed, estimate.l1_gas_price),
        .l1_data_gas = bounds(estimate.l1_data_gas_consumed,
                              estimate.l1_data_gas_price),
        .l2_gas = bounds(estimate.l2_gas_consumed, estimate.l2_gas_price),
    };
  }

  uint64_t TransactionSubmitter::currentTip() {
    const auto &config = app_config_->attestation();
    TipParams params{
        .tip_boost = config.tip_boost,
        .minimum_tip = config.minimum_tip,
    };
    auto tips_res = chain_client_->latestBlockTips();
    if (not tips_res.has_value()) {
      SL_DEBUG(log_, "Tips unavailable, using minimum: {}", tips_res.error());
      return params.minimum_tip;
    }
    return calculateTip(params, medianTip(tips_res.value()));
  }

  outcome::result<SubmissionAttempt> TransactionSubmitter::submit(
      const AttestationObligation &obligation, BlockNumber block) {
    auto reservation = account_state_->reserve();
    auto attempt_res = [&]() -> outcome::result<SubmissionAttempt> {
      OUTCOME_TRY(reservation.refresh());
      auto first_res = trySubmit(obligation, block, reservation);
      if (first_res.has_value()
          or first_res.error() != chain::SubmissionError::NONCE_CONFLICT) {
        return first_res;
      }
      SL_INFO(log_,
              "Nonce conflict for epoch {}, refreshing account",
              obligation.epoch_id);
      OUTCOME_TRY(reservation.resync());
      return trySubmit(obligation, block, reservation);
    }();
    if (not attempt_res.has_value()) {
      metrics_->attestations_failed()->inc();
      SL_WARN(log_,
              "Attestation for epoch {} not submitted: {}",
              obligation.epoch_id,
              attempt_res.error());
    }
    return attempt_res;
  }

  void TransactionSubmitter::discardPending() {
    account_state_->discardPending();
  }

  outcome::result<SubmissionAttempt> TransactionSubmitter::trySubmit(
      const AttestationObligation &obligation,
      BlockNumber block,
      NonceReservation &reservation) {
    const auto &chain_id = app_config_->staking().chain_id;
    OUTCOME_TRY(nonce, reservation.nonce());

    auto tx = buildTransaction(obligation.target_block_hash.value(), nonce);
    OUTCOME_TRY(estimate, chain_client_->estimateFee(tx));
    tx.resource_bounds = resourceBounds(estimate);
    tx.tip = Felt{currentTip()};

    auto hash = transactionHash(tx, chain_id);
    OUTCOME_TRY(signature, signer_->sign(tx, hash, chain_id));
    tx.signature = std::move(signature);

    OUTCOME_TRY(accepted_hash, chain_client_->submitTransaction(tx));
    if (accepted_hash != hash) {
      SL_WARN(log_,
              "Node returned hash {}, computed {}",
              accepted_hash,
              hash);
    }
    reservation.commit();
    metrics_->attestations_submitted()->inc();
    SL_INFO(log_,
            "Attestation for epoch {} sent: tx {}, nonce {}, fee {}",
            obligation.epoch_id,
            accepted_hash,
            nonce,
            estimate.overall_fee);
    return SubmissionAttempt{
        .epoch_id = obligation.epoch_id,
        .nonce = nonce,
        .transaction_hash = accepted_hash,
        .submitted_at = block,
        .status = AttemptStatus::Pending,
    };
  }

}  // namespace attestor::attestation
