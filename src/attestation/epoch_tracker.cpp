/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/epoch_tracker.hpp"

#include "app/configuration.hpp"
#include "chain/chain_client.hpp"

namespace attestor::attestation {

  EpochTracker::EpochTracker(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::Configuration> app_config,
      qtils::SharedRef<chain::ChainClient> chain_client)
      : log_{logsys->getLogger("EpochTracker", "attestation")},
        app_config_{std::move(app_config)},
        chain_client_{std::move(chain_client)} {}

  outcome::result<AttestationInfo> EpochTracker::epochAt(BlockNumber block) {
    if (cached_.has_value() and cached_->epoch.contains(block)) {
      return cached_.value();
    }

    OUTCOME_TRY(info,
                chain_client_->attestationInfo(
                    app_config_->staking().operational_address));
    if (info.epoch.length == 0) {
      SL_WARN(log_, "Staking contract reported an empty {}", info.epoch);
      return chain::ChainQueryError::MALFORMED_RESPONSE;
    }

    if (cached_.has_value() and info.epoch.id == cached_->epoch.id + 1) {
      auto expected_start = cached_->epoch.endBlock();
      if (info.epoch.starting_block != expected_start) {
        SL_WARN(log_,
                "Epoch {} starts at {} but previous epoch ends at {}",
                info.epoch.id,
                info.epoch.starting_block,
                expected_start);
        info.epoch.starting_block = expected_start;
      }
    }

    // contract state lags behind the observed block
    while (block >= info.epoch.endBlock()) {
      info.epoch = info.epoch.next();
      SL_DEBUG(log_, "Advanced locally to {} for block {}", info.epoch, block);
    }

    if (not cached_.has_value() or cached_->epoch != info.epoch) {
      SL_INFO(log_,
              "Entered {}, stake {}, attestation window {}",
              info.epoch,
              info.stake,
              info.attestation_window);
    }
    cached_ = info;
    return info;
  }

}  // namespace attestor::attestation
