/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/attestation_info.hpp"

namespace attestor::app {
  class Configuration;
}  // namespace attestor::app

namespace attestor::chain {
  class ChainClient;
}  // namespace attestor::chain

namespace attestor::attestation {

  /**
   * Maps block numbers to the staking epoch and staker parameters.
   * Parameters are re-read from the staking contract only when a block
   * falls outside the cached epoch.
   */
  class EpochTracker {
   public:
    EpochTracker(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<app::Configuration> app_config,
                 qtils::SharedRef<chain::ChainClient> chain_client);

    /// Fails with `ChainQueryError` if the contracts can not be read
    outcome::result<AttestationInfo> epochAt(BlockNumber block);

    const std::optional<AttestationInfo> &cached() const {
      return cached_;
    }

   private:
    log::Logger log_;
    qtils::SharedRef<app::Configuration> app_config_;
    qtils::SharedRef<chain::ChainClient> chain_client_;
    std::optional<AttestationInfo> cached_;
  };

}  // namespace attestor::attestation
