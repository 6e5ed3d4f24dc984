/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/epoch.hpp"

namespace attestor {

  /**
   * @struct AttestationInfo
   * Staker data as returned by the staking contract
   * (`get_attestation_info_by_operational_address`), completed with the
   * attestation window of the attestation contract
   */
  struct AttestationInfo {
    ContractAddress staker_address;
    ContractAddress operational_address;
    /// u128 amount of staked STRK
    Felt stake;
    Epoch epoch;
    /// Number of blocks after the assigned block an attestation is valid for
    uint64_t attestation_window = 0;

    bool operator==(const AttestationInfo &) const = default;
  };

}  // namespace attestor
