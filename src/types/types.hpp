/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cinttypes>

#include "types/felt.hpp"

namespace attestor {

  using BlockNumber = uint64_t;

  using EpochId = uint64_t;

  using Nonce = Felt;

  using TransactionHash = Felt;

  using ContractAddress = Felt;

  using ChainId = Felt;

}  // namespace attestor
