/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/felt.hpp"

namespace attestor::crypto {

  /**
   * Deterministic ECDSA nonce (RFC 6979, HMAC-SHA-256) for the Stark curve.
   * @param message_hash hashed message, below 2^251
   * @param private_key signer key
   * @param seed extra entropy, zero for the first attempt
   * @param order curve group order, the result lies in (0, order)
   */
  uint256_t generateK(const Felt &message_hash,
                      const uint256_t &private_key,
                      const uint256_t &seed,
                      const uint256_t &order);

}  // namespace attestor::crypto
