/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/felt.hpp"

namespace attestor::crypto {

  enum class StarkCurveError : uint8_t {
    INVALID_PRIVATE_KEY = 1,
    MESSAGE_HASH_OUT_OF_RANGE,
    INVALID_K,
  };

  /// Point on y^2 = x^3 + alpha * x + beta over the Starknet field
  struct AffinePoint {
    Felt x;
    Felt y;
    bool infinity = false;

    bool operator==(const AffinePoint &) const = default;
  };

  struct StarkSignature {
    Felt r;
    Felt s;

    bool operator==(const StarkSignature &) const = default;
  };

  /// Order of the curve group
  const uint256_t &curveOrder();

  const AffinePoint &generator();

  /**
   * k * point with OpenSSL over the Stark curve group; the scalar is
   * reduced modulo the curve order and processed in constant time.
   * Throws std::invalid_argument if @param point is not on the curve.
   */
  AffinePoint multiply(const uint256_t &k, const AffinePoint &point);

  AffinePoint add(const AffinePoint &a, const AffinePoint &b);

  bool isOnCurve(const AffinePoint &point);

  /// Public key (full point) of @param private_key
  outcome::result<AffinePoint> derivePublicKey(const Felt &private_key);

  /**
   * ECDSA over the Stark curve with a deterministic nonce. When the nonce
   * leads to an out-of-range r or s, signing is repeated with an
   * incremented seed.
   */
  outcome::result<StarkSignature> sign(const Felt &private_key,
                                       const Felt &message_hash);

  /// Signing attempt with a fixed nonce
  outcome::result<StarkSignature> signWithK(const Felt &private_key,
                                            const Felt &message_hash,
                                            const uint256_t &k);

  bool verify(const AffinePoint &public_key,
              const Felt &message_hash,
              const StarkSignature &signature);

}  // namespace attestor::crypto

OUTCOME_HPP_DECLARE_ERROR(attestor::crypto, StarkCurveError);
