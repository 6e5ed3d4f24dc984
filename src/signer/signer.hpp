/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/outcome.hpp>

#include "signer/signing_error.hpp"
#include "types/invoke_transaction.hpp"

namespace attestor::signer {

  using Signature = std::vector<Felt>;

  /**
   * Produces signatures of the operational account. Failures are reported
   * as `SigningError` and never retried by the signer itself.
   */
  class Signer {
   public:
    virtual ~Signer() = default;

    /// Stark public key (x coordinate)
    virtual outcome::result<Felt> publicKey() = 0;

    /**
     * Signs @param tx. @param hash is its transaction hash for
     * @param chain_id, computed by the caller.
     * @return signature elements, `[r, s]` for a plain Stark key
     */
    virtual outcome::result<Signature> sign(const InvokeTransactionV3 &tx,
                                            const TransactionHash &hash,
                                            const ChainId &chain_id) = 0;
  };

}  // namespace attestor::signer
