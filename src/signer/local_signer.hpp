/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "crypto/stark_curve.hpp"
#include "log/logger.hpp"
#include "signer/signer.hpp"

namespace attestor::signer {

  /// Holds the operational private key in memory and signs in-process
  class LocalSigner final : public Signer {
   public:
    /// Throws when @param private_key is not a valid Stark key
    LocalSigner(qtils::SharedRef<log::LoggingSystem> logsys,
                const Felt &private_key);

    outcome::result<Felt> publicKey() override;

    outcome::result<Signature> sign(const InvokeTransactionV3 &tx,
                                    const TransactionHash &hash,
                                    const ChainId &chain_id) override;

   private:
    log::Logger log_;
    Felt private_key_;
    crypto::AffinePoint public_key_;
  };

}  // namespace attestor::signer
