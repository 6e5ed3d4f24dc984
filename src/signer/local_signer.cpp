/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signer/local_signer.hpp"

#include <qtils/error_throw.hpp>

namespace attestor::signer {

  LocalSigner::LocalSigner(qtils::SharedRef<log::LoggingSystem> logsys,
                           const Felt &private_key)
      : log_{logsys->getLogger("LocalSigner", "signer")},
        private_key_{private_key},
        public_key_{[&] {
          auto public_key_res = crypto::derivePublicKey(private_key);
          if (not public_key_res.has_value()) {
            qtils::raise(public_key_res.error());
          }
          return public_key_res.value();
        }()} {
    SL_INFO(log_, "Using local signer with public key {}", public_key_.x);
  }

  outcome::result<Felt> LocalSigner::publicKey() {
    return public_key_.x;
  }

  outcome::result<Signature> LocalSigner::sign(const InvokeTransactionV3 &,
                                               const TransactionHash &hash,
                                               const ChainId &) {
    auto signature_res = crypto::sign(private_key_, hash);
    if (not signature_res.has_value()) {
      SL_WARN(log_, "Failed to sign {}: {}", hash, signature_res.error());
      if (signature_res.error()
          == crypto::StarkCurveError::MESSAGE_HASH_OUT_OF_RANGE) {
        return SigningError::MESSAGE_HASH_OUT_OF_RANGE;
      }
      return SigningError::INVALID_KEY;
    }
    auto &signature = signature_res.value();
    SL_TRACE(log_, "Signed {}", hash);
    return Signature{signature.r, signature.s};
  }

}  // namespace attestor::signer
