/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "signer/signer.hpp"
#include "utils/uri.hpp"

namespace attestor::app {
  class Configuration;
}  // namespace attestor::app

namespace attestor::signer {

  /**
   * Delegates signing to an external HTTP service.
   * Default protocol: `POST /sign {transaction, chain_id}`.
   * Legacy protocol: `GET /get_public_key`, `POST /sign_hash {hash}`.
   * Both answer `{"signature": [r, s, ...]}`.
   */
  class RemoteSigner final : public Signer {
   public:
    RemoteSigner(qtils::SharedRef<log::LoggingSystem> logsys,
                 qtils::SharedRef<app::Configuration> app_config);

    outcome::result<Felt> publicKey() override;

    outcome::result<Signature> sign(const InvokeTransactionV3 &tx,
                                    const TransactionHash &hash,
                                    const ChainId &chain_id) override;

    /// Body of `/sign` for @param tx, the signature member is left empty
    static std::string encodeSignRequest(const InvokeTransactionV3 &tx,
                                         const ChainId &chain_id);

    static outcome::result<Signature> decodeSignature(std::string_view body);

    static outcome::result<Felt> decodePublicKey(std::string_view body);

   private:
    outcome::result<std::string> post(std::string_view path,
                                      std::string body);

    outcome::result<std::string> get(std::string_view path);

    log::Logger log_;
    qtils::SharedRef<app::Configuration> app_config_;
    Uri uri_;
    bool legacy_;
  };

}  // namespace attestor::signer
