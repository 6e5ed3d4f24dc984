/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signer/remote_signer.hpp"

#include <boost/beast/http/status.hpp>

#include "app/configuration.hpp"
#include "serde/json.hpp"
#include "utils/http.hpp"

namespace attestor::signer {
  namespace {
    struct SignRequest {
      InvokeTransactionV3 transaction;
      ChainId chain_id;

      JSON_FIELDS(transaction, chain_id)
    };

    struct SignHashRequest {
      Felt hash;

      JSON_FIELDS(hash)
    };

    struct SignatureResponse {
      std::vector<Felt> signature;

      JSON_FIELDS(signature)
    };

    struct PublicKeyResponse {
      Felt public_key;

      JSON_FIELDS(public_key)
    };
  }  // namespace

  RemoteSigner::RemoteSigner(qtils::SharedRef<log::LoggingSystem> logsys,
                             qtils::SharedRef<app::Configuration> app_config)
      : log_{logsys->getLogger("RemoteSigner", "signer")},
        app_config_{std::move(app_config)},
        uri_{Uri::parse(app_config_->signer().remote_url.value()).value()},
        legacy_{app_config_->signer().remote_legacy} {
    SL_INFO(log_,
            "Using remote signer at {}{}",
            uri_.toString(),
            legacy_ ? " (legacy protocol)" : "");
  }

  std::string RemoteSigner::encodeSignRequest(const InvokeTransactionV3 &tx,
                                              const ChainId &chain_id) {
    SignRequest request{.transaction = tx, .chain_id = chain_id};
    request.transaction.signature.clear();
    return json::encode(request);
  }

  outcome::result<Signature> RemoteSigner::decodeSignature(
      std::string_view body) {
    SignatureResponse response;
    try {
      json::decode(response, body);
    } catch (const json::JsonError &) {
      return SigningError::MALFORMED_RESPONSE;
    }
    if (response.signature.size() < 2) {
      return SigningError::MALFORMED_RESPONSE;
    }
    return std::move(response.signature);
  }

  outcome::result<Felt> RemoteSigner::decodePublicKey(std::string_view body) {
    PublicKeyResponse response;
    try {
      json::decode(response, body);
    } catch (const json::JsonError &) {
      return SigningError::MALFORMED_RESPONSE;
    }
    return response.public_key;
  }

  outcome::result<std::string> RemoteSigner::post(std::string_view path,
                                                  std::string body) {
    auto response_res = http::fetch({
        .method = boost::beast::http::verb::post,
        .uri = uri_.join(path),
        .body = std::move(body),
        .timeout = app_config_->signer().timeout,
    });
    if (not response_res.has_value()) {
      SL_WARN(log_, "POST {} failed: {}", path, response_res.error());
      return SigningError::SIGNER_UNAVAILABLE;
    }
    auto &response = response_res.value();
    if (response.result() != boost::beast::http::status::ok) {
      SL_WARN(log_, "POST {} http status {}", path, response.result_int());
      return SigningError::SIGNER_UNAVAILABLE;
    }
    return std::move(response.body());
  }

  outcome::result<std::string> RemoteSigner::get(std::string_view path) {
    auto response_res = http::fetch({
        .method = boost::beast::http::verb::get,
        .uri = uri_.join(path),
        .timeout = app_config_->signer().timeout,
    });
    if (not response_res.has_value()) {
      SL_WARN(log_, "GET {} failed: {}", path, response_res.error());
      return SigningError::SIGNER_UNAVAILABLE;
    }
    auto &response = response_res.value();
    if (response.result() != boost::beast::http::status::ok) {
      SL_WARN(log_, "GET {} http status {}", path, response.result_int());
      return SigningError::SIGNER_UNAVAILABLE;
    }
    return std::move(response.body());
  }

  outcome::result<Felt> RemoteSigner::publicKey() {
    if (not legacy_) {
      // `/sign` protocol has no key endpoint, the key stays with the service
      return SigningError::SIGNER_UNAVAILABLE;
    }
    OUTCOME_TRY(body, get("get_public_key"));
    return decodePublicKey(body);
  }

  outcome::result<Signature> RemoteSigner::sign(const InvokeTransactionV3 &tx,
                                                const TransactionHash &hash,
                                                const ChainId &chain_id) {
    std::string body;
    if (legacy_) {
      OUTCOME_TRY(response,
                  post("sign_hash", json::encode(SignHashRequest{hash})));
      body = std::move(response);
    } else {
      OUTCOME_TRY(response, post("sign", encodeSignRequest(tx, chain_id)));
      body = std::move(response);
    }
    auto signature = decodeSignature(body);
    if (not signature.has_value()) {
      SL_WARN(log_, "Malformed signature for {}: {}", hash, body);
    }
    return signature;
  }

}  // namespace attestor::signer
