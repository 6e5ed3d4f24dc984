/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signer/remote_signer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mock/app/configuration_mock.hpp"
#include "qtils/test/outcome.hpp"
#include "serde/json.hpp"
#include "signer/signing_error.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/test_http_server.hpp"

using attestor::Felt;
using attestor::InvokeTransactionV3;
using attestor::app::Configuration;
using attestor::app::ConfigurationMock;
using attestor::signer::RemoteSigner;
using attestor::signer::Signature;
using attestor::signer::SigningError;
using testutil::TestHttpServer;
using testing::ReturnRef;

namespace {
  struct SignedRequest {
    InvokeTransactionV3 transaction;
    Felt chain_id;

    JSON_FIELDS(transaction, chain_id)
  };

  struct SignHashRequest {
    Felt hash;

    JSON_FIELDS(hash)
  };
}  // namespace

class RemoteSignerTest : public testing::Test {
 protected:
  std::shared_ptr<RemoteSigner> makeSigner(std::string url, bool legacy) {
    signer_config_.remote_url = std::move(url);
    signer_config_.remote_legacy = legacy;
    signer_config_.timeout = std::chrono::seconds{2};
    ON_CALL(*config_, signer()).WillByDefault(ReturnRef(signer_config_));
    return std::make_shared<RemoteSigner>(testutil::prepareLoggers(), config_);
  }

  static InvokeTransactionV3 transaction() {
    InvokeTransactionV3 tx;
    tx.sender_address = Felt{0xa11ce};
    tx.calldata = {1, 2, 3};
    tx.nonce = 7;
    tx.tip = 3;
    tx.signature = {0xdead};
    return tx;
  }

  Configuration::SignerConfig signer_config_;
  std::shared_ptr<testing::NiceMock<ConfigurationMock>> config_ =
      std::make_shared<testing::NiceMock<ConfigurationMock>>();
  const Felt chain_id_ = Felt::fromShortString("SN_SEPOLIA");
};

TEST_F(RemoteSignerTest, DecodeSignature) {
  ASSERT_OUTCOME_SUCCESS(
      signature, RemoteSigner::decodeSignature(R"({"signature":["0x1","0x2"]})"));
  EXPECT_EQ(signature, (Signature{1, 2}));

  ASSERT_OUTCOME_SUCCESS(
      extended,
      RemoteSigner::decodeSignature(
          R"({"signature":["0x1","0x2","0x3"],"extra":true})"));
  EXPECT_EQ(extended.size(), 3);
}

TEST_F(RemoteSignerTest, DecodeRejectsMalformed) {
  for (auto body : {R"({"signature":["0x1"]})",
                    R"({"signature":[]})",
                    R"({"signature":"0x1"})",
                    R"({"signature":["zz","0x2"]})",
                    R"({})",
                    "not json"}) {
    auto res = RemoteSigner::decodeSignature(body);
    ASSERT_FALSE(res.has_value()) << body;
    EXPECT_EQ(res.error(), SigningError::MALFORMED_RESPONSE) << body;
  }
}

/**
 * @given a signing service speaking the `/sign` protocol
 * @when a transaction is signed
 * @then the unsigned transaction and chain id are posted and the returned
 * signature is used
 */
TEST_F(RemoteSignerTest, SignsWholeTransaction) {
  TestHttpServer server{[](attestor::http::Request) {
    return TestHttpServer::reply(R"({"signature":["0x11","0x22"]})");
  }};
  auto signer = makeSigner(server.url("/api"), false);

  ASSERT_OUTCOME_SUCCESS(signature,
                         signer->sign(transaction(), Felt{0x4a5}, chain_id_));
  EXPECT_EQ(signature, (Signature{0x11, 0x22}));

  auto requests = server.requests();
  ASSERT_EQ(requests.size(), 1);
  EXPECT_EQ(requests[0].method(), boost::beast::http::verb::post);
  EXPECT_EQ(requests[0].target(), "/api/sign");

  SignedRequest posted;
  attestor::json::decode(posted, requests[0].body());
  EXPECT_EQ(posted.chain_id, chain_id_);
  EXPECT_EQ(posted.transaction.nonce, Felt{7});
  EXPECT_EQ(posted.transaction.tip, Felt{3});
  EXPECT_TRUE(posted.transaction.signature.empty());

  // this protocol has no key endpoint
  auto key = signer->publicKey();
  ASSERT_FALSE(key.has_value());
  EXPECT_EQ(key.error(), SigningError::SIGNER_UNAVAILABLE);
}

TEST_F(RemoteSignerTest, LegacyProtocol) {
  TestHttpServer server{[](attestor::http::Request request) {
    if (request.target() == "/get_public_key") {
      return TestHttpServer::reply(R"({"public_key":"0xabc"})");
    }
    return TestHttpServer::reply(R"({"signature":["0x5","0x6"]})");
  }};
  auto signer = makeSigner(server.url(), true);

  ASSERT_OUTCOME_SUCCESS(key, signer->publicKey());
  EXPECT_EQ(key, Felt{0xabc});

  ASSERT_OUTCOME_SUCCESS(signature,
                         signer->sign(transaction(), Felt{0x4a5}, chain_id_));
  EXPECT_EQ(signature, (Signature{5, 6}));

  auto requests = server.requests();
  ASSERT_EQ(requests.size(), 2);
  EXPECT_EQ(requests[0].method(), boost::beast::http::verb::get);
  EXPECT_EQ(requests[1].target(), "/sign_hash");
  SignHashRequest posted;
  attestor::json::decode(posted, requests[1].body());
  EXPECT_EQ(posted.hash, Felt{0x4a5});
}

TEST_F(RemoteSignerTest, ErrorStatusMeansUnavailable) {
  TestHttpServer server{[](attestor::http::Request) {
    return TestHttpServer::reply(R"({"error":"locked"})",
                                 boost::beast::http::status::service_unavailable);
  }};
  auto signer = makeSigner(server.url(), false);

  auto res = signer->sign(transaction(), Felt{0x4a5}, chain_id_);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), SigningError::SIGNER_UNAVAILABLE);
}

TEST_F(RemoteSignerTest, GarbageBodyIsMalformed) {
  TestHttpServer server{[](attestor::http::Request) {
    return TestHttpServer::reply("<html>oops</html>");
  }};
  auto signer = makeSigner(server.url(), false);

  auto res = signer->sign(transaction(), Felt{0x4a5}, chain_id_);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), SigningError::MALFORMED_RESPONSE);
}
