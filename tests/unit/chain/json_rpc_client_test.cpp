/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/json_rpc_client.hpp"

#include <map>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "crypto/selector.hpp"
#include "mock/app/configuration_mock.hpp"
#include "qtils/test/outcome.hpp"
#include "serde/json.hpp"
#include "testutil/prepare_loggers.hpp"
#include "testutil/test_http_server.hpp"

using attestor::BlockHeader;
using attestor::Felt;
using attestor::InvokeTransactionV3;
using attestor::app::Configuration;
using attestor::app::ConfigurationMock;
using attestor::chain::ChainQueryError;
using attestor::chain::ExecutionStatus;
using attestor::chain::FinalityStatus;
using attestor::chain::JsonRpcClient;
using attestor::chain::SubmissionError;
using testutil::TestHttpServer;
using testing::ReturnRef;

namespace {
  struct RpcCall {
    std::string method;
    uint64_t id = 0;

    JSON_FIELDS(method, id)
  };

  const Felt kStakingContract{0x5a4e};
  const Felt kAttestationContract{0xa77e57};
  const Felt kStrkToken{0x57c};
}  // namespace

/**
 * Starknet node double: answers each method with a canned `result` or
 * `error` member
 */
class JsonRpcClientTest : public testing::Test {
 protected:
  using Handler = std::function<std::string(const RpcCall &, std::string_view)>;

  void SetUp() override {
    staking_config_.staking_contract = kStakingContract;
    staking_config_.attestation_contract = kAttestationContract;
    staking_config_.strk_token = kStrkToken;
    ON_CALL(*config_, node()).WillByDefault(ReturnRef(node_config_));
    ON_CALL(*config_, staking()).WillByDefault(ReturnRef(staking_config_));

    server_ = std::make_unique<TestHttpServer>(
        [this](attestor::http::Request request) {
          RpcCall call;
          attestor::json::decode(call, request.body());
          auto it = handlers_.find(call.method);
          if (it == handlers_.end()) {
            return reply(call, R"("error":{"code":-32601,"message":"no"})");
          }
          return reply(call, it->second(call, request.body()));
        });
    node_config_.url = server_->url("/rpc/v0_8");
    node_config_.rpc_timeout = std::chrono::seconds{2};
    client_ = std::make_shared<JsonRpcClient>(testutil::prepareLoggers(),
                                              config_);
  }

  static attestor::http::Response reply(const RpcCall &call,
                                        std::string member) {
    return TestHttpServer::reply(fmt::format(
        R"({{"jsonrpc":"2.0","id":{},{}}})", call.id, member));
  }

  static std::string result(std::string json) {
    return fmt::format(R"("result":{})", json);
  }

  static std::string error(int code) {
    return fmt::format(R"("error":{{"code":{},"message":"failed"}})", code);
  }

  void on(std::string method, Handler handler) {
    handlers_[std::move(method)] = std::move(handler);
  }

  void on(std::string method, std::string member) {
    on(std::move(method),
       [member](const RpcCall &, std::string_view) { return member; });
  }

  Configuration::NodeConfig node_config_;
  Configuration::StakingConfig staking_config_;
  std::shared_ptr<testing::NiceMock<ConfigurationMock>> config_ =
      std::make_shared<testing::NiceMock<ConfigurationMock>>();
  std::map<std::string, Handler> handlers_;
  std::unique_ptr<TestHttpServer> server_;
  std::shared_ptr<JsonRpcClient> client_;
};

TEST_F(JsonRpcClientTest, ChainIdAndBlockNumber) {
  on("starknet_chainId", result(R"("0x534e5f5345504f4c4941")"));
  on("starknet_blockNumber", result("812345"));

  ASSERT_OUTCOME_SUCCESS(chain_id, client_->chainId());
  EXPECT_EQ(chain_id, Felt::fromShortString("SN_SEPOLIA"));
  ASSERT_OUTCOME_SUCCESS(number, client_->latestBlockNumber());
  EXPECT_EQ(number, 812345);

  auto requests = server_->requests();
  ASSERT_EQ(requests.size(), 2);
  EXPECT_EQ(requests[0].method(), boost::beast::http::verb::post);
  EXPECT_EQ(requests[0].target(), "/rpc/v0_8");
  EXPECT_NE(requests[0].body().find(R"("params":[])"), std::string::npos);
}

TEST_F(JsonRpcClientTest, BlockByNumber) {
  std::string seen_body;
  on("starknet_getBlockWithTxHashes",
     [&](const RpcCall &, std::string_view body) {
       seen_body = body;
       return result(
           R"({"status":"ACCEPTED_ON_L2","block_hash":"0xb10c",)"
           R"("block_number":1023,"parent_hash":"0xb10b",)"
           R"("timestamp":1700000000,"transactions":["0x1","0x2"]})");
     });

  ASSERT_OUTCOME_SUCCESS(header, client_->blockByNumber(1023));
  EXPECT_EQ(header,
            (BlockHeader{.number = 1023,
                         .hash = 0xb10c,
                         .parent_hash = 0xb10b,
                         .timestamp = 1700000000}));
  EXPECT_NE(seen_body.find(R"("block_id":{"block_number":1023})"),
            std::string::npos)
      << seen_body;
}

TEST_F(JsonRpcClientTest, PendingAndMissingBlocks) {
  on("starknet_getBlockWithTxHashes",
     [](const RpcCall &call, std::string_view) {
       if (call.id % 2 == 0) {
         return result(R"({"parent_hash":"0xb10b","timestamp":1})");
       }
       return error(24);
     });

  auto first = client_->blockByNumber(10);
  auto second = client_->blockByNumber(11);
  std::vector<std::error_code> errors{first.error(), second.error()};
  EXPECT_THAT(errors,
              testing::UnorderedElementsAre(
                  make_error_code(ChainQueryError::PENDING_BLOCK),
                  make_error_code(ChainQueryError::BLOCK_NOT_FOUND)));
}

TEST_F(JsonRpcClientTest, LatestBlockTips) {
  on("starknet_getBlockWithTxs",
     result(R"({"transactions":[{"type":"INVOKE","tip":"0x5"},)"
            R"({"type":"DECLARE","version":"0x1"},)"
            R"({"type":"INVOKE","tip":"0xa"}]})"));

  ASSERT_OUTCOME_SUCCESS(tips, client_->latestBlockTips());
  EXPECT_EQ(tips, (std::vector<uint64_t>{5, 10}));
}

/**
 * @given staking and attestation contracts answering `starknet_call`
 * @when attestation info is requested
 * @then both contracts are queried and the result is assembled
 */
TEST_F(JsonRpcClientTest, AttestationInfo) {
  const auto window_selector =
      attestor::crypto::selectorFromName("attestation_window").toHex();
  on("starknet_call", [&](const RpcCall &, std::string_view body) {
    if (body.find(window_selector) != std::string_view::npos) {
      return result(R"(["0x10"])");
    }
    return result(R"(["0x57a4e","0x3e8","0x28","0x7","0x3e8"])");
  });

  ASSERT_OUTCOME_SUCCESS(info, client_->attestationInfo(Felt{0xa11ce}));
  EXPECT_EQ(info.staker_address, Felt{0x57a4e});
  EXPECT_EQ(info.operational_address, Felt{0xa11ce});
  EXPECT_EQ(info.stake, Felt{1000});
  EXPECT_EQ(info.epoch.length, 40);
  EXPECT_EQ(info.epoch.id, 7);
  EXPECT_EQ(info.epoch.starting_block, 1000);
  EXPECT_EQ(info.attestation_window, 16);

  auto requests = server_->requests();
  ASSERT_EQ(requests.size(), 2);
  EXPECT_NE(requests[0].body().find(kStakingContract.toHex()),
            std::string::npos);
  EXPECT_NE(
      requests[0].body().find(attestor::crypto::selectorFromName(
                                  "get_attestation_info_by_operational_address")
                                  .toHex()),
      std::string::npos);
}

TEST_F(JsonRpcClientTest, AttestationInfoErrors) {
  on("starknet_call", result(R"(["0x57a4e","0x3e8"])"));
  auto short_res = client_->attestationInfo(Felt{0xa11ce});
  ASSERT_FALSE(short_res.has_value());
  EXPECT_EQ(short_res.error(), ChainQueryError::MALFORMED_RESPONSE);

  on("starknet_call", error(40));
  auto call_res = client_->attestationInfo(Felt{0xa11ce});
  ASSERT_FALSE(call_res.has_value());
  EXPECT_EQ(call_res.error(), ChainQueryError::CONTRACT_CALL_FAILED);
}

TEST_F(JsonRpcClientTest, NonceAndBalance) {
  on("starknet_getNonce", result(R"("0x106")"));
  on("starknet_call", result(R"(["0x5","0x1"])"));

  ASSERT_OUTCOME_SUCCESS(nonce, client_->accountNonce(Felt{0xa11ce}));
  EXPECT_EQ(nonce, Felt{0x106});
  ASSERT_OUTCOME_SUCCESS(balance, client_->accountBalance(Felt{0xa11ce}));
  EXPECT_EQ(balance, (attestor::uint256_t{1} << 128) + 5);

  auto requests = server_->requests();
  ASSERT_EQ(requests.size(), 2);
  EXPECT_NE(requests[1].body().find(kStrkToken.toHex()), std::string::npos);
}

TEST_F(JsonRpcClientTest, EstimateFee) {
  std::string seen_body;
  on("starknet_estimateFee", [&](const RpcCall &, std::string_view body) {
    seen_body = body;
    return result(
        R"([{"l1_gas_consumed":"0x0","l1_gas_price":"0x64",)"
        R"("l2_gas_consumed":"0x3e8","l2_gas_price":"0xa",)"
        R"("l1_data_gas_consumed":"0x80","l1_data_gas_price":"0x2",)"
        R"("overall_fee":"0x2810","unit":"FRI"}])");
  });

  InvokeTransactionV3 tx;
  tx.signature = {1, 2};
  ASSERT_OUTCOME_SUCCESS(estimate, client_->estimateFee(tx));
  EXPECT_EQ(estimate.l2_gas_consumed, Felt{1000});
  EXPECT_EQ(estimate.overall_fee, Felt{0x2810});

  // sent as an unsigned query transaction
  EXPECT_NE(seen_body.find(R"("version":"0x100000000000000000000000000000003")"),
            std::string::npos)
      << seen_body;
  EXPECT_NE(seen_body.find(R"("signature":[])"), std::string::npos);
  EXPECT_NE(seen_body.find("SKIP_VALIDATE"), std::string::npos);
}

TEST_F(JsonRpcClientTest, EstimateFeeErrors) {
  on("starknet_estimateFee", error(52));
  auto nonce_res = client_->estimateFee(InvokeTransactionV3{});
  ASSERT_FALSE(nonce_res.has_value());
  EXPECT_EQ(nonce_res.error(), SubmissionError::NONCE_CONFLICT);

  on("starknet_estimateFee", error(41));
  auto failed_res = client_->estimateFee(InvokeTransactionV3{});
  ASSERT_FALSE(failed_res.has_value());
  EXPECT_EQ(failed_res.error(), SubmissionError::FEE_ESTIMATION_FAILED);
}

TEST_F(JsonRpcClientTest, SubmitTransaction) {
  on("starknet_addInvokeTransaction",
     result(R"({"transaction_hash":"0x7a1"})"));
  ASSERT_OUTCOME_SUCCESS(hash, client_->submitTransaction({}));
  EXPECT_EQ(hash, Felt{0x7a1});

  std::vector<std::pair<int, SubmissionError>> cases{
      {52, SubmissionError::NONCE_CONFLICT},
      {54, SubmissionError::INSUFFICIENT_BALANCE},
      {59, SubmissionError::DUPLICATE_TRANSACTION},
      {55, SubmissionError::REJECTED},
      {-32603, SubmissionError::SEND_FAILED},
  };
  for (auto &[code, expected] : cases) {
    on("starknet_addInvokeTransaction", error(code));
    auto res = client_->submitTransaction({});
    ASSERT_FALSE(res.has_value()) << code;
    EXPECT_EQ(res.error(), expected) << code;
  }
}

TEST_F(JsonRpcClientTest, TransactionStatus) {
  on("starknet_getTransactionStatus",
     result(R"({"finality_status":"ACCEPTED_ON_L2",)"
            R"("execution_status":"REVERTED","failure_reason":"out of window"})"));
  ASSERT_OUTCOME_SUCCESS(status, client_->transactionStatus(Felt{0x7a1}));
  EXPECT_EQ(status.finality_status, FinalityStatus::ACCEPTED_ON_L2);
  EXPECT_EQ(status.execution_status, ExecutionStatus::REVERTED);
  EXPECT_EQ(status.failure_reason, "out of window");

  on("starknet_getTransactionStatus", result(R"({"finality_status":"RECEIVED"})"));
  ASSERT_OUTCOME_SUCCESS(received, client_->transactionStatus(Felt{0x7a1}));
  EXPECT_EQ(received.finality_status, FinalityStatus::RECEIVED);
  EXPECT_FALSE(received.execution_status.has_value());

  on("starknet_getTransactionStatus", error(29));
  auto missing = client_->transactionStatus(Felt{0x7a1});
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error(), ChainQueryError::TRANSACTION_NOT_FOUND);
}

/**
 * @given events split over two pages
 * @when attestation events are requested
 * @then both pages are read and foreign events are skipped
 */
TEST_F(JsonRpcClientTest, AttestationEventsArePaged) {
  const auto selector =
      attestor::crypto::selectorFromName("StakerAttestationSuccessful").toHex();
  on("starknet_getEvents", [&](const RpcCall &, std::string_view body) {
    if (body.find("page2") == std::string_view::npos) {
      return result(fmt::format(
          R"({{"events":[{{"from_address":"0xa77e57","keys":["{}","0x57a4e"],)"
          R"("data":["0x6"],"block_hash":"0x1","block_number":990,)"
          R"("transaction_hash":"0xaa"}},)"
          R"({{"from_address":"0xa77e57","keys":["0x1234"],"data":[],)"
          R"("transaction_hash":"0xbb"}}],"continuation_token":"page2"}})",
          selector));
    }
    return result(fmt::format(
        R"({{"events":[{{"from_address":"0xa77e57","keys":["{}","0x57a4e"],)"
        R"("data":["0x7"],"transaction_hash":"0xcc"}}]}})",
        selector));
  });

  ASSERT_OUTCOME_SUCCESS(events,
                         client_->attestationEvents(Felt{0x57a4e}, 960));
  ASSERT_EQ(events.size(), 2);
  EXPECT_EQ(events[0].epoch_id, 6);
  EXPECT_EQ(events[0].transaction_hash, Felt{0xaa});
  EXPECT_EQ(events[0].block_number, 990);
  EXPECT_EQ(events[1].epoch_id, 7);
  EXPECT_EQ(events[1].staker_address, Felt{0x57a4e});
  EXPECT_EQ(events[1].block_number, std::nullopt);

  auto requests = server_->requests();
  ASSERT_EQ(requests.size(), 2);
  EXPECT_NE(requests[0].body().find(R"("from_block":{"block_number":960})"),
            std::string::npos);
  EXPECT_NE(requests[0].body().find(kAttestationContract.toHex()),
            std::string::npos);
}

/**
 * @given a node that always reports more events
 * @when attestation events are read
 * @then reading stops after ten pages with the events collected so far
 */
TEST_F(JsonRpcClientTest, AttestationEventsStopAtPageLimit) {
  const auto selector =
      attestor::crypto::selectorFromName("StakerAttestationSuccessful").toHex();
  on("starknet_getEvents", [&](const RpcCall &, std::string_view) {
    return result(fmt::format(
        R"({{"events":[{{"from_address":"0xa77e57","keys":["{}","0x57a4e"],)"
        R"("data":["0x7"],"transaction_hash":"0xcc"}}],)"
        R"("continuation_token":"more"}})",
        selector));
  });

  ASSERT_OUTCOME_SUCCESS(events,
                         client_->attestationEvents(Felt{0x57a4e}, 960));
  EXPECT_EQ(events.size(), 10);
  EXPECT_EQ(server_->requests().size(), 10);
}

TEST_F(JsonRpcClientTest, TransportFailures) {
  auto bad_status = std::make_unique<TestHttpServer>(
      [](attestor::http::Request) {
        return TestHttpServer::reply("", boost::beast::http::status::bad_gateway);
      });
  node_config_.url = bad_status->url();
  JsonRpcClient unavailable{testutil::prepareLoggers(), config_};
  auto status_res = unavailable.chainId();
  ASSERT_FALSE(status_res.has_value());
  EXPECT_EQ(status_res.error(), ChainQueryError::TRANSPORT_FAILED);

  auto garbage = std::make_unique<TestHttpServer>(
      [](attestor::http::Request) { return TestHttpServer::reply("{]"); });
  node_config_.url = garbage->url();
  JsonRpcClient malformed{testutil::prepareLoggers(), config_};
  auto malformed_res = malformed.chainId();
  ASSERT_FALSE(malformed_res.has_value());
  EXPECT_EQ(malformed_res.error(), ChainQueryError::MALFORMED_RESPONSE);

  on("starknet_chainId", R"("unexpected":1)");
  auto empty_res = client_->chainId();
  ASSERT_FALSE(empty_res.has_value());
  EXPECT_EQ(empty_res.error(), ChainQueryError::MALFORMED_RESPONSE);
}
