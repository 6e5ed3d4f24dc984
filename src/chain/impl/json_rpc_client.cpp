/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/impl/json_rpc_client.hpp"

#include <boost/beast/http/status.hpp>

#include "app/configuration.hpp"
#include "crypto/selector.hpp"
#include "utils/http.hpp"

namespace attestor::chain {
  namespace {
    // pages of `starknet_getEvents` read per lookup
    constexpr size_t kMaxEventPages = 10;
    constexpr uint64_t kEventsChunkSize = 100;

    outcome::result<uint64_t> toU64(const Felt &felt) {
      auto value = felt.toU64();
      if (not value.has_value()) {
        return ChainQueryError::MALFORMED_RESPONSE;
      }
      return value.value();
    }
  }  // namespace

  JsonRpcClient::JsonRpcClient(qtils::SharedRef<log::LoggingSystem> logsys,
                               qtils::SharedRef<app::Configuration> app_config)
      : log_{logsys->getLogger("JsonRpc", "chain")},
        app_config_{std::move(app_config)},
        uri_{Uri::parse(app_config_->node().url).value()} {}

  template <typename T, typename P>
  outcome::result<rpc::Reply<T>> JsonRpcClient::exchange(
      std::string_view method, P params) {
    auto id = next_id_.fetch_add(1);
    http::ClientRequest request{
        .method = boost::beast::http::verb::post,
        .uri = uri_,
        .body = rpc::encodeRequest(id, std::string{method}, std::move(params)),
        .timeout = app_config_->node().rpc_timeout,
    };
    SL_TRACE(log_, "-> {} #{}", method, id);
    auto response_res = http::fetch(request);
    if (not response_res.has_value()) {
      SL_DEBUG(log_, "{} #{} failed: {}", method, id, response_res.error());
      if (response_res.error() == http::HttpError::TIMEOUT) {
        return ChainQueryError::TIMEOUT;
      }
      return ChainQueryError::TRANSPORT_FAILED;
    }
    auto &response = response_res.value();
    if (response.result() != boost::beast::http::status::ok) {
      SL_DEBUG(log_,
               "{} #{} http status {}",
               method,
               id,
               response.result_int());
      return ChainQueryError::TRANSPORT_FAILED;
    }
    try {
      auto reply = rpc::decodeReply<T>(response.body());
      if (reply.error.has_value()) {
        SL_DEBUG(log_,
                 "{} #{} rpc error {}: {}",
                 method,
                 id,
                 reply.error->code,
                 reply.error->message);
      }
      return reply;
    } catch (const json::JsonError &e) {
      SL_WARN(log_, "{} #{} malformed response: {}", method, id, e.what());
      return ChainQueryError::MALFORMED_RESPONSE;
    }
  }

  template <typename T, typename P>
  outcome::result<T> JsonRpcClient::query(std::string_view method, P params) {
    OUTCOME_TRY(reply, exchange<T>(method, std::move(params)));
    if (reply.error.has_value()) {
      return queryErrorFromRpcCode(static_cast<int>(reply.error->code));
    }
    return std::move(reply.result.value());
  }

  outcome::result<std::vector<Felt>> JsonRpcClient::call(
      const ContractAddress &contract,
      std::string_view function,
      std::vector<Felt> calldata) {
    return query<std::vector<Felt>>(
        "starknet_call",
        rpc::CallParams{
            .request =
                {
                    .contract_address = contract,
                    .entry_point_selector = crypto::selectorFromName(function),
                    .calldata = std::move(calldata),
                },
            .block_id = rpc::BlockId::pending(),
        });
  }

  outcome::result<ChainId> JsonRpcClient::chainId() {
    return query<Felt>("starknet_chainId", rpc::NoParams{});
  }

  outcome::result<BlockNumber> JsonRpcClient::latestBlockNumber() {
    return query<BlockNumber>("starknet_blockNumber", rpc::NoParams{});
  }

  outcome::result<BlockHeader> JsonRpcClient::blockByNumber(
      BlockNumber number) {
    OUTCOME_TRY(block,
                query<rpc::BlockWithTxHashes>(
                    "starknet_getBlockWithTxHashes",
                    rpc::BlockIdParams{.block_id = rpc::BlockId::at(number)}));
    if (not block.block_hash.has_value()
        or not block.block_number.has_value()) {
      return ChainQueryError::PENDING_BLOCK;
    }
    return BlockHeader{
        .number = *block.block_number,
        .hash = *block.block_hash,
        .parent_hash = block.parent_hash,
        .timestamp = block.timestamp,
    };
  }

  outcome::result<std::vector<uint64_t>> JsonRpcClient::latestBlockTips() {
    OUTCOME_TRY(block,
                query<rpc::BlockWithTxs>(
                    "starknet_getBlockWithTxs",
                    rpc::BlockIdParams{.block_id = rpc::BlockId::latest()}));
    std::vector<uint64_t> tips;
    for (auto &tx : block.transactions) {
      if (tx.tip.has_value()) {
        OUTCOME_TRY(tip, toU64(*tx.tip));
        tips.emplace_back(tip);
      }
    }
    return tips;
  }

  outcome::result<AttestationInfo> JsonRpcClient::attestationInfo(
      const ContractAddress &operational) {
    const auto &staking = app_config_->staking();
    OUTCOME_TRY(info,
                call(staking.staking_contract,
                     "get_attestation_info_by_operational_address",
                     {operational}));
    // (staker_address, stake, epoch_len, epoch_id, epoch_starting_block)
    if (info.size() < 5) {
      SL_WARN(log_, "Unexpected attestation info size {}", info.size());
      return ChainQueryError::MALFORMED_RESPONSE;
    }
    OUTCOME_TRY(window,
                call(staking.attestation_contract, "attestation_window", {}));
    if (window.empty()) {
      return ChainQueryError::MALFORMED_RESPONSE;
    }

    OUTCOME_TRY(epoch_length, toU64(info[2]));
    OUTCOME_TRY(epoch_id, toU64(info[3]));
    OUTCOME_TRY(starting_block, toU64(info[4]));
    OUTCOME_TRY(attestation_window, toU64(window[0]));
    return AttestationInfo{
        .staker_address = info[0],
        .operational_address = operational,
        .stake = info[1],
        .epoch =
            {
                .id = epoch_id,
                .length = epoch_length,
                .starting_block = starting_block,
            },
        .attestation_window = attestation_window,
    };
  }

  outcome::result<Nonce> JsonRpcClient::accountNonce(
      const ContractAddress &account) {
    return query<Nonce>("starknet_getNonce",
                        rpc::GetNonceParams{
                            .block_id = rpc::BlockId::pending(),
                            .contract_address = account,
                        });
  }

  outcome::result<uint256_t> JsonRpcClient::accountBalance(
      const ContractAddress &account) {
    OUTCOME_TRY(
        balance,
        call(app_config_->staking().strk_token, "balance_of", {account}));
    // u256 as (low, high)
    if (balance.size() != 2) {
      return ChainQueryError::MALFORMED_RESPONSE;
    }
    return balance[0].value() + (balance[1].value() << 128);
  }

  outcome::result<FeeEstimate> JsonRpcClient::estimateFee(
      const InvokeTransactionV3 &tx) {
    OUTCOME_TRY(reply,
                exchange<std::vector<FeeEstimate>>(
                    "starknet_estimateFee",
                    rpc::EstimateFeeParams{
                        .request = {tx.asQuery()},
                        .simulation_flags = {"SKIP_VALIDATE"},
                        .block_id = rpc::BlockId::pending(),
                    }));
    if (reply.error.has_value()) {
      if (reply.error->code == rpc_code::kInvalidTransactionNonce) {
        return SubmissionError::NONCE_CONFLICT;
      }
      return SubmissionError::FEE_ESTIMATION_FAILED;
    }
    auto &estimates = reply.result.value();
    if (estimates.size() != 1) {
      return ChainQueryError::MALFORMED_RESPONSE;
    }
    return estimates.front();
  }

  outcome::result<TransactionHash> JsonRpcClient::submitTransaction(
      const InvokeTransactionV3 &tx) {
    auto reply_res = exchange<rpc::AddInvokeResult>(
        "starknet_addInvokeTransaction",
        rpc::AddInvokeParams{.invoke_transaction = tx});
    if (not reply_res.has_value()) {
      return SubmissionError::SEND_FAILED;
    }
    auto &reply = reply_res.value();
    if (reply.error.has_value()) {
      return submissionErrorFromRpcCode(static_cast<int>(reply.error->code));
    }
    return reply.result->transaction_hash;
  }

  outcome::result<TransactionStatus> JsonRpcClient::transactionStatus(
      const TransactionHash &hash) {
    return query<TransactionStatus>(
        "starknet_getTransactionStatus",
        rpc::TransactionHashParams{.transaction_hash = hash});
  }

  outcome::result<std::vector<AttestationEvent>>
  JsonRpcClient::attestationEvents(const ContractAddress &staker,
                                   BlockNumber from_block) {
    static const auto selector =
        crypto::selectorFromName("StakerAttestationSuccessful");
    rpc::EventFilter filter{
        .from_block = rpc::BlockId::at(from_block),
        .to_block = rpc::BlockId::pending(),
        .address = app_config_->staking().attestation_contract,
        .keys = {{selector}, {staker}},
        .chunk_size = kEventsChunkSize,
        .continuation_token = std::nullopt,
    };

    std::vector<AttestationEvent> events;
    for (size_t page = 0; page < kMaxEventPages; ++page) {
      OUTCOME_TRY(chunk,
                  query<rpc::EventsChunk>("starknet_getEvents",
                                          rpc::GetEventsParams{filter}));
      for (auto &event : chunk.events) {
        // keys: [selector, staker_address], data: [epoch_id]
        if (event.keys.size() < 2 or event.keys[0] != selector
            or event.data.empty()) {
          SL_DEBUG(log_, "Skip unexpected event in tx {}", event.transaction_hash);
          continue;
        }
        OUTCOME_TRY(epoch_id, toU64(event.data[0]));
        events.emplace_back(AttestationEvent{
            .staker_address = event.keys[1],
            .epoch_id = epoch_id,
            .transaction_hash = event.transaction_hash,
            .block_number = event.block_number,
        });
      }
      if (not chunk.continuation_token.has_value()) {
        return events;
      }
      filter.continuation_token = chunk.continuation_token;
    }
    SL_WARN(log_,
            "Events of staker {} since block {} truncated at {} pages",
            staker,
            from_block,
            kMaxEventPages);
    return events;
  }

}  // namespace attestor::chain
