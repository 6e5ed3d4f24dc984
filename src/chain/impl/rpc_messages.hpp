/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "serde/json.hpp"
#include "types/invoke_transaction.hpp"

/**
 * Request and response shapes of the Starknet JSON-RPC v0.8 methods the
 * agent calls. Only the members in use are declared, the rest of a
 * response is ignored by the decoder.
 */
namespace attestor::chain::rpc {

  /// Either a tag ("latest", "pending") or {"block_number": n}
  struct BlockId {
    std::optional<BlockNumber> number;
    std::string tag;

    static BlockId latest() {
      return {std::nullopt, "latest"};
    }
    static BlockId pending() {
      return {std::nullopt, "pending"};
    }
    static BlockId at(BlockNumber number) {
      return {number, {}};
    }
  };

  inline void encode(json::JsonOut out, const BlockId &block_id) {
    if (block_id.number.has_value()) {
      out.w.StartObject();
      out.w.Key("block_number");
      out.w.Uint64(*block_id.number);
      out.w.EndObject();
    } else {
      json::encode(out, block_id.tag);
    }
  }

  template <typename P>
  struct Request {
    std::string jsonrpc = "2.0";
    uint64_t id = 0;
    std::string method;
    P params;

    JSON_FIELDS(jsonrpc, id, method, params)
  };

  struct ErrorObject {
    int64_t code = 0;
    std::string message;

    JSON_FIELDS(code, message)
  };

  template <typename T>
  struct Reply {
    std::optional<T> result;
    std::optional<ErrorObject> error;

    JSON_FIELDS(result, error)
  };

  /// Methods without parameters take an empty positional list
  using NoParams = std::vector<Felt>;

  struct BlockIdParams {
    BlockId block_id;

    JSON_FIELDS(block_id)
  };

  struct FunctionCall {
    ContractAddress contract_address;
    Felt entry_point_selector;
    std::vector<Felt> calldata;

    JSON_FIELDS(contract_address, entry_point_selector, calldata)
  };

  struct CallParams {
    FunctionCall request;
    BlockId block_id;

    JSON_FIELDS(request, block_id)
  };

  struct GetNonceParams {
    BlockId block_id;
    ContractAddress contract_address;

    JSON_FIELDS(block_id, contract_address)
  };

  struct EstimateFeeParams {
    std::vector<InvokeTransactionV3> request;
    std::vector<std::string> simulation_flags;
    BlockId block_id;

    JSON_FIELDS(request, simulation_flags, block_id)
  };

  struct AddInvokeParams {
    InvokeTransactionV3 invoke_transaction;

    JSON_FIELDS(invoke_transaction)
  };

  struct AddInvokeResult {
    TransactionHash transaction_hash;

    JSON_FIELDS(transaction_hash)
  };

  struct TransactionHashParams {
    TransactionHash transaction_hash;

    JSON_FIELDS(transaction_hash)
  };

  struct EventFilter {
    BlockId from_block;
    BlockId to_block;
    ContractAddress address;
    std::vector<std::vector<Felt>> keys;
    uint64_t chunk_size = 0;
    std::optional<std::string> continuation_token;

    JSON_FIELDS(
        from_block, to_block, address, keys, chunk_size, continuation_token)
  };

  struct GetEventsParams {
    EventFilter filter;

    JSON_FIELDS(filter)
  };

  struct EmittedEvent {
    ContractAddress from_address;
    std::vector<Felt> keys;
    std::vector<Felt> data;
    /// absent for events of the pending block
    std::optional<Felt> block_hash;
    std::optional<BlockNumber> block_number;
    TransactionHash transaction_hash;

    JSON_FIELDS(from_address,
                keys,
                data,
                block_hash,
                block_number,
                transaction_hash)
  };

  struct EventsChunk {
    std::vector<EmittedEvent> events;
    std::optional<std::string> continuation_token;

    JSON_FIELDS(events, continuation_token)
  };

  /// Block header fields; hash and number are absent for a pending block
  struct BlockWithTxHashes {
    std::optional<Felt> block_hash;
    std::optional<BlockNumber> block_number;
    Felt parent_hash;
    uint64_t timestamp = 0;

    JSON_FIELDS(block_hash, block_number, parent_hash, timestamp)
  };

  struct TransactionTip {
    /// absent for transactions older than v3
    std::optional<Felt> tip;

    JSON_FIELDS(tip)
  };

  struct BlockWithTxs {
    std::vector<TransactionTip> transactions;

    JSON_FIELDS(transactions)
  };

  struct SubscribeNewHeadsParams {
    /// empty subscribes from the latest block, encoded as `{}`
    std::optional<BlockId> block_id;

    JSON_FIELDS(block_id)
  };

  /// `result` of `starknet_subscriptionNewHeads`
  struct NewHead {
    Felt block_hash;
    BlockNumber block_number = 0;
    Felt parent_hash;
    uint64_t timestamp = 0;

    JSON_FIELDS(block_hash, block_number, parent_hash, timestamp)
  };

  /// `result` of `starknet_subscriptionReorg`, the orphaned range
  struct Reorg {
    BlockNumber starting_block_number = 0;
    BlockNumber ending_block_number = 0;

    JSON_FIELDS(starting_block_number, ending_block_number)
  };

  template <typename T>
  struct SubscriptionParams {
    T result;

    JSON_FIELDS(result)
  };

  /// Server-initiated message of a websocket subscription
  template <typename T>
  struct Notification {
    std::string method;
    SubscriptionParams<T> params;

    JSON_FIELDS(method, params)
  };

  /// Distinguishes notifications (with `method`) from replies
  struct MessageKind {
    std::optional<std::string> method;
    std::optional<ErrorObject> error;

    JSON_FIELDS(method, error)
  };

  template <typename P>
  std::string encodeRequest(uint64_t id, std::string method, P params) {
    return json::encode(Request<P>{
        .id = id,
        .method = std::move(method),
        .params = std::move(params),
    });
  }

  /// Throws `json::JsonError` on a malformed body
  template <typename T>
  Reply<T> decodeReply(std::string_view body) {
    Reply<T> reply;
    json::decode(reply, body);
    JSON_ASSERT(reply.result.has_value() or reply.error.has_value());
    return reply;
  }

}  // namespace attestor::chain::rpc
