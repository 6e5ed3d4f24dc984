/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace attestor::chain {

  /// Failed read from the node; always transient for the caller
  enum class ChainQueryError : uint8_t {
    TRANSPORT_FAILED = 1,
    TIMEOUT,
    MALFORMED_RESPONSE,
    RPC_ERROR,
    BLOCK_NOT_FOUND,
    PENDING_BLOCK,
    CONTRACT_CALL_FAILED,
    TRANSACTION_NOT_FOUND,
  };

  /// Transaction could not be accepted by the node
  enum class SubmissionError : uint8_t {
    NONCE_CONFLICT = 1,
    REJECTED,
    SEND_FAILED,
    INSUFFICIENT_BALANCE,
    DUPLICATE_TRANSACTION,
    FEE_ESTIMATION_FAILED,
  };

  /// Starknet JSON-RPC error codes the agent distinguishes
  namespace rpc_code {
    constexpr int kContractNotFound = 20;
    constexpr int kBlockNotFound = 24;
    constexpr int kTransactionHashNotFound = 29;
    constexpr int kContractError = 40;
    constexpr int kTransactionExecutionError = 41;
    constexpr int kInvalidTransactionNonce = 52;
    constexpr int kInsufficientAccountBalance = 54;
    constexpr int kValidationFailure = 55;
    constexpr int kDuplicateTransaction = 59;
  }  // namespace rpc_code

  /// Maps an RPC error code of a read request
  ChainQueryError queryErrorFromRpcCode(int code);

  /// Maps an RPC error code of `starknet_addInvokeTransaction`
  SubmissionError submissionErrorFromRpcCode(int code);

}  // namespace attestor::chain

OUTCOME_HPP_DECLARE_ERROR(attestor::chain, ChainQueryError);
OUTCOME_HPP_DECLARE_ERROR(attestor::chain, SubmissionError);
