/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "chain/chain_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(attestor::chain, ChainQueryError, e) {
  using E = attestor::chain::ChainQueryError;
  switch (e) {
    case E::TRANSPORT_FAILED:
      return "Node is unreachable";
    case E::TIMEOUT:
      return "Node request timed out";
    case E::MALFORMED_RESPONSE:
      return "Node returned a malformed response";
    case E::RPC_ERROR:
      return "Node returned an error";
    case E::BLOCK_NOT_FOUND:
      return "Block not found";
    case E::PENDING_BLOCK:
      return "Received pending block where an accepted one was expected";
    case E::CONTRACT_CALL_FAILED:
      return "Contract call failed";
    case E::TRANSACTION_NOT_FOUND:
      return "Transaction hash not found";
  }
  return "Unknown ChainQueryError";
}

OUTCOME_CPP_DEFINE_CATEGORY(attestor::chain, SubmissionError, e) {
  using E = attestor::chain::SubmissionError;
  switch (e) {
    case E::NONCE_CONFLICT:
      return "Invalid transaction nonce";
    case E::REJECTED:
      return "Transaction rejected";
    case E::SEND_FAILED:
      return "Failed to send transaction";
    case E::INSUFFICIENT_BALANCE:
      return "Account balance is too low to cover the fee";
    case E::DUPLICATE_TRANSACTION:
      return "Transaction with the same hash already exists";
    case E::FEE_ESTIMATION_FAILED:
      return "Fee estimation failed";
  }
  return "Unknown SubmissionError";
}

namespace attestor::chain {

  ChainQueryError queryErrorFromRpcCode(int code) {
    switch (code) {
      case rpc_code::kBlockNotFound:
        return ChainQueryError::BLOCK_NOT_FOUND;
      case rpc_code::kTransactionHashNotFound:
        return ChainQueryError::TRANSACTION_NOT_FOUND;
      case rpc_code::kContractNotFound:
      case rpc_code::kContractError:
        return ChainQueryError::CONTRACT_CALL_FAILED;
      default:
        return ChainQueryError::RPC_ERROR;
    }
  }

  SubmissionError submissionErrorFromRpcCode(int code) {
    switch (code) {
      case rpc_code::kInvalidTransactionNonce:
        return SubmissionError::NONCE_CONFLICT;
      case rpc_code::kInsufficientAccountBalance:
        return SubmissionError::INSUFFICIENT_BALANCE;
      case rpc_code::kDuplicateTransaction:
        return SubmissionError::DUPLICATE_TRANSACTION;
      case rpc_code::kTransactionExecutionError:
      case rpc_code::kValidationFailure:
        return SubmissionError::REJECTED;
      default:
        return SubmissionError::SEND_FAILED;
    }
  }

}  // namespace attestor::chain
