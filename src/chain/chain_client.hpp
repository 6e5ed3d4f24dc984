/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <qtils/outcome.hpp>

#include "chain/chain_error.hpp"
#include "serde/json_fwd.hpp"
#include "types/attestation_info.hpp"
#include "types/block_header.hpp"
#include "types/invoke_transaction.hpp"

namespace attestor::chain {

  enum class FinalityStatus : uint8_t {
    RECEIVED,
    REJECTED,
    ACCEPTED_ON_L2,
    ACCEPTED_ON_L1,
  };
  JSON_ENUM(FinalityStatus,
            {FinalityStatus::RECEIVED, "RECEIVED"},
            {FinalityStatus::REJECTED, "REJECTED"},
            {FinalityStatus::ACCEPTED_ON_L2, "ACCEPTED_ON_L2"},
            {FinalityStatus::ACCEPTED_ON_L1, "ACCEPTED_ON_L1"});

  enum class ExecutionStatus : uint8_t {
    SUCCEEDED,
    REVERTED,
  };
  JSON_ENUM(ExecutionStatus,
            {ExecutionStatus::SUCCEEDED, "SUCCEEDED"},
            {ExecutionStatus::REVERTED, "REVERTED"});

  struct TransactionStatus {
    FinalityStatus finality_status = FinalityStatus::RECEIVED;
    std::optional<ExecutionStatus> execution_status;
    std::optional<std::string> failure_reason;

    bool accepted() const {
      return finality_status == FinalityStatus::ACCEPTED_ON_L2
          or finality_status == FinalityStatus::ACCEPTED_ON_L1;
    }

    bool reverted() const {
      return execution_status == ExecutionStatus::REVERTED;
    }

    JSON_FIELDS(finality_status, execution_status, failure_reason)
  };

  /// `StakerAttestationSuccessful` emitted by the attestation contract
  struct AttestationEvent {
    ContractAddress staker_address;
    EpochId epoch_id = 0;
    TransactionHash transaction_hash;
    std::optional<BlockNumber> block_number;

    bool operator==(const AttestationEvent &) const = default;
  };

  /// Result of `starknet_estimateFee` for one transaction
  struct FeeEstimate {
    Felt l1_gas_consumed;
    Felt l1_gas_price;
    Felt l2_gas_consumed;
    Felt l2_gas_price;
    Felt l1_data_gas_consumed;
    Felt l1_data_gas_price;
    Felt overall_fee;

    JSON_FIELDS(l1_gas_consumed,
                l1_gas_price,
                l2_gas_consumed,
                l2_gas_price,
                l1_data_gas_consumed,
                l1_data_gas_price,
                overall_fee)
  };

  /**
   * Access to a Starknet node. Read operations fail with `ChainQueryError`,
   * transaction submission with `SubmissionError`. Every call is bounded
   * by the configured RPC timeout.
   */
  class ChainClient {
   public:
    virtual ~ChainClient() = default;

    virtual outcome::result<ChainId> chainId() = 0;

    virtual outcome::result<BlockNumber> latestBlockNumber() = 0;

    /// Accepted block; a pending one is `PENDING_BLOCK`
    virtual outcome::result<BlockHeader> blockByNumber(BlockNumber number) = 0;

    /// Tips of all transactions of the latest accepted block
    virtual outcome::result<std::vector<uint64_t>> latestBlockTips() = 0;

    /**
     * Staking parameters of the staker operated by @param operational:
     * epoch, stake and attestation window
     */
    virtual outcome::result<AttestationInfo> attestationInfo(
        const ContractAddress &operational) = 0;

    virtual outcome::result<Nonce> accountNonce(
        const ContractAddress &account) = 0;

    /// STRK balance in fri
    virtual outcome::result<uint256_t> accountBalance(
        const ContractAddress &account) = 0;

    virtual outcome::result<FeeEstimate> estimateFee(
        const InvokeTransactionV3 &tx) = 0;

    virtual outcome::result<TransactionHash> submitTransaction(
        const InvokeTransactionV3 &tx) = 0;

    virtual outcome::result<TransactionStatus> transactionStatus(
        const TransactionHash &hash) = 0;

    /// Attestation events of @param staker emitted from @param from_block on
    virtual outcome::result<std::vector<AttestationEvent>> attestationEvents(
        const ContractAddress &staker, BlockNumber from_block) = 0;
  };

}  // namespace attestor::chain
