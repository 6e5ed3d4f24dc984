/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

#include <qtils/shared_ref.hpp>

#include "chain/chain_client.hpp"
#include "chain/impl/rpc_messages.hpp"
#include "log/logger.hpp"
#include "utils/uri.hpp"

namespace attestor::app {
  class Configuration;
}  // namespace attestor::app

namespace attestor::chain {

  /// ChainClient over Starknet JSON-RPC v0.8 (HTTP POST)
  class JsonRpcClient final : public ChainClient {
   public:
    JsonRpcClient(qtils::SharedRef<log::LoggingSystem> logsys,
                  qtils::SharedRef<app::Configuration> app_config);

    outcome::result<ChainId> chainId() override;
    outcome::result<BlockNumber> latestBlockNumber() override;
    outcome::result<BlockHeader> blockByNumber(BlockNumber number) override;
    outcome::result<std::vector<uint64_t>> latestBlockTips() override;
    outcome::result<AttestationInfo> attestationInfo(
        const ContractAddress &operational) override;
    outcome::result<Nonce> accountNonce(
        const ContractAddress &account) override;
    outcome::result<uint256_t> accountBalance(
        const ContractAddress &account) override;
    outcome::result<FeeEstimate> estimateFee(
        const InvokeTransactionV3 &tx) override;
    outcome::result<TransactionHash> submitTransaction(
        const InvokeTransactionV3 &tx) override;
    outcome::result<TransactionStatus> transactionStatus(
        const TransactionHash &hash) override;
    outcome::result<std::vector<AttestationEvent>> attestationEvents(
        const ContractAddress &staker, BlockNumber from_block) override;

   private:
    /// Raw reply; transport and decoding failures become ChainQueryError
    template <typename T, typename P>
    outcome::result<rpc::Reply<T>> exchange(std::string_view method,
                                            P params);

    /// Reply result, RPC errors mapped to ChainQueryError
    template <typename T, typename P>
    outcome::result<T> query(std::string_view method, P params);

    outcome::result<std::vector<Felt>> call(const ContractAddress &contract,
                                            std::string_view function,
                                            std::vector<Felt> calldata);

    log::Logger log_;
    qtils::SharedRef<app::Configuration> app_config_;
    Uri uri_;
    std::atomic<uint64_t> next_id_{1};
  };

}  // namespace attestor::chain
