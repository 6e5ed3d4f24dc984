/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "chain/chain_client.hpp"

namespace attestor::chain {

  class ChainClientMock : public ChainClient {
   public:
    MOCK_METHOD(outcome::result<ChainId>, chainId, (), (override));

    MOCK_METHOD(outcome::result<BlockNumber>,
                latestBlockNumber,
                (),
                (override));

    MOCK_METHOD(outcome::result<BlockHeader>,
                blockByNumber,
                (BlockNumber),
                (override));

    MOCK_METHOD(outcome::result<std::vector<uint64_t>>,
                latestBlockTips,
                (),
                (override));

    MOCK_METHOD(outcome::result<AttestationInfo>,
                attestationInfo,
                (const ContractAddress &),
                (override));

    MOCK_METHOD(outcome::result<Nonce>,
                accountNonce,
                (const ContractAddress &),
                (override));

    MOCK_METHOD(outcome::result<uint256_t>,
                accountBalance,
                (const ContractAddress &),
                (override));

    MOCK_METHOD(outcome::result<FeeEstimate>,
                estimateFee,
                (const InvokeTransactionV3 &),
                (override));

    MOCK_METHOD(outcome::result<TransactionHash>,
                submitTransaction,
                (const InvokeTransactionV3 &),
                (override));

    MOCK_METHOD(outcome::result<TransactionStatus>,
                transactionStatus,
                (const TransactionHash &),
                (override));

    MOCK_METHOD(outcome::result<std::vector<AttestationEvent>>,
                attestationEvents,
                (const ContractAddress &, BlockNumber),
                (override));
  };

}  // namespace attestor::chain
