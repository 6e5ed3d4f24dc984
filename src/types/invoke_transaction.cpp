/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/invoke_transaction.hpp"

#include "crypto/poseidon.hpp"

namespace attestor {

  namespace {
    // (resource name << 192) | (max_amount << 128) | max_price_per_unit
    Felt packResource(std::string_view name, const ResourceBounds &bounds) {
      uint256_t packed = Felt::fromShortString(name).value() << 192;
      packed |= bounds.max_amount.value() << 128;
      packed |= bounds.max_price_per_unit.value();
      return Felt::fromBig(packed);
    }

    Felt feeFieldsHash(const InvokeTransactionV3 &tx) {
      std::vector<Felt> fields{
          tx.tip,
          packResource("L1_GAS", tx.resource_bounds.l1_gas),
          packResource("L2_GAS", tx.resource_bounds.l2_gas),
          packResource("L1_DATA", tx.resource_bounds.l1_data_gas),
      };
      return crypto::poseidonHashMany(fields);
    }

    uint64_t dataAvailabilityMode(std::string_view mode) {
      return mode == "L2" ? 1 : 0;
    }
  }  // namespace

  Felt InvokeTransactionV3::queryVersion() {
    static const Felt version = Felt::fromBig((uint256_t{1} << 128) + 3);
    return version;
  }

  InvokeTransactionV3 InvokeTransactionV3::asQuery() const {
    auto query = *this;
    query.version = queryVersion();
    query.signature.clear();
    return query;
  }

  std::vector<Felt> encodeExecuteCalldata(const std::vector<Call> &calls) {
    std::vector<Felt> calldata;
    calldata.emplace_back(calls.size());
    for (auto &call : calls) {
      calldata.emplace_back(call.to);
      calldata.emplace_back(call.selector);
      calldata.emplace_back(call.calldata.size());
      calldata.insert(
          calldata.end(), call.calldata.begin(), call.calldata.end());
    }
    return calldata;
  }

  TransactionHash transactionHash(const InvokeTransactionV3 &tx,
                                  const ChainId &chain_id) {
    auto da_modes =
        (dataAvailabilityMode(tx.nonce_data_availability_mode) << 32)
        + dataAvailabilityMode(tx.fee_data_availability_mode);
    std::vector<Felt> elements{
        Felt::fromShortString("invoke"),
        tx.version,
        tx.sender_address,
        feeFieldsHash(tx),
        crypto::poseidonHashMany(tx.paymaster_data),
        chain_id,
        tx.nonce,
        Felt{da_modes},
        crypto::poseidonHashMany(tx.account_deployment_data),
        crypto::poseidonHashMany(tx.calldata),
    };
    return crypto::poseidonHashMany(elements);
  }

}  // namespace attestor
