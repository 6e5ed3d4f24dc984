/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "serde/json_fwd.hpp"
#include "types/types.hpp"

namespace attestor {

  /// Limits for one resource; amount fits u64, price fits u128
  struct ResourceBounds {
    Felt max_amount;
    Felt max_price_per_unit;

    bool operator==(const ResourceBounds &) const = default;

    JSON_FIELDS(max_amount, max_price_per_unit)
  };

  struct ResourceBoundsMapping {
    ResourceBounds l1_gas;
    ResourceBounds l1_data_gas;
    ResourceBounds l2_gas;

    bool operator==(const ResourceBoundsMapping &) const = default;

    JSON_FIELDS(l1_gas, l1_data_gas, l2_gas)
  };

  /// Single contract call inside an account `__execute__`
  struct Call {
    ContractAddress to;
    Felt selector;
    std::vector<Felt> calldata;
  };

  /**
   * @struct InvokeTransactionV3
   * Broadcasted invoke transaction, member names follow the JSON-RPC schema
   * so the same object is sent to the node and to a remote signer
   */
  struct InvokeTransactionV3 {
    std::string type = "INVOKE";
    ContractAddress sender_address;
    std::vector<Felt> calldata;
    Felt version{3};
    std::vector<Felt> signature;
    Nonce nonce;
    ResourceBoundsMapping resource_bounds;
    Felt tip;
    std::vector<Felt> paymaster_data;
    std::vector<Felt> account_deployment_data;
    std::string nonce_data_availability_mode = "L1";
    std::string fee_data_availability_mode = "L1";

    bool operator==(const InvokeTransactionV3 &) const = default;

    JSON_FIELDS(type,
                sender_address,
                calldata,
                version,
                signature,
                nonce,
                resource_bounds,
                tip,
                paymaster_data,
                account_deployment_data,
                nonce_data_availability_mode,
                fee_data_availability_mode)

    /// Version used for fee estimation, 2^128 + 3
    static Felt queryVersion();

    bool isQuery() const {
      return version == queryVersion();
    }

    /// Same transaction with query version and no signature
    InvokeTransactionV3 asQuery() const;
  };

  /// `__execute__` calldata of the Cairo 1 account encoding
  std::vector<Felt> encodeExecuteCalldata(const std::vector<Call> &calls);

  /// Poseidon-based v3 invoke transaction hash, the message being signed
  TransactionHash transactionHash(const InvokeTransactionV3 &tx,
                                  const ChainId &chain_id);

}  // namespace attestor
