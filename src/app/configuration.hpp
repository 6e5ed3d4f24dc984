/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <utils/ctor_limiters.hpp>

#include "types/types.hpp"

namespace attestor::app {
  class Configuration : Singleton<Configuration> {
   public:
    using Endpoint = boost::asio::ip::tcp::endpoint;
    using Duration = std::chrono::milliseconds;

    struct NodeConfig {
      /// HTTP(S) JSON-RPC endpoint
      std::string url;
      /// Websocket endpoint for `starknet_subscribeNewHeads`
      std::optional<std::string> ws_url;
      Duration rpc_timeout = std::chrono::seconds{10};
      Duration block_poll_interval = std::chrono::seconds{2};
    };

    struct StakingConfig {
      std::string network = "sepolia";
      ChainId chain_id;
      ContractAddress staking_contract;
      ContractAddress attestation_contract;
      ContractAddress strk_token;
      ContractAddress operational_address;
    };

    struct SignerConfig {
      /// Never printed
      std::optional<Felt> private_key;
      std::optional<std::string> remote_url;
      /// Use `/get_public_key` + `/sign_hash` instead of `/sign`
      bool remote_legacy = false;
      Duration timeout = std::chrono::seconds{10};
    };

    struct AttestationConfig {
      /// Blocks after the assigned block before submission may start
      uint64_t min_attestation_delay = 10;
      /// Blocks without confirmation after which a transaction is re-sent
      uint64_t resubmit_interval = 5;
      /// Blocks between two confirmation polls of one obligation
      uint64_t confirmation_poll_interval = 1;
      Duration retry_initial_backoff = std::chrono::milliseconds{500};
      Duration retry_max_backoff = std::chrono::seconds{8};
      /// Applied to both estimated amounts and prices
      uint64_t fee_multiplier_percent = 150;
      double tip_boost = 1.0;
      uint64_t minimum_tip = 0;
    };

    struct MetricsConfig {
      Endpoint endpoint;
      std::optional<bool> enabled;
    };

    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;

    [[nodiscard]] virtual const NodeConfig &node() const;
    [[nodiscard]] virtual const StakingConfig &staking() const;
    [[nodiscard]] virtual const SignerConfig &signer() const;
    [[nodiscard]] virtual const AttestationConfig &attestation() const;
    [[nodiscard]] virtual const MetricsConfig &metrics() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;

    NodeConfig node_;
    StakingConfig staking_;
    SignerConfig signer_;
    AttestationConfig attestation_;
    MetricsConfig metrics_;
  };

}  // namespace attestor::app
