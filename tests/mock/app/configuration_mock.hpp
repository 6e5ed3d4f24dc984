/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "app/configuration.hpp"

namespace attestor::app {

  class ConfigurationMock : public Configuration {
   public:
    // clang-format off
    MOCK_METHOD(const std::string&, nodeVersion, (), (const, override));
    MOCK_METHOD(const std::string&, nodeName, (), (const, override));

    MOCK_METHOD(const NodeConfig &, node, (), (const, override));
    MOCK_METHOD(const StakingConfig &, staking, (), (const, override));
    MOCK_METHOD(const SignerConfig &, signer, (), (const, override));
    MOCK_METHOD(const AttestationConfig &, attestation, (), (const, override));
    MOCK_METHOD(const MetricsConfig &, metrics, (), (const, override));
    // clang-format on
  };

}  // namespace attestor::app
