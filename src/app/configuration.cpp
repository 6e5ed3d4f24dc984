/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace attestor::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("attestor"),
        metrics_{
            .endpoint{},
            .enabled{},
        } {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const Configuration::NodeConfig &Configuration::node() const {
    return node_;
  }

  const Configuration::StakingConfig &Configuration::staking() const {
    return staking_;
  }

  const Configuration::SignerConfig &Configuration::signer() const {
    return signer_;
  }

  const Configuration::AttestationConfig &Configuration::attestation() const {
    return attestation_;
  }

  const Configuration::MetricsConfig &Configuration::metrics() const {
    return metrics_;
  }

}  // namespace attestor::app
