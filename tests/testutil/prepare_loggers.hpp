/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <iostream>
#include <stdexcept>

#include <log/logger.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>

namespace testutil {

  inline qtils::SharedRef<attestor::log::LoggingSystem> makeTestLoggingSystem() {
    static constexpr std::string_view kTestingLogConfig = R"(
sinks:
  - name: console
    type: console
    capacity: 4
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: attestor
        children:
          - name: application
          - name: chain
          - name: signer
          - name: observer
          - name: attestation
          - name: metrics
          - name: http
      - name: testing
        level: trace
)";

    auto log_config = YAML::Load(std::string{kTestingLogConfig});
    if (not log_config.IsDefined()) {
      throw std::runtime_error("Log config is not defined");
    }

    auto log_configurator =
        std::make_shared<soralog::ConfiguratorFromYAML>(log_config);

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      throw std::runtime_error("Cannot configure logging");
    }

    return std::make_shared<attestor::log::LoggingSystem>(
        std::move(logging_system));
  }

  // supposed to be called in SetUpTestCase
  inline qtils::SharedRef<attestor::log::LoggingSystem> prepareLoggers(
      soralog::Level level = soralog::Level::INFO) {
    static qtils::SharedRef<attestor::log::LoggingSystem> logging_system =
        makeTestLoggingSystem();

    std::ignore =
        logging_system->setLevelOfGroup(attestor::log::defaultGroupName, level);

    return logging_system;
  }

}  // namespace testutil
