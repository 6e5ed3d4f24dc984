/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <log/logger.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

#include "injector/dont_inject.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog

namespace attestor::app {
  class Configuration;
}  // namespace attestor::app

namespace attestor::app {

  /**
   * Builds the process configuration from defaults, an optional YAML file
   * (`--config`) and CLI arguments, in this order of precedence (lowest
   * first). The operational private key is read from the
   * `ATTESTOR_OPERATIONAL_PRIVATE_KEY` environment variable only.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CliArgsParseFailed = 1,
      ConfigFileParseFailed,
      InvalidValue,
    };

    static constexpr std::string_view kPrivateKeyEnv =
        "ATTESTOR_OPERATIONAL_PRIVATE_KEY";

    DONT_INJECT(Configurator);

    Configurator() = delete;
    Configurator(Configurator &&) noexcept = delete;
    Configurator(const Configurator &) = delete;
    ~Configurator() = default;
    Configurator &operator=(Configurator &&) noexcept = delete;
    Configurator &operator=(const Configurator &) = delete;

    Configurator(int argc, const char **argv, const char **env);

    // Parse CLI args for help, version and config
    outcome::result<bool> step1();

    // Parse remaining CLI args
    outcome::result<bool> step2();

    outcome::result<YAML::Node> getLoggingConfig();
    std::vector<std::string> getLoggingCliArgs() {
      return logger_cli_args_;
    }

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        qtils::SharedRef<soralog::Logger> logger);

   private:
    outcome::result<void> initGeneralConfig();
    outcome::result<void> initNodeConfig();
    outcome::result<void> initStakingConfig();
    outcome::result<void> initSignerConfig();
    outcome::result<void> initAttestationConfig();
    outcome::result<void> initOpenMetricsConfig();

    /// Section of the config file, if the file has it as a map
    std::optional<YAML::Node> fileSection(const std::string &name);

    /// Typed scalar `section.key` of the config file
    template <typename T>
    std::optional<T> fileValue(const std::optional<YAML::Node> &section,
                               const std::string &section_name,
                               const std::string &key);

    /// Logs the collected config file problems, if any
    outcome::result<void> checkFileErrors();

    std::optional<std::string> envValue(std::string_view name) const;

    int argc_;
    const char **argv_;
    const char **env_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<YAML::Node> config_file_;
    bool file_has_error_ = false;
    std::ostringstream file_errors_;
    std::vector<std::string> logger_cli_args_;

    boost::program_options::options_description cli_options_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace attestor::app

OUTCOME_HPP_DECLARE_ERROR(attestor::app, Configurator::Error);
