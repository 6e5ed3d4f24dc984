/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <boost/algorithm/string/trim.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/program_options.hpp>
#include <boost/program_options/value_semantic.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "app/network.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(attestor::app, Configurator::Error, e) {
  using E = attestor::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  return "Unknown app::Configurator::Error";
}

namespace {
  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool find_argument(boost::program_options::variables_map &vm,
                     const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return true;
      }
    }
    return false;
  }

  std::chrono::milliseconds seconds(uint32_t value) {
    return std::chrono::seconds{value};
  }

}  // namespace

namespace attestor::app {

  Configurator::Configurator(int argc, const char **argv, const char **env)
      : argc_(argc), argv_(argv), env_(env) {
    config_ = std::make_shared<Configuration>();

    config_->version_ = buildVersion();
    config_->name_ = "attestor";

    config_->metrics_.endpoint = {boost::asio::ip::address_v4::any(), 9090};
    config_->metrics_.enabled = std::nullopt;

    namespace po = boost::program_options;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(),  "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of agent.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <group>=<level>, e.g., -lchain=trace.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all groups log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description node_options("Node options");
    node_options.add_options()
        ("node-url", po::value<std::string>(), "Starknet JSON-RPC endpoint (http or https).")
        ("node-ws-url", po::value<std::string>(), "Optional. Starknet websocket endpoint for new heads subscription.")
        ("rpc-timeout", po::value<uint32_t>(), "Timeout of a single node request <seconds>.")
        ("block-poll-interval", po::value<uint32_t>(), "Interval of polling the latest block number <seconds>.")
        ;

    po::options_description staking_options("Staking options");
    staking_options.add_options()
        ("network", po::value<std::string>(), "Network preset: sepolia or mainnet.")
        ("staking-contract-address", po::value<std::string>(), "Override staking contract address of the network.")
        ("attestation-contract-address", po::value<std::string>(), "Override attestation contract address of the network.")
        ("strk-token-address", po::value<std::string>(), "Override STRK token address of the network.")
        ("staker-operational-address", po::value<std::string>(), "Operational account of the staker, attestations are sent from it.")
        ;

    po::options_description signer_options("Signer options");
    signer_options.add_options()
        ("remote-signer-url", po::value<std::string>(), "Use remote signer at the URL instead of the local private key.")
        ("remote-signer-legacy", "Use /get_public_key and /sign_hash endpoints of the remote signer.")
        ;

    po::options_description attestation_options("Attestation options");
    attestation_options.add_options()
        ("min-attestation-delay", po::value<uint64_t>(), "Blocks to wait after the assigned block before attesting.")
        ("resubmit-interval", po::value<uint64_t>(), "Blocks without confirmation after which attestation is resubmitted.")
        ("confirmation-poll-interval", po::value<uint64_t>(), "Blocks between confirmation polls.")
        ("retry-initial-backoff-ms", po::value<uint32_t>(), "Initial delay of retry after transient failure <milliseconds>.")
        ("retry-max-backoff-ms", po::value<uint32_t>(), "Maximal delay of retry after transient failure <milliseconds>.")
        ("fee-multiplier-percent", po::value<uint64_t>(), "Multiplier of estimated resource bounds <percent>.")
        ("tip-boost", po::value<double>(), "Multiplier of the median tip of the latest block.")
        ("minimum-tip", po::value<uint64_t>(), "Lower bound of the tip.")
        ;

    po::options_description metrics_options("Metric options");
    metrics_options.add_options()
        ("prometheus-disable", "Set to disable OpenMetrics.")
        ("prometheus-host", po::value<std::string>(), "Set address for OpenMetrics over HTTP.")
        ("prometheus-port", po::value<uint16_t>(), "Set port for OpenMetrics over HTTP.")
        ;

    // clang-format on

    cli_options_
        .add(general_options)  //
        .add(node_options)
        .add(staking_options)
        .add(signer_options)
        .add(attestation_options)
        .add(metrics_options);
  }

  outcome::result<bool> Configurator::step1() {  // read min cli-args and config
    namespace po = boost::program_options;

    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    po::variables_map vm;

    // first-run parse to read-only general options and to lookup for "help",
    // "config" and "version". all the rest options are ignored
    try {
      po::parsed_options parsed = po::command_line_parser(argc_, argv_)
                                      .options(options)
                                      .allow_unregistered()
                                      .run();
      po::store(parsed, vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Attestor version " << buildVersion() << '\n';
      std::cout << cli_options_ << '\n';
      std::cout << "Environment:\n  " << kPrivateKeyEnv
                << "  Operational account private key (local signer).\n";
      return true;
    }

    if (vm.contains("version")) {
      std::cout << "Attestor version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(path);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(path) << ": "
                  << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n"
                  << "Try run with option '--help' for more information\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    namespace po = boost::program_options;

    try {
      // second-run parse to gather all known options
      // with reporting about any unrecognized input
      po::parsed_options parsed =
          po::command_line_parser(argc_, argv_).options(cli_options_).run();
      po::store(parsed, cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });

    return false;
  }

  static constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: attestor
        children:
          - name: injector
          - name: application
          - name: chain
          - name: signer
          - name: observer
          - name: attestation
          - name: metrics
          - name: http
)yaml";

  outcome::result<YAML::Node> Configurator::getLoggingConfig() {
    auto load_default = [&]() -> outcome::result<YAML::Node> {
      try {
        return YAML::Load(std::string(default_logging_yaml));
      } catch (const std::exception &e) {
        file_errors_ << "E: Failed to load default logging config: " << e.what()
                     << "\n";
        return Error::ConfigFileParseFailed;
      }
    };

    if (not config_file_.has_value()) {
      return load_default();
    }
    auto logging = (*config_file_)["logging"];
    if (logging.IsDefined()) {
      return logging;
    }
    return load_default();
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      qtils::SharedRef<soralog::Logger> logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initNodeConfig());
    OUTCOME_TRY(initStakingConfig());
    OUTCOME_TRY(initSignerConfig());
    OUTCOME_TRY(initAttestationConfig());
    OUTCOME_TRY(initOpenMetricsConfig());

    return config_;
  }

  std::optional<YAML::Node> Configurator::fileSection(
      const std::string &name) {
    if (not config_file_.has_value()) {
      return std::nullopt;
    }
    auto section = (*config_file_)[name];
    if (not section.IsDefined()) {
      return std::nullopt;
    }
    if (not section.IsMap()) {
      file_errors_ << "E: Section '" << name << "' defined, but is not map\n";
      file_has_error_ = true;
      return std::nullopt;
    }
    return section;
  }

  template <typename T>
  std::optional<T> Configurator::fileValue(
      const std::optional<YAML::Node> &section,
      const std::string &section_name,
      const std::string &key) {
    if (not section.has_value()) {
      return std::nullopt;
    }
    auto node = (*section)[key];
    if (not node.IsDefined()) {
      return std::nullopt;
    }
    if (not node.IsScalar()) {
      file_errors_ << "E: Value '" << section_name << "." << key
                   << "' must be scalar\n";
      file_has_error_ = true;
      return std::nullopt;
    }
    try {
      return node.as<T>();
    } catch (const YAML::Exception &) {
      file_errors_ << "E: Value '" << section_name << "." << key
                   << "' has invalid value\n";
      file_has_error_ = true;
      return std::nullopt;
    }
  }

  outcome::result<void> Configurator::checkFileErrors() {
    if (not file_has_error_) {
      return outcome::success();
    }
    std::string path;
    find_argument<std::string>(
        cli_values_map_, "config", [&](const std::string &value) {
          path = value;
        });
    SL_ERROR(logger_, "Config file `{}` has some problems:", path);
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", std::string_view(line).substr(3));
    }
    return Error::ConfigFileParseFailed;
  }

  std::optional<std::string> Configurator::envValue(
      std::string_view name) const {
    if (env_ == nullptr) {
      return std::nullopt;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    for (auto it = env_; *it != nullptr; ++it) {
      std::string_view entry{*it};
      if (entry.size() > name.size() and entry.starts_with(name)
          and entry[name.size()] == '=') {
        return std::string{entry.substr(name.size() + 1)};
      }
    }
    return std::nullopt;
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    auto section = fileSection("general");
    if (auto name = fileValue<std::string>(section, "general", "name")) {
      config_->name_ = *name;
    }
    OUTCOME_TRY(checkFileErrors());

    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });

    return outcome::success();
  }

  outcome::result<void> Configurator::initNodeConfig() {
    auto &node = config_->node_;

    auto section = fileSection("node");
    if (auto url = fileValue<std::string>(section, "node", "url")) {
      node.url = *url;
    }
    if (auto ws_url = fileValue<std::string>(section, "node", "ws-url")) {
      node.ws_url = *ws_url;
    }
    if (auto timeout = fileValue<uint32_t>(section, "node", "rpc-timeout")) {
      node.rpc_timeout = seconds(*timeout);
    }
    if (auto interval =
            fileValue<uint32_t>(section, "node", "block-poll-interval")) {
      node.block_poll_interval = seconds(*interval);
    }
    OUTCOME_TRY(checkFileErrors());

    find_argument<std::string>(
        cli_values_map_, "node-url", [&](const std::string &value) {
          node.url = value;
        });
    find_argument<std::string>(
        cli_values_map_, "node-ws-url", [&](const std::string &value) {
          node.ws_url = value;
        });
    find_argument<uint32_t>(
        cli_values_map_, "rpc-timeout", [&](const uint32_t &value) {
          node.rpc_timeout = seconds(value);
        });
    find_argument<uint32_t>(
        cli_values_map_, "block-poll-interval", [&](const uint32_t &value) {
          node.block_poll_interval = seconds(value);
        });

    // Check values
    boost::trim(node.url);
    if (node.url.empty()) {
      SL_ERROR(logger_, "The node URL must be provided (--node-url)");
      return Error::InvalidValue;
    }
    if (not node.url.starts_with("http://")
        and not node.url.starts_with("https://")) {
      SL_ERROR(logger_, "The node URL must be http or https: {}", node.url);
      return Error::InvalidValue;
    }
    if (node.ws_url.has_value()) {
      boost::trim(*node.ws_url);
      if (node.ws_url->empty()) {
        node.ws_url.reset();
      } else if (not node.ws_url->starts_with("ws://")
                 and not node.ws_url->starts_with("wss://")) {
        SL_ERROR(logger_,
                 "The node websocket URL must be ws or wss: {}",
                 *node.ws_url);
        return Error::InvalidValue;
      }
    }
    if (node.rpc_timeout.count() == 0) {
      SL_ERROR(logger_, "The 'rpc-timeout' must be positive");
      return Error::InvalidValue;
    }
    if (node.block_poll_interval.count() == 0) {
      SL_ERROR(logger_, "The 'block-poll-interval' must be positive");
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initStakingConfig() {
    auto &staking = config_->staking_;

    std::optional<std::string> staking_contract;
    std::optional<std::string> attestation_contract;
    std::optional<std::string> strk_token;
    std::optional<std::string> operational_address;

    auto section = fileSection("staking");
    if (auto network = fileValue<std::string>(section, "staking", "network")) {
      staking.network = *network;
    }
    staking_contract = fileValue<std::string>(
        section, "staking", "staking-contract-address");
    attestation_contract = fileValue<std::string>(
        section, "staking", "attestation-contract-address");
    strk_token =
        fileValue<std::string>(section, "staking", "strk-token-address");
    operational_address =
        fileValue<std::string>(section, "staking", "operational-address");
    OUTCOME_TRY(checkFileErrors());

    find_argument<std::string>(
        cli_values_map_, "network", [&](const std::string &value) {
          staking.network = value;
        });
    find_argument<std::string>(cli_values_map_,
                               "staking-contract-address",
                               [&](const std::string &value) {
                                 staking_contract = value;
                               });
    find_argument<std::string>(cli_values_map_,
                               "attestation-contract-address",
                               [&](const std::string &value) {
                                 attestation_contract = value;
                               });
    find_argument<std::string>(
        cli_values_map_, "strk-token-address", [&](const std::string &value) {
          strk_token = value;
        });
    find_argument<std::string>(cli_values_map_,
                               "staker-operational-address",
                               [&](const std::string &value) {
                                 operational_address = value;
                               });

    // Check values
    auto preset = networkPreset(staking.network);
    if (not preset.has_value()) {
      SL_ERROR(logger_,
               "Unknown network '{}'; expected 'sepolia' or 'mainnet'",
               staking.network);
      return Error::InvalidValue;
    }
    staking.chain_id = Felt::fromShortString(preset->chain_id);

    auto address = [&](std::string_view what,
                       std::string_view value) -> outcome::result<Felt> {
      auto res = Felt::fromHex(value);
      if (res.has_error() or res.value().isZero()) {
        SL_ERROR(logger_, "The '{}' is not a valid address: {}", what, value);
        return Error::InvalidValue;
      }
      return res.value();
    };

    OUTCOME_TRY(staking_address,
                address("staking-contract-address",
                        staking_contract.value_or(
                            std::string{preset->staking_contract})));
    OUTCOME_TRY(attestation_address,
                address("attestation-contract-address",
                        attestation_contract.value_or(
                            std::string{preset->attestation_contract})));
    OUTCOME_TRY(strk_address,
                address("strk-token-address",
                        strk_token.value_or(std::string{preset->strk_token})));
    staking.staking_contract = staking_address;
    staking.attestation_contract = attestation_address;
    staking.strk_token = strk_address;

    if (not operational_address.has_value()) {
      SL_ERROR(logger_,
               "The operational address must be provided "
               "(--staker-operational-address)");
      return Error::InvalidValue;
    }
    OUTCOME_TRY(operational,
                address("staker-operational-address", *operational_address));
    staking.operational_address = operational;

    return outcome::success();
  }

  outcome::result<void> Configurator::initSignerConfig() {
    auto &signer = config_->signer_;

    auto section = fileSection("signer");
    if (auto url = fileValue<std::string>(section, "signer", "remote-url")) {
      signer.remote_url = *url;
    }
    if (auto legacy = fileValue<bool>(section, "signer", "remote-legacy")) {
      signer.remote_legacy = *legacy;
    }
    if (auto timeout = fileValue<uint32_t>(section, "signer", "timeout")) {
      signer.timeout = seconds(*timeout);
    }
    OUTCOME_TRY(checkFileErrors());

    find_argument<std::string>(
        cli_values_map_, "remote-signer-url", [&](const std::string &value) {
          signer.remote_url = value;
        });
    if (find_argument(cli_values_map_, "remote-signer-legacy")) {
      signer.remote_legacy = true;
    }

    if (auto key = envValue(kPrivateKeyEnv)) {
      boost::trim(*key);
      if (not key->empty()) {
        auto res = Felt::fromHex(*key);
        if (res.has_error() or res.value().isZero()) {
          // value itself is never printed
          SL_ERROR(logger_,
                   "The private key in {} is not a valid field element",
                   kPrivateKeyEnv);
          return Error::InvalidValue;
        }
        signer.private_key = res.value();
      }
    }

    // Check values
    if (signer.remote_url.has_value()) {
      boost::trim(*signer.remote_url);
      if (signer.remote_url->empty()) {
        signer.remote_url.reset();
      }
    }
    if (signer.remote_url.has_value() and signer.private_key.has_value()) {
      SL_ERROR(logger_,
               "Both remote signer URL and {} are set; choose one signer",
               kPrivateKeyEnv);
      return Error::InvalidValue;
    }
    if (not signer.remote_url.has_value()
        and not signer.private_key.has_value()) {
      SL_ERROR(logger_,
               "No signer configured: set {} or --remote-signer-url",
               kPrivateKeyEnv);
      return Error::InvalidValue;
    }
    if (signer.remote_url.has_value()
        and not signer.remote_url->starts_with("http://")
        and not signer.remote_url->starts_with("https://")) {
      SL_ERROR(logger_,
               "The remote signer URL must be http or https: {}",
               *signer.remote_url);
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initAttestationConfig() {
    auto &attestation = config_->attestation_;

    auto section = fileSection("attestation");
    if (auto value = fileValue<uint64_t>(
            section, "attestation", "min-attestation-delay")) {
      attestation.min_attestation_delay = *value;
    }
    if (auto value =
            fileValue<uint64_t>(section, "attestation", "resubmit-interval")) {
      attestation.resubmit_interval = *value;
    }
    if (auto value = fileValue<uint64_t>(
            section, "attestation", "confirmation-poll-interval")) {
      attestation.confirmation_poll_interval = *value;
    }
    if (auto value = fileValue<uint32_t>(
            section, "attestation", "retry-initial-backoff-ms")) {
      attestation.retry_initial_backoff = std::chrono::milliseconds{*value};
    }
    if (auto value = fileValue<uint32_t>(
            section, "attestation", "retry-max-backoff-ms")) {
      attestation.retry_max_backoff = std::chrono::milliseconds{*value};
    }
    if (auto value = fileValue<uint64_t>(
            section, "attestation", "fee-multiplier-percent")) {
      attestation.fee_multiplier_percent = *value;
    }
    if (auto value = fileValue<double>(section, "attestation", "tip-boost")) {
      attestation.tip_boost = *value;
    }
    if (auto value =
            fileValue<uint64_t>(section, "attestation", "minimum-tip")) {
      attestation.minimum_tip = *value;
    }
    OUTCOME_TRY(checkFileErrors());

    find_argument<uint64_t>(
        cli_values_map_, "min-attestation-delay", [&](const uint64_t &value) {
          attestation.min_attestation_delay = value;
        });
    find_argument<uint64_t>(
        cli_values_map_, "resubmit-interval", [&](const uint64_t &value) {
          attestation.resubmit_interval = value;
        });
    find_argument<uint64_t>(cli_values_map_,
                            "confirmation-poll-interval",
                            [&](const uint64_t &value) {
                              attestation.confirmation_poll_interval = value;
                            });
    find_argument<uint32_t>(
        cli_values_map_,
        "retry-initial-backoff-ms",
        [&](const uint32_t &value) {
          attestation.retry_initial_backoff = std::chrono::milliseconds{value};
        });
    find_argument<uint32_t>(
        cli_values_map_, "retry-max-backoff-ms", [&](const uint32_t &value) {
          attestation.retry_max_backoff = std::chrono::milliseconds{value};
        });
    find_argument<uint64_t>(
        cli_values_map_, "fee-multiplier-percent", [&](const uint64_t &value) {
          attestation.fee_multiplier_percent = value;
        });
    find_argument<double>(
        cli_values_map_, "tip-boost", [&](const double &value) {
          attestation.tip_boost = value;
        });
    find_argument<uint64_t>(
        cli_values_map_, "minimum-tip", [&](const uint64_t &value) {
          attestation.minimum_tip = value;
        });

    // Check values
    if (attestation.resubmit_interval == 0) {
      SL_ERROR(logger_, "The 'resubmit-interval' must be positive");
      return Error::InvalidValue;
    }
    if (attestation.confirmation_poll_interval == 0) {
      SL_ERROR(logger_, "The 'confirmation-poll-interval' must be positive");
      return Error::InvalidValue;
    }
    if (attestation.retry_max_backoff < attestation.retry_initial_backoff) {
      SL_ERROR(logger_,
               "The 'retry-max-backoff-ms' must not be less than "
               "'retry-initial-backoff-ms'");
      return Error::InvalidValue;
    }
    if (attestation.fee_multiplier_percent < 100) {
      SL_ERROR(logger_,
               "The 'fee-multiplier-percent' must be at least 100, got {}",
               attestation.fee_multiplier_percent);
      return Error::InvalidValue;
    }
    if (not(attestation.tip_boost >= 0)) {
      SL_ERROR(logger_,
               "The 'tip-boost' must be non-negative, got {}",
               attestation.tip_boost);
      return Error::InvalidValue;
    }

    return outcome::success();
  }

  outcome::result<void> Configurator::initOpenMetricsConfig() {
    auto section = fileSection("metrics");
    if (auto enabled = fileValue<bool>(section, "metrics", "enabled")) {
      config_->metrics_.enabled = *enabled;
    }
    if (auto host = fileValue<std::string>(section, "metrics", "host")) {
      boost::beast::error_code ec;
      auto address = boost::asio::ip::make_address(*host, ec);
      if (!ec) {
        config_->metrics_.endpoint = {address,
                                      config_->metrics_.endpoint.port()};
        if (not config_->metrics_.enabled.has_value()) {
          config_->metrics_.enabled = true;
        }
      } else {
        file_errors_ << "E: Value 'metrics.host' defined, "
                        "but has invalid value\n";
        file_has_error_ = true;
      }
    }
    if (auto port = fileValue<int64_t>(section, "metrics", "port")) {
      if (*port > 0 and *port <= 65535) {
        config_->metrics_.endpoint = {config_->metrics_.endpoint.address(),
                                      static_cast<uint16_t>(*port)};
        if (not config_->metrics_.enabled.has_value()) {
          config_->metrics_.enabled = true;
        }
      } else {
        file_errors_ << "E: Value 'metrics.port' defined, "
                        "but has invalid value\n";
        file_has_error_ = true;
      }
    }
    OUTCOME_TRY(checkFileErrors());

    bool fail;

    fail = false;
    find_argument<std::string>(
        cli_values_map_, "prometheus-host", [&](const std::string &value) {
          boost::beast::error_code ec;
          auto address = boost::asio::ip::make_address(value, ec);
          if (!ec) {
            config_->metrics_.endpoint = {address,
                                          config_->metrics_.endpoint.port()};
            if (not config_->metrics_.enabled.has_value()) {
              config_->metrics_.enabled = true;
            }
          } else {
            std::cerr << "Option --prometheus-host has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    fail = false;
    find_argument<uint16_t>(
        cli_values_map_, "prometheus-port", [&](const uint16_t &value) {
          if (value > 0) {
            config_->metrics_.endpoint = {config_->metrics_.endpoint.address(),
                                          value};
            if (not config_->metrics_.enabled.has_value()) {
              config_->metrics_.enabled = true;
            }
          } else {
            std::cerr << "Option --prometheus-port has invalid value\n"
                      << "Try run with option '--help' for more information\n";
            fail = true;
          }
        });
    if (fail) {
      return Error::CliArgsParseFailed;
    }

    if (find_argument(cli_values_map_, "prometheus-disable")) {
      config_->metrics_.enabled = false;
    }
    if (not config_->metrics_.enabled.has_value()) {
      config_->metrics_.enabled = true;
    }

    return outcome::success();
  }

}  // namespace attestor::app
