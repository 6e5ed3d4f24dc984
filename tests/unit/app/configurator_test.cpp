/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <filesystem>
#include <fstream>

#include <fmt/ranges.h>
#include <gtest/gtest.h>

#include "app/configuration.hpp"
#include "app/network.hpp"
#include "qtils/test/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using attestor::Felt;
using attestor::app::Configuration;
using attestor::app::Configurator;
using ConfiguratorError = attestor::app::Configurator::Error;

namespace {
  constexpr auto kKeyEnv =
      "ATTESTOR_OPERATIONAL_PRIVATE_KEY="
      "0x3c1e9550e66958296d11b60f8e8e7a7ad990d07fa65d5f7652c4a6c87d4e3cc";
}  // namespace

class ConfiguratorTest : public testing::Test {
 protected:
  void TearDown() override {
    if (not config_file_.empty()) {
      std::filesystem::remove(config_file_);
    }
  }

  /// Runs both CLI steps and config calculation like the node does
  outcome::result<std::shared_ptr<Configuration>> configure(
      std::vector<std::string> args, std::vector<std::string> env = {kKeyEnv}) {
    args.insert(args.begin(), "attestor_node");
    std::vector<const char *> argv;
    for (auto &arg : args) {
      argv.emplace_back(arg.c_str());
    }
    std::vector<const char *> envp;
    for (auto &entry : env) {
      envp.emplace_back(entry.c_str());
    }
    envp.emplace_back(nullptr);

    Configurator configurator{
        static_cast<int>(argv.size()), argv.data(), envp.data()};
    OUTCOME_TRY(configurator.step1());
    OUTCOME_TRY(configurator.step2());
    return configurator.calculateConfig(
        logsys_->getLogger("Configurator", "testing"));
  }

  std::string writeConfigFile(std::string_view yaml) {
    config_file_ = std::filesystem::temp_directory_path()
                 / fmt::format("attestor_config_{}.yaml",
                               ::testing::UnitTest::GetInstance()
                                   ->current_test_info()
                                   ->name());
    std::ofstream{config_file_} << yaml;
    return config_file_.string();
  }

  static std::vector<std::string> minimalArgs() {
    return {"--node-url",
            "http://localhost:9545/rpc/v0_8",
            "--staker-operational-address",
            "0xa11ce"};
  }

  qtils::SharedRef<attestor::log::LoggingSystem> logsys_ =
      testutil::prepareLoggers();
  std::filesystem::path config_file_;
};

/**
 * @given only the mandatory options and a private key in the environment
 * @when configuration is calculated
 * @then network preset and documented defaults are used
 */
TEST_F(ConfiguratorTest, Defaults) {
  ASSERT_OUTCOME_SUCCESS(config, configure(minimalArgs()));

  EXPECT_EQ(config->nodeName(), "attestor");
  EXPECT_EQ(config->node().url, "http://localhost:9545/rpc/v0_8");
  EXPECT_EQ(config->node().ws_url, std::nullopt);
  EXPECT_EQ(config->node().rpc_timeout, std::chrono::seconds{10});

  auto &staking = config->staking();
  EXPECT_EQ(staking.network, "sepolia");
  EXPECT_EQ(staking.chain_id, Felt::fromShortString("SN_SEPOLIA"));
  EXPECT_EQ(staking.staking_contract,
            Felt::fromHex(attestor::app::kSepolia.staking_contract).value());
  EXPECT_EQ(staking.operational_address, Felt{0xa11ce});

  EXPECT_EQ(config->signer().private_key,
            Felt::fromHex("0x3c1e9550e66958296d11b60f8e8e7a7ad990d07fa65d5f7"
                          "652c4a6c87d4e3cc")
                .value());
  EXPECT_EQ(config->signer().remote_url, std::nullopt);

  EXPECT_EQ(config->attestation().min_attestation_delay, 10);
  EXPECT_EQ(config->attestation().fee_multiplier_percent, 150);
  EXPECT_EQ(config->metrics().enabled, true);
  EXPECT_EQ(config->metrics().endpoint.port(), 9090);
}

TEST_F(ConfiguratorTest, CommandLineOptions) {
  auto args = minimalArgs();
  args.insert(args.end(),
              {"--network",
               "mainnet",
               "--node-ws-url",
               "wss://node.example/ws",
               "--rpc-timeout",
               "3",
               "--min-attestation-delay",
               "2",
               "--tip-boost",
               "1.5",
               "--prometheus-port",
               "9615",
               "-lchain=debug"});
  ASSERT_OUTCOME_SUCCESS(config, configure(args));

  EXPECT_EQ(config->staking().chain_id, Felt::fromShortString("SN_MAIN"));
  EXPECT_EQ(config->staking().attestation_contract,
            Felt::fromHex(attestor::app::kMainnet.attestation_contract).value());
  EXPECT_EQ(config->node().ws_url, "wss://node.example/ws");
  EXPECT_EQ(config->node().rpc_timeout, std::chrono::seconds{3});
  EXPECT_EQ(config->attestation().min_attestation_delay, 2);
  EXPECT_DOUBLE_EQ(config->attestation().tip_boost, 1.5);
  EXPECT_EQ(config->metrics().endpoint.port(), 9615);
}

/**
 * @given a config file and a command line overriding part of it
 * @when configuration is calculated
 * @then command line values take precedence over the file
 */
TEST_F(ConfiguratorTest, FileThenCommandLine) {
  auto path = writeConfigFile(R"(
general:
  name: validator-1
node:
  url: https://file.example/rpc
  block-poll-interval: 4
staking:
  operational-address: "0xb0b"
  staking-contract-address: "0x5a4e"
signer:
  remote-url: http://127.0.0.1:8080
attestation:
  resubmit-interval: 9
  minimum-tip: 100
metrics:
  enabled: false
)");
  ASSERT_OUTCOME_SUCCESS(
      config,
      configure({"--config", path, "--node-url", "http://cli.example/rpc"},
                {}));

  EXPECT_EQ(config->nodeName(), "validator-1");
  EXPECT_EQ(config->node().url, "http://cli.example/rpc");
  EXPECT_EQ(config->node().block_poll_interval, std::chrono::seconds{4});
  EXPECT_EQ(config->staking().operational_address, Felt{0xb0b});
  EXPECT_EQ(config->staking().staking_contract, Felt{0x5a4e});
  EXPECT_EQ(config->signer().remote_url, "http://127.0.0.1:8080");
  EXPECT_EQ(config->signer().private_key, std::nullopt);
  EXPECT_EQ(config->attestation().resubmit_interval, 9);
  EXPECT_EQ(config->attestation().minimum_tip, 100);
  EXPECT_EQ(config->metrics().enabled, false);
}

TEST_F(ConfiguratorTest, InvalidFileValue) {
  auto path = writeConfigFile(R"(
attestation:
  resubmit-interval: soon
)");
  auto args = minimalArgs();
  args.insert(args.end(), {"--config", path});
  auto res = configure(args);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), ConfiguratorError::ConfigFileParseFailed);
}

TEST_F(ConfiguratorTest, UnknownOption) {
  auto args = minimalArgs();
  args.emplace_back("--bogus");
  auto res = configure(args);
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error(), ConfiguratorError::CliArgsParseFailed);
}

/**
 * @given configurations violating one constraint each
 * @when configuration is calculated
 * @then it is rejected as invalid
 */
TEST_F(ConfiguratorTest, InvalidValues) {
  std::vector<std::pair<std::vector<std::string>, std::vector<std::string>>>
      cases{
          // no node url
          {{"--staker-operational-address", "0xa11ce"}, {kKeyEnv}},
          // not http
          {{"--node-url", "ftp://x", "--staker-operational-address", "0x1"},
           {kKeyEnv}},
          // no operational address
          {{"--node-url", "http://x"}, {kKeyEnv}},
          // zero address
          {{"--node-url", "http://x", "--staker-operational-address", "0x0"},
           {kKeyEnv}},
          // unknown network
          {{"--node-url",
            "http://x",
            "--staker-operational-address",
            "0x1",
            "--network",
            "devnet"},
           {kKeyEnv}},
          // no signer
          {minimalArgs(), {}},
          // both signers
          {{"--node-url",
            "http://x",
            "--staker-operational-address",
            "0x1",
            "--remote-signer-url",
            "http://signer"},
           {kKeyEnv}},
          // key not a field element
          {minimalArgs(), {"ATTESTOR_OPERATIONAL_PRIVATE_KEY=0xnope"}},
          // fee multiplier below 100%
          {{"--node-url",
            "http://x",
            "--staker-operational-address",
            "0x1",
            "--fee-multiplier-percent",
            "90"},
           {kKeyEnv}},
          // max backoff below initial
          {{"--node-url",
            "http://x",
            "--staker-operational-address",
            "0x1",
            "--retry-initial-backoff-ms",
            "1000",
            "--retry-max-backoff-ms",
            "10"},
           {kKeyEnv}},
      };
  for (auto &[args, env] : cases) {
    auto res = configure(args, env);
    ASSERT_FALSE(res.has_value()) << fmt::format("{}", fmt::join(args, " "));
    EXPECT_EQ(res.error(), ConfiguratorError::InvalidValue)
        << fmt::format("{}", fmt::join(args, " "));
  }
}
