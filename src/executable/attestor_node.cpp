/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>
#include <memory>
#include <system_error>

#include <fmt/format.h>
#include <qtils/final_action.hpp>
#include <soralog/impl/configurator_from_yaml.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/util.hpp>

#include "app/application.hpp"
#include "app/configuration.hpp"
#include "app/configurator.hpp"
#include "injector/node_injector.hpp"
#include "log/logger.hpp"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)

namespace {
  void wrong_usage() {
    std::cerr << "Wrong usage.\n"
                 "Run with `--help' argument to print usage\n";
  }

  using attestor::app::Configuration;
  using attestor::injector::NodeInjector;
  using attestor::log::LoggingSystem;

  int run_node(std::shared_ptr<LoggingSystem> logsys,
               std::shared_ptr<Configuration> appcfg) {
    auto logger = logsys->getLogger("Main", attestor::log::defaultGroupName);

    std::shared_ptr<attestor::app::Application> app;
    try {
      auto injector = std::make_unique<NodeInjector>(logsys, appcfg);
      app = injector->injectApplication();
      SL_INFO(logger, "Agent started. Version: {} ", appcfg->nodeVersion());

      if (auto res = app->run(); res.has_error()) {
        SL_CRITICAL(logger, "Agent failed to start: {}", res.error());
        logger->flush();
        return EXIT_FAILURE;
      }
    } catch (const std::exception &e) {
      SL_CRITICAL(logger, "Agent failed: {}", e.what());
      logger->flush();
      return EXIT_FAILURE;
    }

    SL_INFO(logger, "Agent stopped");
    logger->flush();

    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv, const char **env) {
  setlinebuf(stdout);
  setlinebuf(stderr);

  soralog::util::setThreadName("attestor");

  qtils::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  if (argc <= 1) {
    wrong_usage();
    return EXIT_FAILURE;
  }

  auto app_configurator =
      std::make_unique<attestor::app::Configurator>(argc, argv, env);

  // Parse CLI args for help, version and config
  if (auto res = app_configurator->step1(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Parse remaining args
  if (auto res = app_configurator->step2(); res.has_value()) {
    if (res.value()) {
      return EXIT_SUCCESS;
    }
  } else {
    return EXIT_FAILURE;
  }

  // Setup logging system
  auto logging_system = ({
    auto log_config = app_configurator->getLoggingConfig();
    if (log_config.has_error()) {
      std::cerr << "Logging config is empty.\n";
      return EXIT_FAILURE;
    }

    auto log_configurator = std::make_shared<soralog::ConfiguratorFromYAML>(
        std::shared_ptr<soralog::Configurator>(nullptr), log_config.value());

    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(log_configurator));

    auto config_result = logging_system->configure();
    if (not config_result.message.empty()) {
      (config_result.has_error ? std::cerr : std::cout)
          << config_result.message << '\n';
    }
    if (config_result.has_error) {
      return EXIT_FAILURE;
    }

    std::make_shared<LoggingSystem>(std::move(logging_system));
  });

  if (auto res = logging_system->tuneLoggingSystem(
          app_configurator->getLoggingCliArgs());
      res.has_error()) {
    fmt::print(stderr, "Bad --log option: {}\n", res.error().message());
    return EXIT_FAILURE;
  }

  // Setup config
  auto app_configuration = ({
    auto logger = logging_system->getLogger("Configurator",
                                            attestor::log::defaultGroupName);

    auto config_res = app_configurator->calculateConfig(logger);
    if (config_res.has_error()) {
      auto error = config_res.error();
      SL_CRITICAL(logger, "Failed to calculate config: {}", error);
      fmt::print(stderr, "Failed to calculate config: {}\n", error);
      fmt::print(stderr, "See more details in the log\n");
      return EXIT_FAILURE;
    }

    config_res.value();
  });

  auto exit_code = run_node(logging_system, app_configuration);

  auto logger =
      logging_system->getLogger("Main", attestor::log::defaultGroupName);
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
