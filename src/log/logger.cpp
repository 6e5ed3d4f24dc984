/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>

OUTCOME_CPP_DEFINE_CATEGORY(attestor::log, Error, e) {
  using E = attestor::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown log level";
    case E::WRONG_GROUP:
      return "Unknown log group";
    case E::MALFORMED_FILTER:
      return "Log filter is not <level> or <group>=<level>";
  }
  return "Unknown log::Error";
}

namespace attestor::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    static const std::vector<std::pair<std::string_view, Level>> kLevels{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"warn", Level::WARN},
        {"warning", Level::WARN},
        {"error", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"off", Level::OFF},
    };
    for (auto &[name, level] : kLevels) {
      if (str == name) {
        return level;
      }
    }
    return Error::WRONG_LEVEL;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &filters) {
    for (auto &filter : filters) {
      auto eq = filter.find('=');
      if (eq == std::string::npos) {
        auto level_res = str2lvl(filter);
        if (not level_res.has_value()) {
          std::cerr << "Invalid log level: " << filter << '\n';
          return level_res.error();
        }
        std::ignore =
            logging_system_->setLevelOfGroup(defaultGroupName, level_res.value());
        continue;
      }

      auto group_name = filter.substr(0, eq);
      if (group_name.empty()) {
        std::cerr << "Invalid log filter: " << filter << '\n';
        return Error::MALFORMED_FILTER;
      }
      if (not logging_system_->getGroup(group_name)) {
        std::cerr << "Unknown log group: " << group_name << '\n';
        return Error::WRONG_GROUP;
      }
      auto level_string = filter.substr(eq + 1);
      auto level_res = str2lvl(level_string);
      if (not level_res.has_value()) {
        std::cerr << "Invalid level '" << level_string << "' for group "
                  << group_name << '\n';
        return level_res.error();
      }
      std::ignore =
          logging_system_->setLevelOfGroup(group_name, level_res.value());
    }
    return outcome::success();
  }

}  // namespace attestor::log
