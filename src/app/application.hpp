/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <utils/ctor_limiters.hpp>

namespace attestor::app {

  enum class ApplicationError : uint8_t {
    NODE_UNREACHABLE = 1,
    CHAIN_ID_MISMATCH,
  };

  /// @class Application - attestation agent interface
  class Application : private Singleton<Application> {
   public:
    virtual ~Application() = default;

    /// Checks the node, then runs the agent until shutdown is requested
    virtual outcome::result<void> run() = 0;
  };

}  // namespace attestor::app

OUTCOME_HPP_DECLARE_ERROR(attestor::app, ApplicationError);
