/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

namespace attestor::log {
  class LoggingSystem;
}  // namespace attestor::log

namespace attestor::app {
  class Configuration;
  class Application;
}  // namespace attestor::app

namespace attestor::injector {

  /**
   * Dependency injector of the agent. Provides the application with all its
   * components; the signer implementation is chosen by the configuration.
   */
  class NodeInjector final {
   public:
    explicit NodeInjector(std::shared_ptr<log::LoggingSystem> logging_system,
                          std::shared_ptr<app::Configuration> app_config);

    std::shared_ptr<app::Application> injectApplication();

   protected:
    std::shared_ptr<class NodeInjectorImpl> pimpl_;
  };

}  // namespace attestor::injector
