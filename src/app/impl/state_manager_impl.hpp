/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "app/state_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <initializer_list>
#include <mutex>
#include <queue>
#include <string_view>

#include <qtils/shared_ref.hpp>

#include "utils/ctor_limiters.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog
namespace attestor::log {
  class LoggingSystem;
}  // namespace attestor::log

namespace attestor::app {

  /**
   * Runs registered stages in order prepare -> launch -> (wait) -> shutdown.
   * SIGINT, SIGTERM and SIGQUIT request the shutdown, SIGHUP rotates log
   * sinks. A failed prepare or launch callback skips the remaining ones of
   * both stages and goes straight to shutdown.
   */
  class StateManagerImpl  // non-final for tests
      : Singleton<StateManager>,
        public StateManager,
        public std::enable_shared_from_this<StateManagerImpl> {
   public:
    StateManagerImpl(qtils::SharedRef<log::LoggingSystem> logging_system);

    ~StateManagerImpl() override;

    void atPrepare(OnPrepare &&cb) override;
    void atLaunch(OnLaunch &&cb) override;
    void atShutdown(OnShutdown &&cb) override;

    void run() override;
    void shutdown() override;

    State state() const override {
      return state_;
    }

   protected:
    void reset();

    void doPrepare() override;
    void doLaunch() override;
    void doShutdown() override;

   private:
    using SignalHandler = void (*)(int);

    static void setSignalHandler(std::initializer_list<int> signals,
                                 SignalHandler handler);

    static std::weak_ptr<StateManagerImpl> wp_to_myself;

    static std::atomic_bool shutdown_signals_enabled;
    static void shutdownSignalsEnable();
    static void shutdownSignalsDisable();
    static void onShutdownSignal(int signal);

    static std::atomic_bool log_rotate_signals_enabled;
    static void logRotateSignalsEnable();
    static void logRotateSignalsDisable();
    static void onLogRotateSignal(int signal);

    /// Moves @param from -> @param running, runs @param callbacks until one
    /// fails, then moves to @param done unless a shutdown intervened
    void runStage(std::string_view name,
                  std::queue<std::function<bool()>> &callbacks,
                  State from,
                  State running,
                  State done);

    void waitShutdownRequest();

    qtils::SharedRef<soralog::Logger> logger_;
    qtils::SharedRef<log::LoggingSystem> logging_system_;

    std::atomic<State> state_ = State::Init;

    std::recursive_mutex mutex_;

    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::queue<OnPrepare> prepare_;
    std::queue<OnLaunch> launch_;
    std::queue<OnShutdown> shutdown_;
  };

}  // namespace attestor::app
