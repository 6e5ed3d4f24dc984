/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/impl/state_manager_impl.hpp"

#include <csignal>
#include <cstring>
#include <functional>

#include "log/logger.hpp"

namespace attestor::app {
  std::weak_ptr<StateManagerImpl> StateManagerImpl::wp_to_myself;

  std::atomic_bool StateManagerImpl::shutdown_signals_enabled{false};
  std::atomic_bool StateManagerImpl::log_rotate_signals_enabled{false};

  void StateManagerImpl::setSignalHandler(std::initializer_list<int> signals,
                                          SignalHandler handler) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = handler;
    sigemptyset(&act.sa_mask);
    for (auto signal : signals) {
      sigaddset(&act.sa_mask, signal);
    }
    // handlers are swapped while the signals are held back
    sigprocmask(SIG_BLOCK, &act.sa_mask, nullptr);
    for (auto signal : signals) {
      sigaction(signal, &act, nullptr);
    }
    sigprocmask(SIG_UNBLOCK, &act.sa_mask, nullptr);
  }

  void StateManagerImpl::shutdownSignalsEnable() {
    setSignalHandler({SIGINT, SIGTERM, SIGQUIT}, onShutdownSignal);
    shutdown_signals_enabled.store(true);
  }

  void StateManagerImpl::shutdownSignalsDisable() {
    auto expected = true;
    if (shutdown_signals_enabled.compare_exchange_strong(expected, false)) {
      setSignalHandler({SIGINT, SIGTERM, SIGQUIT}, SIG_DFL);
    }
  }

  void StateManagerImpl::onShutdownSignal(int signal) {
    shutdownSignalsDisable();
    if (auto self = wp_to_myself.lock()) {
      SL_TRACE(self->logger_, "Shutdown signal {} received", signal);
      self->shutdown();
    }
  }

  void StateManagerImpl::logRotateSignalsEnable() {
    setSignalHandler({SIGHUP}, onLogRotateSignal);
    log_rotate_signals_enabled.store(true);
  }

  void StateManagerImpl::logRotateSignalsDisable() {
    auto expected = true;
    if (log_rotate_signals_enabled.compare_exchange_strong(expected, false)) {
      setSignalHandler({SIGHUP}, SIG_DFL);
    }
  }

  void StateManagerImpl::onLogRotateSignal(int signal) {
    if (auto self = wp_to_myself.lock()) {
      SL_TRACE(self->logger_, "Log rotate signal {} received", signal);
      self->logging_system_->doLogRotate();
    }
  }

  StateManagerImpl::StateManagerImpl(
      qtils::SharedRef<log::LoggingSystem> logging_system)
      : logger_(logging_system->getLogger("StateManager", "application")),
        logging_system_(std::move(logging_system)) {
    shutdownSignalsEnable();
    logRotateSignalsEnable();
    SL_TRACE(logger_, "Signal handlers set up");
  }

  StateManagerImpl::~StateManagerImpl() {
    shutdownSignalsDisable();
    logRotateSignalsDisable();
    wp_to_myself.reset();
  }

  void StateManagerImpl::reset() {
    std::lock_guard lg(mutex_);
    prepare_ = {};
    launch_ = {};
    shutdown_ = {};
    state_ = State::Init;
  }

  void StateManagerImpl::atPrepare(OnPrepare &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::Prepare) {
      throw AppStateException("adding callback for stage 'prepare'");
    }
    prepare_.emplace(std::move(cb));
  }

  void StateManagerImpl::atLaunch(OnLaunch &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::Starting) {
      throw AppStateException("adding callback for stage 'launch'");
    }
    launch_.emplace(std::move(cb));
  }

  void StateManagerImpl::atShutdown(OnShutdown &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::ShuttingDown) {
      throw AppStateException("adding callback for stage 'shutdown'");
    }
    shutdown_.emplace(std::move(cb));
  }

  void StateManagerImpl::runStage(std::string_view name,
                                  std::queue<std::function<bool()>> &callbacks,
                                  State from,
                                  State running,
                                  State done) {
    std::lock_guard lg(mutex_);

    auto state = from;
    if (not state_.compare_exchange_strong(state, running)
        and state != State::ShuttingDown) {
      throw AppStateException(fmt::format("running stage '{}'", name));
    }

    if (not callbacks.empty()) {
      SL_TRACE(logger_, "Running stage '{}'…", name);
    }

    while (not callbacks.empty()) {
      if (state_.load() == running and not callbacks.front()()) {
        SL_ERROR(logger_, "Stage '{}' is failed", name);
        state = running;
        state_.compare_exchange_strong(state, State::ShuttingDown);
      }
      callbacks.pop();
    }

    state = running;
    state_.compare_exchange_strong(state, done);
  }

  void StateManagerImpl::doPrepare() {
    runStage("preparing",
             prepare_,
             State::Init,
             State::Prepare,
             State::ReadyToStart);
  }

  void StateManagerImpl::doLaunch() {
    runStage("launch",
             launch_,
             State::ReadyToStart,
             State::Starting,
             State::Works);
  }

  void StateManagerImpl::doShutdown() {
    std::lock_guard lg(mutex_);

    auto state = State::Works;
    if (not state_.compare_exchange_strong(state, State::ShuttingDown)
        and state != State::ShuttingDown) {
      throw AppStateException("running stage 'shutting down'");
    }

    prepare_ = {};
    launch_ = {};

    // components stop in reverse order of registration
    std::vector<OnShutdown> callbacks;
    while (not shutdown_.empty()) {
      callbacks.emplace_back(std::move(shutdown_.front()));
      shutdown_.pop();
    }
    for (auto it = callbacks.rbegin(); it != callbacks.rend(); ++it) {
      (*it)();
    }

    state = State::ShuttingDown;
    state_.compare_exchange_strong(state, State::ReadyToStop);
  }

  void StateManagerImpl::run() {
    wp_to_myself = weak_from_this();
    if (wp_to_myself.expired()) {
      throw std::logic_error(
          "StateManager must be instantiated on shared pointer before run");
    }

    doPrepare();

    doLaunch();

    if (state_.load() == State::Works) {
      SL_TRACE(logger_, "All components started; waiting shutdown request…");
      waitShutdownRequest();
    }

    SL_TRACE(logger_, "Start doing shutdown…");
    doShutdown();
    SL_TRACE(logger_, "Shutdown is done");

    if (state_.load() != State::ReadyToStop) {
      throw std::logic_error(
          "StateManager is expected in stage 'ready to stop'");
    }
  }

  void StateManagerImpl::waitShutdownRequest() {
    std::unique_lock lock(cv_mutex_);
    cv_.wait(lock, [&] { return state_ == State::ShuttingDown; });
  }

  void StateManagerImpl::shutdown() {
    shutdownSignalsDisable();
    auto state = state_.load();
    if (state == State::ReadyToStop or state == State::ShuttingDown) {
      SL_TRACE(logger_, "Shutting down requested, but it is already done");
      return;
    }

    SL_TRACE(logger_, "Shutting down requested…");
    std::lock_guard lg(cv_mutex_);
    state_.store(State::ShuttingDown);
    cv_.notify_one();
  }
}  // namespace attestor::app
