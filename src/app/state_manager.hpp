/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace attestor::app {

  // An object registered with the state manager is expected to have at least
  // one stage method; a method with a fitting name but wrong signature must
  // fail to compile rather than be skipped
  template <typename T>
  concept StatePreparable = requires(T &t) { t.prepare(); };
  template <typename T>
  concept StateStartable = requires(T &t) { t.start(); };
  template <typename T>
  concept StateStoppable = requires(T &t) { t.stop(); };

  template <typename T>
  concept StateControllable =
      StatePreparable<T> || StateStartable<T> || StateStoppable<T>;

  class StateManager {
   public:
    using OnPrepare = std::function<bool()>;
    using OnLaunch = std::function<bool()>;
    using OnShutdown = std::function<void()>;

    enum class State : uint8_t {
      Init,
      Prepare,
      ReadyToStart,
      Starting,
      Works,
      ShuttingDown,
      ReadyToStop,
    };

    virtual ~StateManager() = default;

    /// Execute @param cb at stage 'preparations' of application
    virtual void atPrepare(OnPrepare &&cb) = 0;

    /// Execute @param cb immediately before start application
    virtual void atLaunch(OnLaunch &&cb) = 0;

    /// Execute @param cb at stage of shutting down application
    virtual void atShutdown(OnShutdown &&cb) = 0;

    /**
     * Registers stage methods of @param entity as handlers of application
     * life-cycle stages. `prepare` and `start` may return `bool` (false fails
     * the stage) or nothing.
     */
    template <StateControllable Controlled>
    void takeControl(Controlled &entity) {
      if constexpr (StatePreparable<Controlled>) {
        atPrepare([&entity]() -> bool {
          return callStage(entity, [](auto &e) { return e.prepare(); });
        });
      }
      if constexpr (StateStartable<Controlled>) {
        atLaunch([&entity]() -> bool {
          return callStage(entity, [](auto &e) { return e.start(); });
        });
      }
      if constexpr (StateStoppable<Controlled>) {
        atShutdown([&entity]() -> void { entity.stop(); });
      }
    }

    /// Start application life cycle
    virtual void run() = 0;

    /// Initiate shutting down (at any time)
    virtual void shutdown() = 0;

    /// Get current stage
    virtual State state() const = 0;

   protected:
    virtual void doPrepare() = 0;
    virtual void doLaunch() = 0;
    virtual void doShutdown() = 0;

   private:
    template <typename T, typename F>
    static bool callStage(T &entity, const F &f) {
      if constexpr (std::is_void_v<decltype(f(entity))>) {
        f(entity);
        return true;
      } else {
        return f(entity);
      }
    }
  };

  struct AppStateException : public std::runtime_error {
    explicit AppStateException(std::string message)
        : std::runtime_error("Wrong workflow at " + std::move(message)) {}
  };

}  // namespace attestor::app
