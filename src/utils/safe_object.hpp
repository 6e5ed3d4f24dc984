/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>

#include "utils/ctor_limiters.hpp"

namespace attestor::utils {

  /**
   * @brief Thread-safe wrapper for any object
   *
   * All access goes through a functor executed under the lock, so the
   * wrapped value never escapes unguarded.
   *
   * @tparam T The type of object to wrap
   * @tparam M The mutex type (defaults to std::shared_mutex)
   */
  template <typename T, typename M = std::shared_mutex>
  struct SafeObject {
    using Type = T;

    template <typename... Args>
    SafeObject(Args &&...args) : t_(std::forward<Args>(args)...) {}

    /// Applies @param f to the wrapped object under exclusive lock
    template <typename F>
    inline auto exclusiveAccess(F &&f) {
      std::unique_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

    /// Applies @param f to the wrapped object under shared lock
    template <typename F>
    inline auto sharedAccess(F &&f) const {
      std::shared_lock lock(cs_);
      return std::forward<F>(f)(t_);
    }

   private:
    T t_;
    mutable M cs_;
  };

  /**
   * @brief Auto-reset event
   *
   * One thread waits until another signals. A successful wait consumes the
   * signal; several signals before a wait collapse into one.
   */
  class WaitForSingleObject final : NonCopyable, NonMovable {
    std::condition_variable wait_cv_;
    std::mutex wait_m_;
    bool flag_;  // true = not signaled

   public:
    WaitForSingleObject() : flag_{true} {}

    /// @return true if signaled, false on timeout
    bool wait(std::chrono::microseconds wait_timeout) {
      std::unique_lock<std::mutex> _lock(wait_m_);
      return wait_cv_.wait_for(_lock, wait_timeout, [&]() {
        auto prev = !flag_;
        flag_ = true;
        return prev;
      });
    }

    void wait() {
      std::unique_lock<std::mutex> _lock(wait_m_);
      wait_cv_.wait(_lock, [&]() {
        auto prev = !flag_;
        flag_ = true;
        return prev;
      });
    }

    void set() {
      {
        std::unique_lock<std::mutex> _lock(wait_m_);
        flag_ = false;
      }
      wait_cv_.notify_one();
    }
  };

}  // namespace attestor::utils
