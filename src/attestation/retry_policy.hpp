/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <system_error>

namespace attestor::attestation {

  enum class ErrorClass : uint8_t {
    /// Worth retrying while the window is open
    Transient,
    /// Retrying can not help in this epoch
    Terminal,
  };

  /**
   * Exponential backoff shared by every failure of an obligation.
   * The deadline is the window end, enforced by the scheduler.
   */
  class RetryPolicy {
   public:
    using Duration = std::chrono::milliseconds;

    RetryPolicy(Duration initial_backoff, Duration max_backoff)
        : initial_backoff_{initial_backoff}, max_backoff_{max_backoff} {}

    static ErrorClass classify(const std::error_code &error);

    /// Delay before retry number @param attempt (0-based)
    Duration delay(size_t attempt) const;

   private:
    Duration initial_backoff_;
    Duration max_backoff_;
  };

}  // namespace attestor::attestation
