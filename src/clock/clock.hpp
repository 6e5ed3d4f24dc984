/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace attestor::clock {

  /**
   * Source of the current time, replaceable in tests
   * @tparam ClockType underlying std clock
   */
  template <typename ClockType>
  class Clock {
   public:
    using Duration = typename ClockType::duration;
    using TimePoint = typename ClockType::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual TimePoint now() const = 0;
  };

  /// Wall clock, for timestamps exported to operators
  class SystemClock : public virtual Clock<std::chrono::system_clock> {
   public:
    /// Seconds since the Unix epoch
    [[nodiscard]] uint64_t nowSec() const {
      return std::chrono::duration_cast<std::chrono::seconds>(
                 now().time_since_epoch())
          .count();
    }
  };

  /// Monotonic clock for retry deadlines
  class SteadyClock : public virtual Clock<std::chrono::steady_clock> {};

}  // namespace attestor::clock
