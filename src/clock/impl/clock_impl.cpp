/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/impl/clock_impl.hpp"

namespace attestor::clock {

  SystemClockImpl::TimePoint SystemClockImpl::now() const {
    return std::chrono::system_clock::now();
  }

  SteadyClockImpl::TimePoint SteadyClockImpl::now() const {
    return std::chrono::steady_clock::now();
  }

}  // namespace attestor::clock
