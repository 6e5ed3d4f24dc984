/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>

#include "types/types.hpp"
#include "utils/ctor_limiters.hpp"
#include "utils/safe_object.hpp"

namespace attestor::observer {

  /**
   * Single-slot "latest known block" shared by block sources and the
   * scheduler. Keeps the maximum number seen; duplicates and regressions are
   * dropped without waking the reader.
   */
  class LatestBlock : NonCopyable, NonMovable {
   public:
    /// @return true if @param number advanced the slot
    bool update(BlockNumber number) {
      auto advanced = number_.exclusiveAccess([&](auto &current) {
        if (current.has_value() and current.value() >= number) {
          return false;
        }
        current = number;
        return true;
      });
      if (advanced) {
        event_.set();
      }
      return advanced;
    }

    std::optional<BlockNumber> get() const {
      return number_.sharedAccess([](const auto &current) { return current; });
    }

    /**
     * Blocks until the slot advances, `wakeUp` is called or @param timeout
     * expires, whichever is first
     * @return latest known block, if any
     */
    std::optional<BlockNumber> wait(std::chrono::milliseconds timeout) {
      event_.wait(timeout);
      return get();
    }

    /// Releases a pending `wait`
    void wakeUp() {
      event_.set();
    }

   private:
    utils::SafeObject<std::optional<BlockNumber>> number_;
    utils::WaitForSingleObject event_;
  };

}  // namespace attestor::observer
