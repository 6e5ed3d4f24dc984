/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "types/types.hpp"

namespace attestor {

  /**
   * @struct Epoch
   * Run of `length` consecutive blocks starting at `starting_block`
   */
  struct Epoch {
    EpochId id = 0;
    uint64_t length = 0;
    BlockNumber starting_block = 0;

    /// First block of the next epoch
    BlockNumber endBlock() const {
      return starting_block + length;
    }

    bool contains(BlockNumber block) const {
      return block >= starting_block and block < endBlock();
    }

    /// Epoch that directly follows this one, assuming the same length
    Epoch next() const {
      return {id + 1, length, endBlock()};
    }

    bool operator==(const Epoch &) const = default;
  };

}  // namespace attestor

template <>
struct fmt::formatter<attestor::Epoch> {
  constexpr auto parse(format_parse_context &ctx) {
    return ctx.begin();
  }

  auto format(const attestor::Epoch &epoch, format_context &ctx) const {
    return fmt::format_to(ctx.out(),
                          "epoch {} [{}, {})",
                          epoch.id,
                          epoch.starting_block,
                          epoch.endBlock());
  }
};
