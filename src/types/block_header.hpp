/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "types/felt.hpp"
#include "types/types.hpp"

namespace attestor {

  /**
   * @struct BlockHeader
   * Accepted (non-pending) Starknet block, only the fields the agent uses
   */
  struct BlockHeader {
    BlockNumber number = 0;
    /// Hash of the block, the value an attestation commits to
    Felt hash;
    Felt parent_hash;
    /// Unix seconds
    uint64_t timestamp = 0;

    bool operator==(const BlockHeader &) const = default;
  };

}  // namespace attestor

template <>
struct fmt::formatter<attestor::BlockHeader> {
  constexpr auto parse(format_parse_context &ctx) {
    return ctx.begin();
  }

  auto format(const attestor::BlockHeader &header,
              format_context &ctx) const {
    return fmt::format_to(ctx.out(), "#{} ({})", header.number, header.hash);
  }
};
