/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>

namespace attestor::attestation {

  struct TipParams {
    double tip_boost = 1.0;
    uint64_t minimum_tip = 0;
  };

  /// Median of @param tips, 0 for an empty block
  uint64_t medianTip(std::span<const uint64_t> tips);

  /// `max(median_tip * tip_boost, minimum_tip)`, the product truncated
  uint64_t calculateTip(const TipParams &params, uint64_t median_tip);

}  // namespace attestor::attestation
