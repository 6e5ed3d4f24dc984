/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "attestation/tip.hpp"

#include <algorithm>
#include <vector>

namespace attestor::attestation {

  uint64_t medianTip(std::span<const uint64_t> tips) {
    if (tips.empty()) {
      return 0;
    }
    std::vector<uint64_t> sorted{tips.begin(), tips.end()};
    std::ranges::sort(sorted);
    auto middle = sorted.size() / 2;
    if (sorted.size() % 2 == 1) {
      return sorted[middle];
    }
    auto low = sorted[middle - 1];
    auto high = sorted[middle];
    return low + (high - low) / 2;
  }

  uint64_t calculateTip(const TipParams &params, uint64_t median_tip) {
    auto scaled =
        static_cast<uint64_t>(static_cast<double>(median_tip) * params.tip_boost);
    return std::max(scaled, params.minimum_tip);
  }

}  // namespace attestor::attestation
