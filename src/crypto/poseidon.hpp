/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <optional>
#include <span>

#include "types/felt.hpp"

namespace attestor::crypto {

  using PoseidonState = std::array<Felt, 3>;

  /**
   * Hades permutation used by Starknet Poseidon: width 3, 4 + 4 full
   * rounds around 83 partial rounds, cube S-box
   */
  void hadesPermutation(PoseidonState &state);

  Felt poseidonHash(const Felt &x, const Felt &y);

  Felt poseidonHashSingle(const Felt &x);

  /// Sponge over any number of elements, padded with 1 (and 0 to even length)
  Felt poseidonHashMany(std::span<const Felt> values);

  /// Incremental form of poseidonHashMany
  class PoseidonHasher {
   public:
    void update(const Felt &value);
    Felt finalize();

   private:
    PoseidonState state_{};
    std::optional<Felt> buffer_;
  };

}  // namespace attestor::crypto
