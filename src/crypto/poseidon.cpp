/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/poseidon.hpp"

#include <string>
#include <vector>

#include "crypto/sha/sha256.hpp"

namespace attestor::crypto {

  namespace {
    constexpr size_t kFullRounds = 8;
    constexpr size_t kPartialRounds = 83;
    constexpr size_t kRounds = kFullRounds + kPartialRounds;

    // Key i is sha256("Hades" || decimal(i)) reduced modulo p
    const std::vector<PoseidonState> &roundKeys() {
      static const std::vector<PoseidonState> keys = [] {
        std::vector<PoseidonState> keys(kRounds);
        for (size_t round = 0; round < kRounds; ++round) {
          for (size_t j = 0; j < 3; ++j) {
            auto seed = "Hades" + std::to_string(round * 3 + j);
            keys[round][j] = Felt::fromBytesBe(sha256(seed));
          }
        }
        return keys;
      }();
      return keys;
    }

    Felt cube(const Felt &x) {
      return x * x * x;
    }

    // MDS matrix [[3, 1, 1], [1, -1, 1], [1, 1, -2]]
    void mix(PoseidonState &s) {
      auto t = s[0] + s[1] + s[2];
      auto s0 = t + s[0] + s[0];
      auto s1 = t - s[1] - s[1];
      auto s2 = t - s[2] - s[2] - s[2];
      s = {s0, s1, s2};
    }
  }  // namespace

  void hadesPermutation(PoseidonState &state) {
    const auto &keys = roundKeys();
    for (size_t round = 0; round < kRounds; ++round) {
      bool full = round < kFullRounds / 2
               or round >= kFullRounds / 2 + kPartialRounds;
      for (size_t j = 0; j < 3; ++j) {
        state[j] += keys[round][j];
      }
      if (full) {
        for (auto &x : state) {
          x = cube(x);
        }
      } else {
        state[2] = cube(state[2]);
      }
      mix(state);
    }
  }

  Felt poseidonHash(const Felt &x, const Felt &y) {
    PoseidonState state{x, y, Felt{2}};
    hadesPermutation(state);
    return state[0];
  }

  Felt poseidonHashSingle(const Felt &x) {
    PoseidonState state{x, Felt{}, Felt{1}};
    hadesPermutation(state);
    return state[0];
  }

  Felt poseidonHashMany(std::span<const Felt> values) {
    PoseidonHasher hasher;
    for (auto &value : values) {
      hasher.update(value);
    }
    return hasher.finalize();
  }

  void PoseidonHasher::update(const Felt &value) {
    if (not buffer_.has_value()) {
      buffer_ = value;
      return;
    }
    state_[0] += *buffer_;
    state_[1] += value;
    hadesPermutation(state_);
    buffer_.reset();
  }

  Felt PoseidonHasher::finalize() {
    if (buffer_.has_value()) {
      state_[0] += *buffer_;
      state_[1] += Felt{1};
    } else {
      state_[0] += Felt{1};
    }
    buffer_.reset();
    hadesPermutation(state_);
    return state_[0];
  }

}  // namespace attestor::crypto
