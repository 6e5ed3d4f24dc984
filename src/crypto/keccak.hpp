/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

// Keccak-f[1600] sponge after
// https://github.com/nayuki/Bitcoin-Cryptography-Library/blob/master/cpp/Keccak256.hpp
// OpenSSL 3.0 exposes SHA3 only, whose padding differs from original Keccak.

#pragma once

#include <cstdint>

#include <qtils/byte_arr.hpp>
#include <qtils/bytes.hpp>

namespace attestor::crypto {

  /// Keccak-256 with the original 0x01 domain padding (Ethereum-style)
  class Keccak256 {
   public:
    using Hash = qtils::ByteArr<32>;

    static constexpr size_t kHashSize = 32;
    static constexpr size_t kRate = 200 - kHashSize * 2;

    Keccak256 &update(qtils::BytesIn input) {
      for (auto byte : input) {
        absorbByte(byte);
      }
      return *this;
    }

    Hash finalize() const {
      auto copy = *this;
      copy.absorbByte(0x01, false);
      copy.xorByte(kRate - 1, 0x80);
      copy.permute();
      Hash hash;
      for (size_t i = 0; i < kHashSize; ++i) {
        hash[i] = copy.byteAt(i);
      }
      return hash;
    }

    static Hash hash(qtils::BytesIn input) {
      return Keccak256{}.update(input).finalize();
    }

   private:
    static uint64_t rotl(uint64_t x, uint8_t i) {
      return i == 0 ? x : (x << i) | (x >> (64 - i));
    }

    uint8_t byteAt(size_t offset) const {
      auto lane = offset >> 3;
      return static_cast<uint8_t>(state_[lane % 5][lane / 5]
                                  >> ((offset & 7) << 3));
    }

    void xorByte(size_t offset, uint8_t byte) {
      auto lane = offset >> 3;
      state_[lane % 5][lane / 5] ^= static_cast<uint64_t>(byte)
                                 << ((offset & 7) << 3);
    }

    void absorbByte(uint8_t byte, bool permute_on_full = true) {
      xorByte(offset_, byte);
      ++offset_;
      if (permute_on_full and offset_ == kRate) {
        permute();
        offset_ = 0;
      }
    }

    void permute() {
      static constexpr uint8_t kRotation[5][5] = {
          {0, 36, 3, 41, 18},
          {1, 44, 10, 45, 2},
          {62, 6, 43, 15, 61},
          {28, 55, 25, 21, 56},
          {27, 20, 39, 8, 14},
      };
      auto &a = state_;
      uint8_t lfsr = 1;
      for (int round = 0; round < 24; ++round) {
        // theta
        uint64_t c[5] = {};
        for (int x = 0; x < 5; ++x) {
          for (int y = 0; y < 5; ++y) {
            c[x] ^= a[x][y];
          }
        }
        for (int x = 0; x < 5; ++x) {
          uint64_t d = c[(x + 4) % 5] ^ rotl(c[(x + 1) % 5], 1);
          for (int y = 0; y < 5; ++y) {
            a[x][y] ^= d;
          }
        }

        // rho and pi
        uint64_t b[5][5];
        for (int x = 0; x < 5; ++x) {
          for (int y = 0; y < 5; ++y) {
            b[y][(x * 2 + y * 3) % 5] = rotl(a[x][y], kRotation[x][y]);
          }
        }

        // chi
        for (int x = 0; x < 5; ++x) {
          for (int y = 0; y < 5; ++y) {
            a[x][y] = b[x][y] ^ (~b[(x + 1) % 5][y] & b[(x + 2) % 5][y]);
          }
        }

        // iota
        for (int j = 0; j < 7; ++j) {
          a[0][0] ^= static_cast<uint64_t>(lfsr & 1) << ((1 << j) - 1);
          lfsr = static_cast<uint8_t>((lfsr << 1) ^ ((lfsr >> 7) * 0x171));
        }
      }
    }

    uint64_t state_[5][5] = {};
    size_t offset_ = 0;
  };

}  // namespace attestor::crypto
