/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/rfc6979.hpp"

#include <vector>

#include "crypto/sha/sha256.hpp"

namespace attestor::crypto {

  namespace {
    using Bytes = std::vector<uint8_t>;

    qtils::ByteArr<32> wideToBytes(const uint256_t &value) {
      qtils::ByteArr<32> out{};
      auto v = value;
      for (size_t i = 0; i < 32; ++i) {
        out[31 - i] = static_cast<uint8_t>(v & 0xff);
        v >>= 8;
      }
      return out;
    }

    Bytes concat(std::initializer_list<qtils::BytesIn> parts) {
      Bytes out;
      for (auto part : parts) {
        out.insert(out.end(), part.begin(), part.end());
      }
      return out;
    }
  }  // namespace

  uint256_t generateK(const Felt &message_hash,
                      const uint256_t &private_key,
                      const uint256_t &seed,
                      const uint256_t &order) {
    auto x = wideToBytes(private_key);
    auto h = message_hash.toBytesBe();

    // seed is appended with leading zero bytes stripped
    Bytes extra;
    if (not seed.is_zero()) {
      auto seed_bytes = wideToBytes(seed);
      auto it = seed_bytes.begin();
      while (*it == 0) {
        ++it;
      }
      extra.assign(it, seed_bytes.end());
    }

    static const uint8_t kZero[] = {0x00};
    static const uint8_t kOne[] = {0x01};

    Hash256 k{};
    Hash256 v{};
    v.fill(0x01);

    k = hmacSha256(k, concat({v, kZero, x, h, extra}));
    v = hmacSha256(k, v);
    k = hmacSha256(k, concat({v, kOne, x, h, extra}));
    v = hmacSha256(k, v);

    while (true) {
      v = hmacSha256(k, v);
      uint256_t candidate;
      boost::multiprecision::import_bits(candidate, v.begin(), v.end(), 8);
      // qlen is 252 bits, so the 256-bit block is shifted right by 4
      candidate >>= 4;
      if (not candidate.is_zero() and candidate < order) {
        return candidate;
      }
      k = hmacSha256(k, concat({v, kZero}));
      v = hmacSha256(k, v);
    }
  }

}  // namespace attestor::crypto
