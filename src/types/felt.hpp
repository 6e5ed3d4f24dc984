/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>
#include <fmt/format.h>
#include <qtils/byte_arr.hpp>
#include <qtils/bytes.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace attestor {

  using uint256_t = boost::multiprecision::uint256_t;
  using uint512_t = boost::multiprecision::uint512_t;

  enum class FeltError : uint8_t {
    EMPTY = 1,
    INVALID_HEX,
    TOO_LONG,
    OUT_OF_RANGE,
    NOT_U64,
  };

  /**
   * Element of the Starknet prime field, p = 2^251 + 17 * 2^192 + 1.
   * The stored value is always reduced, so equality is value equality.
   */
  class Felt {
   public:
    static const uint256_t &prime();

    Felt() = default;

    // NOLINTNEXTLINE(google-explicit-constructor)
    Felt(uint64_t value) : value_{value} {}

    /// Reduces @param value modulo p
    static Felt fromBig(const uint256_t &value);

    /// Parses `0x`-prefixed (or bare) hex, rejecting values not below p
    static outcome::result<Felt> fromHex(std::string_view hex);

    /// Interprets big-endian bytes as an integer and reduces it modulo p
    static Felt fromBytesBe(qtils::BytesIn bytes);

    /// Cairo short string: ASCII bytes packed big-endian
    static Felt fromShortString(std::string_view str);

    const uint256_t &value() const {
      return value_;
    }

    bool isZero() const {
      return value_.is_zero();
    }

    /// Lowercase hex with `0x` prefix and no leading zeros
    std::string toHex() const;

    /// 32 bytes, big-endian, zero-padded
    qtils::ByteArr<32> toBytesBe() const;

    outcome::result<uint64_t> toU64() const;

    Felt operator+(const Felt &other) const;
    Felt operator-(const Felt &other) const;
    Felt operator*(const Felt &other) const;
    Felt operator-() const;

    Felt &operator+=(const Felt &other) {
      return *this = *this + other;
    }

    Felt pow(const uint256_t &exponent) const;

    /// Multiplicative inverse; zero maps to zero
    Felt inverse() const;

    bool operator==(const Felt &other) const {
      return value_ == other.value_;
    }
    bool operator<(const Felt &other) const {
      return value_ < other.value_;
    }

   private:
    uint256_t value_;
  };

}  // namespace attestor

OUTCOME_HPP_DECLARE_ERROR(attestor, FeltError);

template <>
struct fmt::formatter<attestor::Felt> : fmt::formatter<std::string_view> {
  auto format(const attestor::Felt &felt, format_context &ctx) const {
    return fmt::formatter<std::string_view>::format(felt.toHex(), ctx);
  }
};
