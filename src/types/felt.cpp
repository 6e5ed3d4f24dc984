/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "types/felt.hpp"

#include <iterator>
#include <limits>
#include <vector>

OUTCOME_CPP_DEFINE_CATEGORY(attestor, FeltError, e) {
  using E = attestor::FeltError;
  switch (e) {
    case E::EMPTY:
      return "Empty field element string";
    case E::INVALID_HEX:
      return "Invalid hex digit in field element";
    case E::TOO_LONG:
      return "Field element hex is longer than 64 digits";
    case E::OUT_OF_RANGE:
      return "Value is not below the field prime";
    case E::NOT_U64:
      return "Field element does not fit into 64 bits";
  }
  return "Unknown FeltError";
}

namespace attestor {

  namespace {
    int hexDigit(char c) {
      if (c >= '0' and c <= '9') {
        return c - '0';
      }
      if (c >= 'a' and c <= 'f') {
        return c - 'a' + 10;
      }
      if (c >= 'A' and c <= 'F') {
        return c - 'A' + 10;
      }
      return -1;
    }
  }  // namespace

  const uint256_t &Felt::prime() {
    static const uint256_t p =
        (uint256_t{1} << 251) + (uint256_t{17} << 192) + 1;
    return p;
  }

  Felt Felt::fromBig(const uint256_t &value) {
    Felt felt;
    felt.value_ = value % prime();
    return felt;
  }

  outcome::result<Felt> Felt::fromHex(std::string_view hex) {
    if (hex.starts_with("0x") or hex.starts_with("0X")) {
      hex.remove_prefix(2);
    }
    if (hex.empty()) {
      return FeltError::EMPTY;
    }
    while (hex.size() > 1 and hex.front() == '0') {
      hex.remove_prefix(1);
    }
    if (hex.size() > 64) {
      return FeltError::TOO_LONG;
    }
    uint256_t value;
    for (auto c : hex) {
      auto digit = hexDigit(c);
      if (digit < 0) {
        return FeltError::INVALID_HEX;
      }
      value = (value << 4) | static_cast<unsigned>(digit);
    }
    if (value >= prime()) {
      return FeltError::OUT_OF_RANGE;
    }
    Felt felt;
    felt.value_ = value;
    return felt;
  }

  Felt Felt::fromBytesBe(qtils::BytesIn bytes) {
    uint512_t value;
    if (not bytes.empty()) {
      boost::multiprecision::import_bits(value, bytes.begin(), bytes.end(), 8);
    }
    Felt felt;
    felt.value_ = static_cast<uint256_t>(value % uint512_t{prime()});
    return felt;
  }

  Felt Felt::fromShortString(std::string_view str) {
    uint256_t value;
    for (auto c : str) {
      value = (value << 8) | static_cast<uint8_t>(c);
    }
    return fromBig(value);
  }

  std::string Felt::toHex() const {
    if (value_.is_zero()) {
      return "0x0";
    }
    static constexpr std::string_view kDigits = "0123456789abcdef";
    std::string out;
    auto value = value_;
    while (not value.is_zero()) {
      out.push_back(kDigits[static_cast<unsigned>(value & 0xf)]);
      value >>= 4;
    }
    out.append("x0");
    return {out.rbegin(), out.rend()};
  }

  qtils::ByteArr<32> Felt::toBytesBe() const {
    qtils::ByteArr<32> out{};
    std::vector<uint8_t> minimal;
    boost::multiprecision::export_bits(value_, std::back_inserter(minimal), 8);
    if (value_.is_zero()) {
      return out;
    }
    std::copy(minimal.begin(),
              minimal.end(),
              out.begin() + static_cast<ptrdiff_t>(32 - minimal.size()));
    return out;
  }

  outcome::result<uint64_t> Felt::toU64() const {
    if (value_ > std::numeric_limits<uint64_t>::max()) {
      return FeltError::NOT_U64;
    }
    return value_.convert_to<uint64_t>();
  }

  Felt Felt::operator+(const Felt &other) const {
    Felt felt;
    felt.value_ = value_ + other.value_;
    if (felt.value_ >= prime()) {
      felt.value_ -= prime();
    }
    return felt;
  }

  Felt Felt::operator-(const Felt &other) const {
    Felt felt;
    felt.value_ = value_ >= other.value_ ? value_ - other.value_
                                         : value_ + prime() - other.value_;
    return felt;
  }

  Felt Felt::operator*(const Felt &other) const {
    uint512_t product = uint512_t{value_} * other.value_;
    Felt felt;
    felt.value_ = static_cast<uint256_t>(product % uint512_t{prime()});
    return felt;
  }

  Felt Felt::operator-() const {
    return Felt{} - *this;
  }

  Felt Felt::pow(const uint256_t &exponent) const {
    Felt result{1};
    Felt base = *this;
    auto e = exponent;
    while (not e.is_zero()) {
      if (boost::multiprecision::bit_test(e, 0)) {
        result = result * base;
      }
      base = base * base;
      e >>= 1;
    }
    return result;
  }

  Felt Felt::inverse() const {
    return pow(prime() - 2);
  }

}  // namespace attestor
