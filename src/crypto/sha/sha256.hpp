/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <qtils/byte_arr.hpp>
#include <qtils/bytes.hpp>

namespace attestor::crypto {

  using Hash256 = qtils::ByteArr<32>;

  /**
   * Take a SHA-256 hash from string
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(std::string_view input);

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  Hash256 sha256(qtils::BytesIn input);

  /**
   * HMAC-SHA-256 of @param data keyed with @param key
   */
  Hash256 hmacSha256(qtils::BytesIn key, qtils::BytesIn data);

}  // namespace attestor::crypto
