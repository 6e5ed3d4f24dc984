/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/sha/sha256.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <stdexcept>

namespace attestor::crypto {
  Hash256 sha256(std::string_view input) {
    return sha256(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        {reinterpret_cast<const uint8_t *>(input.data()), input.size()});
  }

  Hash256 sha256(qtils::BytesIn input) {
    Hash256 out;
    SHA256(input.data(), input.size(), out.data());
    return out;
  }

  Hash256 hmacSha256(qtils::BytesIn key, qtils::BytesIn data) {
    Hash256 out;
    unsigned int out_size = out.size();
    if (HMAC(EVP_sha256(),
             key.data(),
             static_cast<int>(key.size()),
             data.data(),
             data.size(),
             out.data(),
             &out_size)
        == nullptr) {
      throw std::runtime_error{"HMAC-SHA-256 computation failed"};
    }
    return out;
  }
}  // namespace attestor::crypto
