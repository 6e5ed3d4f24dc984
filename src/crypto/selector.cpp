/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/selector.hpp"

#include "crypto/keccak.hpp"

namespace attestor::crypto {

  Felt starknetKeccak(qtils::BytesIn data) {
    auto hash = Keccak256::hash(data);
    // clear the top 6 bits
    hash[0] &= 0x03;
    return Felt::fromBytesBe(hash);
  }

  Felt selectorFromName(std::string_view name) {
    if (name == "__default__" or name == "__l1_default__") {
      return Felt{};
    }
    return starknetKeccak(
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        {reinterpret_cast<const uint8_t *>(name.data()), name.size()});
  }

}  // namespace attestor::crypto
