/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>

namespace attestor::signer {

  enum class SigningError : uint8_t {
    SIGNER_UNAVAILABLE = 1,
    MALFORMED_RESPONSE,
    INVALID_KEY,
    MESSAGE_HASH_OUT_OF_RANGE,
  };

}  // namespace attestor::signer

OUTCOME_HPP_DECLARE_ERROR(attestor::signer, SigningError);
