/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "types/felt.hpp"

namespace attestor::crypto {

  /// Keccak-256 truncated to the low 250 bits
  Felt starknetKeccak(qtils::BytesIn data);

  /// Entry point / event selector of a Cairo function or event name
  Felt selectorFromName(std::string_view name);

}  // namespace attestor::crypto
