/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/build_version.hpp"

#ifndef ATTESTOR_BUILD_VERSION
#define ATTESTOR_BUILD_VERSION "unknown"
#endif

namespace attestor {
  const std::string &buildVersion() {
    static const std::string version(ATTESTOR_BUILD_VERSION);
    return version;
  }
}  // namespace attestor
