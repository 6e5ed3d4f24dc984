/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

namespace attestor {
  /**
   * @returns string representation of build version, taken from the
   * `ATTESTOR_BUILD_VERSION` definition of the build
   */
  const std::string &buildVersion();
}  // namespace attestor
