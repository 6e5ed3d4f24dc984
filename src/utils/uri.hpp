/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace attestor {

  enum class UriError : uint8_t {
    INVALID_SCHEMA = 1,
    INVALID_HOST,
    INVALID_PORT,
  };

  /**
   * Parsed http(s) or ws(s) endpoint. Missing port is filled with the
   * schema default, missing path with "/".
   */
  struct Uri {
    std::string schema;
    std::string host;
    std::string port;
    std::string path;
    std::string query;

    static outcome::result<Uri> parse(std::string_view uri);

    bool secure() const {
      return schema == "https" or schema == "wss";
    }

    /// Path with query, as used in a request line
    std::string target() const;

    /// Same endpoint with @param path joined to the current path
    Uri join(std::string_view path) const;

    std::string toString() const;
  };

}  // namespace attestor

OUTCOME_HPP_DECLARE_ERROR(attestor, UriError);
