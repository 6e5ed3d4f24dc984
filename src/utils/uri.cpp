/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/uri.hpp"

#include <algorithm>
#include <cctype>

OUTCOME_CPP_DEFINE_CATEGORY(attestor, UriError, e) {
  using E = attestor::UriError;
  switch (e) {
    case E::INVALID_SCHEMA:
      return "URI schema must be one of http, https, ws, wss";
    case E::INVALID_HOST:
      return "URI has invalid host";
    case E::INVALID_PORT:
      return "URI has invalid port";
  }
  return "Unknown UriError";
}

namespace attestor {

  outcome::result<Uri> Uri::parse(std::string_view uri) {
    Uri result;

    auto schema_end = uri.find("://");
    if (schema_end == std::string_view::npos) {
      return UriError::INVALID_SCHEMA;
    }
    result.schema = uri.substr(0, schema_end);
    std::ranges::transform(result.schema, result.schema.begin(), [](char c) {
      return static_cast<char>(std::tolower(c));
    });
    if (result.schema != "http" and result.schema != "https"
        and result.schema != "ws" and result.schema != "wss") {
      return UriError::INVALID_SCHEMA;
    }
    uri.remove_prefix(schema_end + 3);

    auto host_end = uri.find_first_of(":/?#");
    result.host = uri.substr(0, host_end);
    if (result.host.empty()
        or not std::ranges::all_of(result.host, [](char c) {
             return std::isalnum(static_cast<unsigned char>(c)) or c == '.' or c == '-' or c == '_';
           })) {
      return UriError::INVALID_HOST;
    }
    uri.remove_prefix(std::min(host_end, uri.size()));

    if (uri.starts_with(':')) {
      uri.remove_prefix(1);
      auto port_end = uri.find_first_of("/?#");
      result.port = uri.substr(0, port_end);
      uri.remove_prefix(std::min(port_end, uri.size()));
      if (result.port.empty() or result.port.size() > 5
          or not std::ranges::all_of(
              result.port,
              [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })
          or std::stoul(result.port) == 0 or std::stoul(result.port) > 65535) {
        return UriError::INVALID_PORT;
      }
    } else {
      result.port = result.secure() ? "443" : "80";
    }

    auto path_end = uri.find_first_of("?#");
    result.path = uri.substr(0, path_end);
    if (result.path.empty()) {
      result.path = "/";
    }
    uri.remove_prefix(std::min(path_end, uri.size()));

    if (uri.starts_with('?')) {
      uri.remove_prefix(1);
      result.query = uri.substr(0, uri.find('#'));
    }
    return result;
  }

  std::string Uri::target() const {
    if (query.empty()) {
      return path;
    }
    return path + "?" + query;
  }

  Uri Uri::join(std::string_view suffix) const {
    auto joined = *this;
    if (joined.path.ends_with('/') and suffix.starts_with('/')) {
      suffix.remove_prefix(1);
    } else if (not joined.path.ends_with('/') and not suffix.starts_with('/')) {
      joined.path.push_back('/');
    }
    joined.path.append(suffix);
    joined.query.clear();
    return joined;
  }

  std::string Uri::toString() const {
    auto result = schema + "://" + host + ":" + port + path;
    if (not query.empty()) {
      result += "?" + query;
    }
    return result;
  }

}  // namespace attestor
