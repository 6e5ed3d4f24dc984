/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <qtils/enum_error_code.hpp>

#include "log/logger.hpp"
#include "utils/uri.hpp"

namespace boost::asio {
  class io_context;
}  // namespace boost::asio

namespace attestor::http {
  using Body = boost::beast::http::string_body;
  using Request = boost::beast::http::request<Body>;
  using Response = boost::beast::http::response<Body>;
  using OnRequest = std::function<Response(Request)>;

  enum class HttpError : uint8_t {
    TIMEOUT = 1,
  };

  struct ServerConfig {
    boost::asio::ip::tcp::endpoint endpoint;
    OnRequest on_request;

    static constexpr size_t kDefaultRequestSize = 10000u;
    size_t max_request_size{kDefaultRequestSize};

    using Duration = std::chrono::nanoseconds;
    static constexpr Duration kDefaultTimeout = std::chrono::seconds{30};
    Duration operation_timeout{kDefaultTimeout};
  };

  /// Accepts connections on `io_context`, one request per connection
  outcome::result<void> serve(log::Logger log,
                              boost::asio::io_context &io_context,
                              ServerConfig config);

  struct ClientRequest {
    boost::beast::http::verb method = boost::beast::http::verb::get;
    Uri uri;
    std::string body;
    std::string content_type = "application/json";
    std::chrono::milliseconds timeout{std::chrono::seconds{10}};
  };

  /**
   * Performs a single request over a fresh connection (TLS for https).
   * Blocks the calling thread at most `request.timeout`; on expiry the
   * request is abandoned and `HttpError::TIMEOUT` is returned. Any HTTP
   * status is returned as a response.
   */
  outcome::result<Response> fetch(const ClientRequest &request);
}  // namespace attestor::http

OUTCOME_HPP_DECLARE_ERROR(attestor::http, HttpError);
