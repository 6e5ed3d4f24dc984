/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "utils/http.hpp"

#include <optional>

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <libp2p/coro/asio.hpp>
#include <libp2p/coro/spawn.hpp>
#include <openssl/err.h>

OUTCOME_CPP_DEFINE_CATEGORY(attestor::http, HttpError, e) {
  using E = attestor::http::HttpError;
  switch (e) {
    case E::TIMEOUT:
      return "HTTP request timed out";
  }
  return "Unknown HttpError";
}

namespace attestor::http {
  namespace beast = boost::beast;

  inline libp2p::Coro<void> serve(log::Logger log,
                                  boost::asio::ip::tcp::socket socket,
                                  ServerConfig config) {
    beast::tcp_stream stream{std::move(socket)};
    stream.expires_after(config.operation_timeout);
    beast::flat_buffer buffer;
    beast::http::request_parser<Body> parser;
    parser.body_limit(config.max_request_size);
    auto read_res = libp2p::coroOutcome(co_await beast::http::async_read(
        stream, buffer, parser, libp2p::useCoroOutcome));
    if (not read_res.has_value()) {
      SL_WARN(log, "http read request error: {}", read_res.error());
      co_return;
    }
    auto request = parser.release();
    auto response = config.on_request(std::move(request));
    response.keep_alive(false);
    response.prepare_payload();
    auto write_res = libp2p::coroOutcome(co_await beast::http::async_write(
        stream, response, libp2p::useCoroOutcome));
    if (not write_res.has_value()) {
      SL_WARN(log, "http write response error: {}", write_res.error());
    }
  }

  outcome::result<void> serve(log::Logger log,
                              boost::asio::io_context &io_context,
                              ServerConfig config) {
    boost::asio::ip::tcp::acceptor acceptor{io_context};
    boost::system::error_code ec;
    acceptor.open(config.endpoint.protocol(), ec);
    if (ec) {
      return ec;
    }
    acceptor.set_option(boost::asio::socket_base::reuse_address{true}, ec);
    if (ec) {
      return ec;
    }
    acceptor.bind(config.endpoint, ec);
    if (ec) {
      return ec;
    }
    acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      return ec;
    }
    libp2p::coroSpawn(
        io_context,
        [log, &io_context, config, acceptor{std::move(acceptor)}]() mutable
            -> libp2p::Coro<void> {
          while (true) {
            auto accept_res = libp2p::coroOutcome(
                co_await acceptor.async_accept(libp2p::useCoroOutcome));
            if (not accept_res.has_value()) {
              SL_WARN(log, "tcp accept error: {}", accept_res.error());
              break;
            }
            auto &socket = accept_res.value();
            libp2p::coroSpawn(io_context,
                              [log, config, socket{std::move(socket)}]() mutable
                                  -> libp2p::Coro<void> {
                                co_await serve(log, std::move(socket), config);
                              });
          }
        });
    return outcome::success();
  }

  namespace {
    // NOLINTBEGIN(cppcoreguidelines-avoid-reference-coroutine-parameters)
    template <typename Stream>
    libp2p::Coro<outcome::result<Response>> exchange(Stream &stream,
                                                     Request &request) {
      auto write_res = libp2p::coroOutcome(co_await beast::http::async_write(
          stream, request, libp2p::useCoroOutcome));
      if (not write_res.has_value()) {
        co_return write_res.error();
      }
      beast::flat_buffer buffer;
      Response response;
      auto read_res = libp2p::coroOutcome(co_await beast::http::async_read(
          stream, buffer, response, libp2p::useCoroOutcome));
      if (not read_res.has_value()) {
        co_return read_res.error();
      }
      co_return response;
    }

    libp2p::Coro<outcome::result<Response>> coroFetch(
        boost::asio::io_context &io_context,
        boost::asio::ssl::context &ssl_context,
        const ClientRequest &client_request) {
      const auto &uri = client_request.uri;
      boost::asio::ip::tcp::resolver resolver{io_context};
      auto resolve_res =
          libp2p::coroOutcome(co_await resolver.async_resolve(
              uri.host, uri.port, libp2p::useCoroOutcome));
      if (not resolve_res.has_value()) {
        co_return resolve_res.error();
      }

      Request request{client_request.method, uri.target(), 11};
      request.set(beast::http::field::host, uri.host);
      request.set(beast::http::field::user_agent, "attestor");
      if (not client_request.body.empty()) {
        request.set(beast::http::field::content_type,
                    client_request.content_type);
        request.body() = client_request.body;
      }
      request.prepare_payload();

      if (not uri.secure()) {
        beast::tcp_stream stream{io_context};
        auto connect_res = libp2p::coroOutcome(co_await stream.async_connect(
            resolve_res.value(), libp2p::useCoroOutcome));
        if (not connect_res.has_value()) {
          co_return connect_res.error();
        }
        co_return co_await exchange(stream, request);
      }

      beast::ssl_stream<beast::tcp_stream> stream{io_context, ssl_context};
      if (not SSL_set_tlsext_host_name(stream.native_handle(),
                                       uri.host.c_str())) {
        co_return boost::system::error_code{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()};
      }
      auto connect_res =
          libp2p::coroOutcome(co_await beast::get_lowest_layer(stream)
                                  .async_connect(resolve_res.value(),
                                                 libp2p::useCoroOutcome));
      if (not connect_res.has_value()) {
        co_return connect_res.error();
      }
      auto handshake_res = libp2p::coroOutcome(co_await stream.async_handshake(
          boost::asio::ssl::stream_base::client, libp2p::useCoroOutcome));
      if (not handshake_res.has_value()) {
        co_return handshake_res.error();
      }
      co_return co_await exchange(stream, request);
    }
    // NOLINTEND(cppcoreguidelines-avoid-reference-coroutine-parameters)
  }  // namespace

  outcome::result<Response> fetch(const ClientRequest &request) {
    std::optional<outcome::result<Response>> result;
    boost::asio::ssl::context ssl_context{
        boost::asio::ssl::context::tls_client};
    ssl_context.set_default_verify_paths();
    ssl_context.set_verify_mode(boost::asio::ssl::verify_peer);

    // declared last: abandoned coroutines are destroyed before their inputs
    boost::asio::io_context io_context;
    libp2p::coroSpawn(io_context, [&]() -> libp2p::Coro<void> {
      result = co_await coroFetch(io_context, ssl_context, request);
    });
    io_context.run_for(request.timeout);
    if (not result.has_value()) {
      return HttpError::TIMEOUT;
    }
    return std::move(result.value());
  }
}  // namespace attestor::http
