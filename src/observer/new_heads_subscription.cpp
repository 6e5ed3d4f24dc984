/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "observer/new_heads_subscription.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <libp2p/coro/asio.hpp>
#include <libp2p/coro/spawn.hpp>
#include <openssl/err.h>

#include "app/configuration.hpp"
#include "app/state_manager.hpp"
#include "chain/impl/rpc_messages.hpp"
#include "observer/latest_block.hpp"
#include "utils/uri.hpp"

namespace attestor::observer {
  namespace beast = boost::beast;

  constexpr std::string_view kNewHeadsMethod = "starknet_subscriptionNewHeads";
  constexpr std::string_view kReorgMethod = "starknet_subscriptionReorg";
  constexpr auto kReconnectDelay = std::chrono::seconds{5};

  namespace {
    // NOLINTBEGIN(cppcoreguidelines-avoid-reference-coroutine-parameters)
    using WeakSubscription = std::weak_ptr<NewHeadsSubscription>;

    template <typename Ws>
    libp2p::Coro<outcome::result<void>> subscribe(
        Ws &ws, const Uri &uri, const WeakSubscription &weak_subscription) {
      auto handshake_res = libp2p::coroOutcome(co_await ws.async_handshake(
          uri.host, uri.target(), libp2p::useCoroOutcome));
      if (not handshake_res.has_value()) {
        co_return handshake_res.error();
      }
      ws.text(true);
      auto request = chain::rpc::encodeRequest(
          1, "starknet_subscribeNewHeads", chain::rpc::SubscribeNewHeadsParams{});
      auto write_res = libp2p::coroOutcome(co_await ws.async_write(
          boost::asio::buffer(request), libp2p::useCoroOutcome));
      if (not write_res.has_value()) {
        co_return write_res.error();
      }
      while (true) {
        beast::flat_buffer buffer;
        auto read_res = libp2p::coroOutcome(
            co_await ws.async_read(buffer, libp2p::useCoroOutcome));
        if (not read_res.has_value()) {
          co_return read_res.error();
        }
        auto subscription = weak_subscription.lock();
        if (not subscription) {
          co_return outcome::success();
        }
        if (not subscription->onMessage(
                beast::buffers_to_string(buffer.data()))) {
          co_return boost::system::error_code{
              boost::asio::error::connection_refused};
        }
      }
    }

    libp2p::Coro<outcome::result<void>> connect(
        boost::asio::io_context &io_context,
        boost::asio::ssl::context &ssl_context,
        const Uri &uri,
        const WeakSubscription &subscription) {
      boost::asio::ip::tcp::resolver resolver{io_context};
      auto resolve_res =
          libp2p::coroOutcome(co_await resolver.async_resolve(
              uri.host, uri.port, libp2p::useCoroOutcome));
      if (not resolve_res.has_value()) {
        co_return resolve_res.error();
      }
      if (not uri.secure()) {
        beast::websocket::stream<beast::tcp_stream> ws{io_context};
        auto connect_res =
            libp2p::coroOutcome(co_await beast::get_lowest_layer(ws)
                                    .async_connect(resolve_res.value(),
                                                   libp2p::useCoroOutcome));
        if (not connect_res.has_value()) {
          co_return connect_res.error();
        }
        co_return co_await subscribe(ws, uri, subscription);
      }
      beast::websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws{
          io_context, ssl_context};
      if (not SSL_set_tlsext_host_name(ws.next_layer().native_handle(),
                                       uri.host.c_str())) {
        co_return boost::system::error_code{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()};
      }
      auto connect_res =
          libp2p::coroOutcome(co_await beast::get_lowest_layer(ws)
                                  .async_connect(resolve_res.value(),
                                                 libp2p::useCoroOutcome));
      if (not connect_res.has_value()) {
        co_return connect_res.error();
      }
      auto tls_res =
          libp2p::coroOutcome(co_await ws.next_layer().async_handshake(
              boost::asio::ssl::stream_base::client, libp2p::useCoroOutcome));
      if (not tls_res.has_value()) {
        co_return tls_res.error();
      }
      co_return co_await subscribe(ws, uri, subscription);
    }
    // NOLINTEND(cppcoreguidelines-avoid-reference-coroutine-parameters)
  }  // namespace

  NewHeadsSubscription::NewHeadsSubscription(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<app::StateManager> state_manager,
      qtils::SharedRef<app::Configuration> app_config,
      qtils::SharedRef<LatestBlock> latest_block)
      : log_{logsys->getLogger("NewHeads", "observer")},
        app_config_{std::move(app_config)},
        latest_block_{std::move(latest_block)} {
    state_manager->takeControl(*this);
  }

  NewHeadsSubscription::~NewHeadsSubscription() {
    stop();
  }

  bool NewHeadsSubscription::onMessage(std::string_view message) {
    try {
      chain::rpc::MessageKind kind;
      json::decode(kind, message);
      if (kind.error.has_value()) {
        SL_ERROR(log_,
                 "Subscription refused: {} ({})",
                 kind.error->message,
                 kind.error->code);
        return false;
      }
      if (not kind.method.has_value()) {
        SL_DEBUG(log_, "Subscribed to new heads");
        return true;
      }
      if (kind.method == kNewHeadsMethod) {
        chain::rpc::Notification<chain::rpc::NewHead> notification;
        json::decode(notification, message);
        auto &head = notification.params.result;
        if (latest_block_->update(head.block_number)) {
          SL_DEBUG(
              log_, "New head #{} ({})", head.block_number, head.block_hash);
        }
      } else if (kind.method == kReorgMethod) {
        chain::rpc::Notification<chain::rpc::Reorg> notification;
        json::decode(notification, message);
        auto &reorg = notification.params.result;
        SL_WARN(log_,
                "Reorg of blocks #{}..#{}",
                reorg.starting_block_number,
                reorg.ending_block_number);
      } else {
        SL_TRACE(log_, "Ignored notification {}", kind.method.value());
      }
    } catch (const json::JsonError &e) {
      SL_WARN(log_, "Malformed subscription message: {}", e.what());
    }
    return true;
  }

  void NewHeadsSubscription::start() {
    auto &ws_url = app_config_->node().ws_url;
    if (not ws_url.has_value()) {
      SL_INFO(log_, "No websocket url, relying on polling only");
      return;
    }
    auto uri_res = Uri::parse(ws_url.value());
    if (not uri_res.has_value()) {
      SL_ERROR(log_, "Bad websocket url {}: {}", *ws_url, uri_res.error());
      return;
    }
    io_context_ = std::make_shared<boost::asio::io_context>();
    libp2p::coroSpawn(
        *io_context_,
        [log{log_},
         weak_self{weak_from_this()},
         io_context{io_context_.get()},
         uri{std::move(uri_res.value())}]() -> libp2p::Coro<void> {
          boost::asio::ssl::context ssl_context{
              boost::asio::ssl::context::tls_client};
          ssl_context.set_default_verify_paths();
          ssl_context.set_verify_mode(boost::asio::ssl::verify_peer);
          boost::asio::steady_timer timer{*io_context};
          while (not weak_self.expired()) {
            SL_INFO(log, "Connecting to {}", uri.toString());
            auto res =
                co_await connect(*io_context, ssl_context, uri, weak_self);
            if (not res.has_value()) {
              SL_WARN(log,
                      "Subscription lost: {}, reconnecting in {}s",
                      res.error(),
                      kReconnectDelay.count());
            }
            timer.expires_after(kReconnectDelay);
            std::ignore = libp2p::coroOutcome(
                co_await timer.async_wait(libp2p::useCoroOutcome));
          }
        });
    io_thread_.emplace([io_context{io_context_}] { io_context->run(); });
  }

  void NewHeadsSubscription::stop() {
    if (io_thread_.has_value()) {
      io_context_->stop();
      if (io_thread_->joinable()) {
        io_thread_->join();
      }
      io_thread_.reset();
    }
  }

}  // namespace attestor::observer
