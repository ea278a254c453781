//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthrelay/RelayClient.cpp
// Purpose: Blocking and coroutine waits for an OAuth callback relayed by the coordinator
//==========================================================================================================

#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include "logging/Logger.h"
#include "oauthrelay/RelayClient.hpp"
#include "oauthrelay/errors/Errors.h"
#include "LineIO.hpp"

namespace oauthrelay {
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

template <typename Socket>
class ScopedClose {
public:
    explicit ScopedClose(Socket& s) : socket_(s) {}
    ~ScopedClose() { detail::CloseQuietly(socket_); }
    ScopedClose(const ScopedClose&) = delete;
    ScopedClose& operator=(const ScopedClose&) = delete;
private:
    Socket& socket_;
};

// Send REGISTER on a connected socket and wait for the single reply record.
template <typename Socket>
net::awaitable<DeliveryResult> registerAndWait(Socket& socket,
                                               const std::optional<std::string>& state,
                                               std::chrono::milliseconds wait,
                                               const std::string& endpoint) {
    SocketMessage registration;
    registration.type = MessageType::Register;
    registration.state = state;
    const std::string out = EncodeMessage(registration);

    boost::system::error_code ec;
    co_await net::async_write(socket, net::buffer(out), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        throw errors::ConnectionError("Failed to register with OAuth coordinator at " + endpoint + ": " + ec.message());
    }
    LOG_DEBUG("RelayClient: registered state {} at {}, waiting up to {} ms",
              state.value_or("<default>"), endpoint, wait.count());

    std::string buffer;
    auto reply = co_await detail::ReadLineWithin(socket, buffer, wait);
    switch (reply.status) {
        case detail::LineReadResult::Status::Line:
            break;
        case detail::LineReadResult::Status::TimedOut:
            throw errors::TimeoutError("Timeout waiting for OAuth callback after " + std::to_string(wait.count()) + " ms");
        case detail::LineReadResult::Status::TooLong:
            throw errors::RelayError("Coordinator reply exceeds maximum record size");
        case detail::LineReadResult::Status::Closed:
            throw errors::RelayError("Coordinator closed connection without sending result");
    }

    SocketMessage msg = DecodeMessage(reply.line);
    if (msg.type != MessageType::Deliver) {
        throw errors::RelayError(std::string("Unexpected message type: ") + MessageTypeToString(msg.type));
    }
    DeliveryResult result;
    result.code = std::move(msg.code);
    result.raw = std::move(msg.raw);
    co_return result;
}

net::awaitable<DeliveryResult> waitOverTcp(const std::optional<std::string>& state,
                                           std::chrono::milliseconds wait,
                                           const RelayConfig& config) {
    auto executor = co_await net::this_coro::executor;
    const std::string endpoint = config.DescribeEndpoint();

    tcp::resolver resolver(executor);
    boost::system::error_code ec;
    auto endpoints = co_await resolver.async_resolve(config.tcpHost, std::to_string(config.tcpPort),
                                                     net::redirect_error(net::use_awaitable, ec));
    if (ec || endpoints.empty()) {
        throw errors::ConnectionError("Cannot resolve OAuth coordinator host " + config.tcpHost + ": " +
                                      (ec ? ec.message() : std::string("no addresses")));
    }

    tcp::socket socket(executor);
    ScopedClose<tcp::socket> guard(socket);
    boost::system::error_code connectEc;
    for (const auto& entry : endpoints) {
        detail::CloseQuietly(socket);
        connectEc = co_await detail::ConnectWithin(socket, entry.endpoint(), kConnectTimeout);
        if (!connectEc) {
            break;
        }
    }
    if (connectEc) {
        if (connectEc == net::error::timed_out) {
            throw errors::ConnectionError("Timeout connecting to OAuth coordinator at " + endpoint +
                                          " (is the relay server running?)");
        }
        throw errors::ConnectionError("Cannot connect to OAuth coordinator at " + endpoint + ": " + connectEc.message());
    }
    co_return co_await registerAndWait(socket, state, wait, endpoint);
}

#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
net::awaitable<DeliveryResult> waitOverLocalSocket(const std::optional<std::string>& state,
                                                   std::chrono::milliseconds wait,
                                                   const RelayConfig& config) {
    auto executor = co_await net::this_coro::executor;
    net::local::stream_protocol::socket socket(executor);
    ScopedClose<net::local::stream_protocol::socket> guard(socket);

    auto ec = co_await detail::ConnectWithin(socket, net::local::stream_protocol::endpoint(config.socketPath),
                                             kConnectTimeout);
    if (ec == net::error::timed_out) {
        throw errors::ConnectionError("Timeout connecting to OAuth coordinator at " + config.socketPath +
                                      " (is the relay server running?)");
    }
    if (ec) {
        throw errors::ConnectionError("Cannot connect to OAuth coordinator at " + config.socketPath + ": " + ec.message());
    }
    co_return co_await registerAndWait(socket, state, wait, config.socketPath);
}
#endif

} // namespace

net::awaitable<DeliveryResult> AsyncWaitForCode(std::optional<std::string> state,
                                                std::optional<std::chrono::milliseconds> timeout,
                                                RelayConfig config) {
    const std::chrono::milliseconds wait = timeout.value_or(config.defaultTimeout);
#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
    if (config.EffectiveTransport() == TransportKind::UnixSocket) {
        co_return co_await waitOverLocalSocket(state, wait, config);
    }
#endif
    co_return co_await waitOverTcp(state, wait, config);
}

DeliveryResult WaitForCode(const std::optional<std::string>& state,
                           std::optional<std::chrono::milliseconds> timeout,
                           const RelayConfig& config) {
    net::io_context ioc;
    auto fut = net::co_spawn(ioc, AsyncWaitForCode(state, timeout, config), net::use_future);
    ioc.run();
    return fut.get();
}

DeliveryResult WaitForCode(const std::optional<std::string>& state,
                           std::optional<std::chrono::milliseconds> timeout) {
    return WaitForCode(state, timeout, RelayConfig::FromEnvironment());
}

} // namespace oauthrelay
