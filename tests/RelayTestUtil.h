//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/RelayTestUtil.h
// Purpose: Shared helpers for relay tests: unique socket paths, raw protocol connections, polling
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>

#include <unistd.h>

#include <boost/asio.hpp>
#include <boost/asio/generic/stream_protocol.hpp>

#include "oauthrelay/RelayConfig.h"

namespace relaytest {

namespace net = boost::asio;

//==========================================================================================================
// UniqueSocketPath
// Purpose: Per-process, per-call socket path under /tmp so parallel test runs never collide.
//==========================================================================================================
inline std::string UniqueSocketPath() {
    static std::atomic<int> counter{0};
    return "/tmp/oauthrelay-test-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)) + ".sock";
}

inline oauthrelay::RelayConfig LocalConfig(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    oauthrelay::RelayConfig cfg;
    cfg.socketPath = UniqueSocketPath();
    cfg.useTcp = false;
    cfg.defaultTimeout = timeout;
    return cfg;
}

inline oauthrelay::RelayConfig TcpConfig(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    oauthrelay::RelayConfig cfg;
    cfg.useTcp = true;
    cfg.tcpPort = 0;
    cfg.defaultTimeout = timeout;
    return cfg;
}

//==========================================================================================================
// WaitUntil
// Purpose: Poll `pred` until it holds or `timeout` elapses.
//==========================================================================================================
template <typename Pred>
bool WaitUntil(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

//==========================================================================================================
// RawConnection
// Purpose: Synchronous connection speaking raw protocol lines to a coordinator (either transport kind).
//==========================================================================================================
class RawConnection {
public:
    struct Reply {
        enum class Kind { Line, Closed, TimedOut };
        Kind kind{Kind::Closed};
        std::string line;
    };

    // Connect to the coordinator described by `cfg`; `port` overrides cfg.tcpPort for TCP.
    explicit RawConnection(const oauthrelay::RelayConfig& cfg, unsigned short port = 0) : socket_(ioc_) {
        if (cfg.EffectiveTransport() == oauthrelay::TransportKind::Tcp) {
            net::ip::tcp::endpoint ep(net::ip::make_address(cfg.tcpHost), port != 0 ? port : cfg.tcpPort);
            socket_.connect(net::generic::stream_protocol::endpoint(ep));
        } else {
            net::local::stream_protocol::endpoint ep(cfg.socketPath);
            socket_.connect(net::generic::stream_protocol::endpoint(ep));
        }
    }

    void Send(const std::string& text) {
        net::write(socket_, net::buffer(text));
    }

    Reply ReadLine(std::chrono::milliseconds timeout) {
        Reply reply;
        bool done = false;
        ioc_.restart();
        net::async_read_until(socket_, net::dynamic_buffer(buffer_), '\n',
            [&](const boost::system::error_code& ec, std::size_t n) {
                done = true;
                if (!ec) {
                    reply.kind = Reply::Kind::Line;
                    reply.line = buffer_.substr(0, n - 1);
                    buffer_.erase(0, n);
                } else {
                    reply.kind = Reply::Kind::Closed;
                }
            });
        ioc_.run_for(timeout);
        if (!done) {
            boost::system::error_code ignored;
            socket_.cancel(ignored);
            ioc_.restart();
            ioc_.run();
            reply.kind = Reply::Kind::TimedOut;
        }
        return reply;
    }

    void Close() {
        boost::system::error_code ignored;
        socket_.close(ignored);
    }

private:
    net::io_context ioc_;
    net::generic::stream_protocol::socket socket_;
    std::string buffer_;
};

} // namespace relaytest
