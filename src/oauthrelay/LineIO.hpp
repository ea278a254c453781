//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthrelay/LineIO.hpp
// Purpose: Deadline-bounded line reads and connects over Asio stream sockets (coroutine helpers)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace oauthrelay {
namespace detail {

namespace net = boost::asio;

// Upper bound on one protocol record. Raw payloads from providers are small; this only guards memory.
constexpr std::size_t kMaxLineBytes = 1024 * 1024;

// Shared between an I/O operation and its deadline handler. `armed` is cleared once the operation
// completes so a late expiry never touches a socket that may already be gone.
struct DeadlineState {
    bool armed{true};
    bool fired{false};
};

//==========================================================================================================
// LineReadResult
// Purpose: Outcome of ReadLineWithin.
// Fields:
//   status: Line (a record was read), Closed (EOF/reset/aborted), TimedOut, TooLong (no '\n' within limit).
//   line: Record text without the trailing "\n"/"\r\n" when status == Line.
//   error: Underlying error for Closed/TooLong.
//==========================================================================================================
struct LineReadResult {
    enum class Status { Line, Closed, TimedOut, TooLong };
    Status status{Status::Closed};
    std::string line;
    boost::system::error_code error;
};

//==========================================================================================================
// ReadLineWithin
// Purpose: Read one '\n'-terminated line, giving up after `timeout`. Bytes after the newline stay in
//          `buffer` for the next call. A final unterminated line before EOF is returned as a Line.
// Notes:
//   On timeout the pending read is cancelled through the socket; the socket stays open.
//==========================================================================================================
template <typename Socket>
net::awaitable<LineReadResult> ReadLineWithin(Socket& socket, std::string& buffer,
                                              std::chrono::steady_clock::duration timeout) {
    net::steady_timer deadline(socket.get_executor());
    deadline.expires_after(timeout);
    auto state = std::make_shared<DeadlineState>();
    deadline.async_wait([&socket, state](const boost::system::error_code& ec) {
        if (!ec && state->armed) {
            state->fired = true;
            boost::system::error_code ignored;
            socket.cancel(ignored);
        }
    });

    boost::system::error_code ec;
    std::size_t n = co_await net::async_read_until(
        socket, net::dynamic_buffer(buffer, kMaxLineBytes), '\n',
        net::redirect_error(net::use_awaitable, ec));
    state->armed = false;
    deadline.cancel();

    LineReadResult result;
    if (!ec) {
        result.status = LineReadResult::Status::Line;
        result.line = buffer.substr(0, n - 1);
        buffer.erase(0, n);
        if (!result.line.empty() && result.line.back() == '\r') {
            result.line.pop_back();
        }
        co_return result;
    }
    if (state->fired) {
        result.status = LineReadResult::Status::TimedOut;
        co_return result;
    }
    result.error = ec;
    if (ec == net::error::eof && !buffer.empty()) {
        result.status = LineReadResult::Status::Line;
        result.line.swap(buffer);
        co_return result;
    }
    if (ec == net::error::not_found) {
        result.status = LineReadResult::Status::TooLong;
        co_return result;
    }
    result.status = LineReadResult::Status::Closed;
    co_return result;
}

//==========================================================================================================
// ConnectWithin
// Purpose: Connect `socket` to `endpoint`, closing the socket if it takes longer than `timeout`.
// Returns:
//   Empty error_code on success; net::error::timed_out when the deadline fired; otherwise the connect error.
//==========================================================================================================
template <typename Socket, typename Endpoint>
net::awaitable<boost::system::error_code> ConnectWithin(Socket& socket, const Endpoint& endpoint,
                                                        std::chrono::steady_clock::duration timeout) {
    net::steady_timer deadline(socket.get_executor());
    deadline.expires_after(timeout);
    auto state = std::make_shared<DeadlineState>();
    deadline.async_wait([&socket, state](const boost::system::error_code& ec) {
        if (!ec && state->armed) {
            state->fired = true;
            boost::system::error_code ignored;
            socket.close(ignored);
        }
    });

    boost::system::error_code ec;
    co_await socket.async_connect(endpoint, net::redirect_error(net::use_awaitable, ec));
    state->armed = false;
    deadline.cancel();
    if (state->fired) {
        co_return boost::system::error_code(net::error::timed_out);
    }
    co_return ec;
}

//==========================================================================================================
// CloseQuietly
// Purpose: Best-effort shutdown + close; errors are ignored.
//==========================================================================================================
template <typename Socket>
void CloseQuietly(Socket& socket) {
    boost::system::error_code ignored;
    if (socket.is_open()) {
        socket.shutdown(Socket::shutdown_both, ignored);
        socket.close(ignored);
    }
}

} // namespace detail
} // namespace oauthrelay
