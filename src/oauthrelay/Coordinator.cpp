//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/oauthrelay/Coordinator.cpp
// Purpose: Rendezvous coordinator over a local stream socket or loopback TCP (Boost.Asio coroutines)
//==========================================================================================================

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "oauthrelay/Coordinator.hpp"
#include "oauthrelay/Protocol.h"
#include "oauthrelay/errors/Errors.h"
#include "LineIO.hpp"

namespace oauthrelay {
namespace net = boost::asio;
using tcp = net::ip::tcp;

const char* const kDefaultStateKey = "__default__";

std::string NormalizeState(const std::optional<std::string>& state) {
    if (!state.has_value() || state->empty()) {
        return kDefaultStateKey;
    }
    return *state;
}

namespace {

// First-line deadline for a freshly accepted connection.
constexpr auto kRegisterReadTimeout = std::chrono::seconds(10);
// Pause before accepting again after a transient accept failure (e.g. descriptor exhaustion).
constexpr auto kAcceptRetryDelay = std::chrono::milliseconds(100);
// How long Stop() lets connection handlers unwind before forcing the I/O context down.
constexpr auto kShutdownGrace = std::chrono::seconds(5);

//==========================================================================================================
// PendingEntry
// Purpose: One registration's single-resolution result slot. The parked handler waits on `wake`; whoever
//          moves `status` away from Waiting (delivery, replacement, hang-up, shutdown) cancels the timer.
//==========================================================================================================
struct PendingEntry {
    enum class Status { Waiting, Delivered, Cancelled, Disconnected, Expired };

    explicit PendingEntry(net::io_context& ioc) : wake(ioc) {}

    net::steady_timer wake;
    Status status{Status::Waiting};
    std::optional<SocketMessage> delivery;
};

// Read side of a parked connection. `active` is cleared when the handler wakes so a late completion
// never touches the socket again.
struct PeerWatch {
    bool active{true};
    std::array<char, 256> scratch{};
};

const char* describeReadFailure(const detail::LineReadResult& r) {
    switch (r.status) {
        case detail::LineReadResult::Status::TimedOut: return "timed out";
        case detail::LineReadResult::Status::TooLong: return "record too long";
        case detail::LineReadResult::Status::Closed: return "connection closed";
        case detail::LineReadResult::Status::Line: break;
    }
    return "ok";
}

} // namespace

class Coordinator::Impl {
public:
    using Status = PendingEntry::Status;

    RelayConfig config;
    TransportKind kind;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};
    bool ownsSocketPath{false};

    net::io_context ioc;
    std::thread ioThread;
    std::future<void> ioFinished;

    std::unique_ptr<tcp::acceptor> tcpAcceptor;
#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
    std::unique_ptr<net::local::stream_protocol::acceptor> localAcceptor;
#endif

    mutable std::mutex mtx;
    std::unordered_map<std::string, std::shared_ptr<PendingEntry>> pending;

    // Open connections, touched only on the I/O thread.
    std::uint64_t nextConnectionId{1};
    std::unordered_map<std::uint64_t, std::function<void()>> closers;

    explicit Impl(const RelayConfig& cfg) : config(cfg), kind(cfg.EffectiveTransport()) {}

    ~Impl() {
        shutdown();
    }

    void bindTcp() {
        boost::system::error_code ec;
        auto address = net::ip::make_address(config.tcpBindAddress, ec);
        if (ec) {
            throw errors::BindError("Invalid TCP bind address '" + config.tcpBindAddress + "': " + ec.message());
        }
        tcp::endpoint ep(address, config.tcpPort);
        auto acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol(), ec);
        if (!ec) { acceptor->set_option(tcp::acceptor::reuse_address(true), ec); }
        if (!ec) { acceptor->bind(ep, ec); }
        if (!ec) { acceptor->listen(net::socket_base::max_listen_connections, ec); }
        if (ec) {
            throw errors::BindError("Cannot listen on " + config.tcpBindAddress + ":" +
                                    std::to_string(config.tcpPort) + ": " + ec.message());
        }
        boundPort.store(acceptor->local_endpoint().port());
        tcpAcceptor = std::move(acceptor);
    }

#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
    void removeStaleSocketFile() {
        namespace fs = std::filesystem;
        std::error_code fsEc;
        const fs::file_status st = fs::symlink_status(config.socketPath, fsEc);
        if (fsEc || !fs::exists(st)) {
            return;
        }
        if (!fs::is_socket(st)) {
            throw errors::BindError("Socket path exists and is not a socket: " + config.socketPath);
        }
        net::local::stream_protocol::socket probe(ioc);
        boost::system::error_code ec;
        probe.connect(net::local::stream_protocol::endpoint(config.socketPath), ec);
        if (!ec) {
            detail::CloseQuietly(probe);
            throw errors::BindError("Another coordinator is already listening on " + config.socketPath);
        }
        LOG_INFO("Coordinator: removing stale socket file {}", config.socketPath);
        if (!fs::remove(config.socketPath, fsEc) && fsEc) {
            throw errors::BindError("Cannot remove stale socket file " + config.socketPath + ": " + fsEc.message());
        }
    }

    void bindLocal() {
        removeStaleSocketFile();
        net::local::stream_protocol::endpoint ep(config.socketPath);
        auto acceptor = std::make_unique<net::local::stream_protocol::acceptor>(ioc);
        boost::system::error_code ec;
        acceptor->open(ep.protocol(), ec);
        if (!ec) { acceptor->bind(ep, ec); }
        if (!ec) { acceptor->listen(net::socket_base::max_listen_connections, ec); }
        if (ec) {
            throw errors::BindError("Cannot listen on " + config.socketPath + ": " + ec.message());
        }
        ownsSocketPath = true;
        localAcceptor = std::move(acceptor);
    }
#endif

    void bind() {
#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
        if (kind == TransportKind::UnixSocket) {
            bindLocal();
            return;
        }
#endif
        bindTcp();
    }

    void closeAcceptors() {
        boost::system::error_code ec;
        if (tcpAcceptor) { tcpAcceptor->close(ec); }
#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
        if (localAcceptor) { localAcceptor->close(ec); }
#endif
    }

    // Runs on the I/O thread: resolve every waiter as cancelled, then release the transport.
    void cancelEverything() {
        std::size_t cancelled = 0;
        {
            std::lock_guard<std::mutex> lock(mtx);
            for (auto& [key, entry] : pending) {
                if (entry->status == Status::Waiting) {
                    entry->status = Status::Cancelled;
                    entry->wake.cancel();
                    ++cancelled;
                }
            }
            pending.clear();
        }
        if (cancelled > 0) {
            LOG_INFO("Coordinator: cancelled {} pending registration(s) on shutdown", cancelled);
        }
        closeAcceptors();
        std::vector<std::function<void()>> toClose;
        toClose.reserve(closers.size());
        for (auto& [id, closer] : closers) {
            toClose.push_back(closer);
        }
        for (auto& closer : toClose) {
            closer();
        }
    }

    void shutdown() {
        running.store(false);
        if (ioThread.joinable()) {
            net::post(ioc, [this]() { cancelEverything(); });
            if (ioFinished.valid() && ioFinished.wait_for(kShutdownGrace) != std::future_status::ready) {
                LOG_WARN("Coordinator: connection handlers did not finish within {}s; forcing stop",
                         std::chrono::duration_cast<std::chrono::seconds>(kShutdownGrace).count());
                ioc.stop();
            }
            ioThread.join();
        }
        tcpAcceptor.reset();
#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
        localAcceptor.reset();
#endif
        if (ownsSocketPath) {
            std::error_code fsEc;
            std::filesystem::remove(config.socketPath, fsEc);
            if (fsEc) {
                LOG_WARN("Coordinator: failed to remove socket file {}: {}", config.socketPath, fsEc.message());
            }
            ownsSocketPath = false;
        }
        boundPort.store(0);
    }

    // Returns the REGISTER record, or std::nullopt (logged) for any other first line.
    std::optional<SocketMessage> parseRegistration(const std::string& line) {
        try {
            SocketMessage msg = DecodeMessage(line);
            if (msg.type != MessageType::Register) {
                LOG_WARN("Coordinator: expected REGISTER as first message, got {}", MessageTypeToString(msg.type));
                return std::nullopt;
            }
            return msg;
        } catch (const errors::ProtocolError& e) {
            LOG_WARN("Coordinator: rejecting connection with malformed first record: {}", e.what());
            return std::nullopt;
        }
    }

    // Keeps a read pending on a parked connection. EOF or a socket error while the entry is still Waiting
    // means the client gave up: the entry is withdrawn so a later delivery for its state finds no waiter.
    // Stray bytes from the client are discarded.
    template <typename Socket>
    void watchPeer(Socket& socket, const std::string& key, const std::shared_ptr<PendingEntry>& entry,
                   const std::shared_ptr<PeerWatch>& watch) {
        socket.async_read_some(net::buffer(watch->scratch),
            [this, &socket, key, entry, watch](const boost::system::error_code& ec, std::size_t) {
                if (!watch->active) {
                    return;
                }
                if (!ec) {
                    watchPeer(socket, key, entry, watch);
                    return;
                }
                std::lock_guard<std::mutex> lock(mtx);
                if (entry->status != Status::Waiting) {
                    return;
                }
                entry->status = Status::Disconnected;
                entry->wake.cancel();
                auto it = pending.find(key);
                if (it != pending.end() && it->second == entry) {
                    pending.erase(it);
                }
            });
    }

    template <typename Socket>
    net::awaitable<void> serveConnection(Socket& socket) {
        std::string buffer;
        auto first = co_await detail::ReadLineWithin(socket, buffer, kRegisterReadTimeout);
        if (first.status != detail::LineReadResult::Status::Line) {
            if (first.status == detail::LineReadResult::Status::Closed) {
                LOG_DEBUG("Coordinator: connection closed before registering");
            } else {
                LOG_WARN("Coordinator: no registration received ({})", describeReadFailure(first));
            }
            co_return;
        }

        auto registration = parseRegistration(first.line);
        if (!registration) {
            co_return;
        }

        const std::string key = NormalizeState(registration->state);
        auto entry = std::make_shared<PendingEntry>(ioc);
        entry->wake.expires_after(config.defaultTimeout);
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!running.load()) {
                co_return;
            }
            auto it = pending.find(key);
            if (it != pending.end() && it->second->status == Status::Waiting) {
                LOG_INFO("Coordinator: replacing existing registration for state {}", key);
                it->second->status = Status::Cancelled;
                it->second->wake.cancel();
            }
            pending[key] = entry;
        }
        LOG_INFO("Coordinator: registered waiter for state {}", key);

        auto watch = std::make_shared<PeerWatch>();
        watchPeer(socket, key, entry, watch);

        boost::system::error_code waitEc;
        co_await entry->wake.async_wait(net::redirect_error(net::use_awaitable, waitEc));
        watch->active = false;
        {
            boost::system::error_code ignored;
            socket.cancel(ignored);
        }

        Status outcome;
        std::optional<SocketMessage> delivery;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (entry->status == Status::Waiting) {
                entry->status = Status::Expired;
            }
            outcome = entry->status;
            delivery = entry->delivery;
            auto it = pending.find(key);
            if (it != pending.end() && it->second == entry) {
                pending.erase(it);
            }
        }

        if (outcome == Status::Delivered && delivery) {
            const std::string line = EncodeMessage(*delivery);
            boost::system::error_code writeEc;
            co_await net::async_write(socket, net::buffer(line), net::redirect_error(net::use_awaitable, writeEc));
            if (writeEc) {
                LOG_WARN("Coordinator: failed to send result for state {}: {}", key, writeEc.message());
            } else {
                LOG_INFO("Coordinator: delivered result for state {}", key);
            }
        } else if (outcome == Status::Expired) {
            LOG_WARN("Coordinator: callback timeout for state {}", key);
        } else if (outcome == Status::Disconnected) {
            LOG_INFO("Coordinator: client for state {} disconnected before delivery", key);
        } else {
            LOG_INFO("Coordinator: registration for state {} cancelled", key);
        }
    }

    template <typename Socket>
    net::awaitable<void> session(Socket socket) {
        if (!running.load()) {
            detail::CloseQuietly(socket);
            co_return;
        }
        const std::uint64_t connectionId = nextConnectionId++;
        closers.emplace(connectionId, [&socket]() { detail::CloseQuietly(socket); });
        try {
            co_await serveConnection(socket);
        } catch (const std::exception& e) {
            if (running.load()) {
                LOG_ERROR("Coordinator: connection handler error: {}", e.what());
            } else {
                LOG_DEBUG("Coordinator: connection handler error during shutdown: {}", e.what());
            }
        }
        closers.erase(connectionId);
        detail::CloseQuietly(socket);
    }

    template <typename Acceptor>
    net::awaitable<void> acceptLoop(Acceptor& acceptor) {
        while (running.load()) {
            boost::system::error_code ec;
            auto socket = co_await acceptor.async_accept(net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (!running.load() || ec == net::error::operation_aborted) {
                    break;
                }
                LOG_WARN("Coordinator: accept failed: {}", ec.message());
                net::steady_timer pause(ioc);
                pause.expires_after(kAcceptRetryDelay);
                boost::system::error_code ignored;
                co_await pause.async_wait(net::redirect_error(net::use_awaitable, ignored));
                continue;
            }
            net::co_spawn(ioc, session(std::move(socket)), net::detached);
        }
        LOG_DEBUG("Coordinator: accept loop finished");
        co_return;
    }

    void spawnAcceptLoop() {
#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
        if (localAcceptor) {
            net::co_spawn(ioc, acceptLoop(*localAcceptor), net::detached);
            return;
        }
#endif
        net::co_spawn(ioc, acceptLoop(*tcpAcceptor), net::detached);
    }
};

Coordinator::Coordinator(const RelayConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {}

Coordinator::~Coordinator() = default;

std::future<void> Coordinator::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    if (pImpl->running.load() || pImpl->ioThread.joinable()) {
        ready.set_exception(std::make_exception_ptr(errors::BindError("Coordinator is already running")));
        return fut;
    }
    try {
        pImpl->ioc.restart();
        pImpl->bind();
    } catch (const errors::BindError& e) {
        LOG_ERROR("Coordinator: {}", e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }

    pImpl->running.store(true);
    pImpl->spawnAcceptLoop();
    std::promise<void> finished;
    pImpl->ioFinished = finished.get_future();
    pImpl->ioThread = std::thread([this, done = std::move(finished)]() mutable {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("Coordinator: I/O thread terminated: {}", e.what());
        }
        done.set_value();
    });
    LOG_INFO("Coordinator listening on {} ({})",
             pImpl->kind == TransportKind::Tcp
                 ? pImpl->config.tcpBindAddress + ":" + std::to_string(pImpl->boundPort.load())
                 : pImpl->config.socketPath,
             TransportKindToString(pImpl->kind));
    ready.set_value();
    return fut;
}

std::future<void> Coordinator::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    const bool wasRunning = pImpl->running.load() || pImpl->ioThread.joinable();
    pImpl->shutdown();
    if (wasRunning) {
        LOG_INFO("Coordinator stopped");
    }
    done.set_value();
    return fut;
}

bool Coordinator::DeliverResult(const std::optional<std::string>& state,
                                const std::optional<std::string>& code,
                                const std::optional<JSONValue>& raw) {
    const std::string key = NormalizeState(state);
    std::shared_ptr<PendingEntry> entry;
    {
        std::lock_guard<std::mutex> lock(pImpl->mtx);
        auto it = pImpl->pending.find(key);
        if (it == pImpl->pending.end()) {
            if (pImpl->config.logUnmatched) {
                LOG_WARN("Coordinator: no waiting client for state {}", key);
            }
            return false;
        }
        entry = it->second;
        if (entry->status != PendingEntry::Status::Waiting) {
            LOG_WARN("Coordinator: ignoring repeated delivery for state {}", key);
            return false;
        }
        entry->status = PendingEntry::Status::Delivered;
        SocketMessage msg;
        msg.type = MessageType::Deliver;
        msg.state = state;
        msg.code = code;
        msg.raw = raw;
        entry->delivery = std::move(msg);
    }
    net::post(pImpl->ioc, [entry]() { entry->wake.cancel(); });
    LOG_INFO("Coordinator: resolved registration for state {} ({})", key, code ? "code" : "raw payload");
    return true;
}

bool Coordinator::IsRunning() const {
    return pImpl->running.load();
}

std::size_t Coordinator::PendingCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    std::size_t n = 0;
    for (const auto& [key, entry] : pImpl->pending) {
        if (entry->status == PendingEntry::Status::Waiting) { ++n; }
    }
    return n;
}

bool Coordinator::HasPendingRegistration(const std::optional<std::string>& state) const {
    std::lock_guard<std::mutex> lock(pImpl->mtx);
    auto it = pImpl->pending.find(NormalizeState(state));
    return it != pImpl->pending.end() && it->second->status == PendingEntry::Status::Waiting;
}

TransportKind Coordinator::GetTransportKind() const {
    return pImpl->kind;
}

unsigned short Coordinator::GetBoundPort() const {
    return pImpl->boundPort.load();
}

} // namespace oauthrelay
