//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Coordinator.hpp
// Purpose: Coroutine-based rendezvous server matching provider callbacks to waiting clients (Boost.Asio)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "oauthrelay/JSONValue.h"
#include "oauthrelay/RelayConfig.h"

namespace oauthrelay {

//==========================================================================================================
// IDeliverySink
// Purpose: Receiver of provider callbacks. Implemented by Coordinator; consumed by the HTTP callback
//          endpoint so it never needs a process-wide coordinator handle.
//==========================================================================================================
class IDeliverySink {
public:
    virtual ~IDeliverySink() = default;

    //==========================================================================================================
    // Hands a callback result to the waiter registered for `state`.
    // Args:
    //   state: Correlation token from the callback (std::nullopt or "" selects the default slot).
    //   code: Extracted authorization code, if any.
    //   raw: Full callback payload, passed when no code could be extracted.
    // Returns:
    //   true when a waiting registration was resolved; false when no waiter exists or it was already resolved.
    //==========================================================================================================
    virtual bool DeliverResult(const std::optional<std::string>& state,
                               const std::optional<std::string>& code,
                               const std::optional<JSONValue>& raw = std::nullopt) = 0;
};

//==========================================================================================================
// Coordinator
// Purpose: Owns the registration table and the listening transport (local socket or loopback TCP).
// Notes:
//   - Each accepted connection is an independent coroutine on the coordinator's I/O thread. The first line
//     must be a REGISTER record; the connection then parks until DeliverResult, replacement by a newer
//     REGISTER for the same state, the configured timeout, or Stop().
//   - At most one live registration exists per state; a newer REGISTER cancels the older one, whose client
//     sees the connection close without a result.
//   - DeliverResult may be called from any thread.
//==========================================================================================================
class Coordinator : public IDeliverySink {
public:
    explicit Coordinator(const RelayConfig& config);
    ~Coordinator() override;

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    //==========================================================================================================
    // Binds the transport and starts the accept loop on a background I/O thread.
    // For the local socket kind a stale socket file is removed first; a path on which another coordinator
    // still accepts connections is never taken over.
    // Returns:
    //   Future that becomes ready once the transport is bound and accepting. It holds errors::BindError when
    //   the transport cannot be bound, or when the coordinator is already running.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Cancels every pending registration, closes the listener and all open connections, joins the I/O
    // thread and removes the socket file (local socket kind). Idempotent; safe when never started.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop();

    bool DeliverResult(const std::optional<std::string>& state,
                       const std::optional<std::string>& code,
                       const std::optional<JSONValue>& raw = std::nullopt) override;

    bool IsRunning() const;

    // Number of registrations currently waiting for a delivery.
    std::size_t PendingCount() const;

    // True when a registration for `state` is waiting for a delivery.
    bool HasPendingRegistration(const std::optional<std::string>& state) const;

    TransportKind GetTransportKind() const;

    // Actual listening TCP port once started (useful with tcpPort == 0); 0 for the local socket kind.
    unsigned short GetBoundPort() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

// Reserved table key used for registrations and deliveries without a state.
extern const char* const kDefaultStateKey;

// Maps an absent or empty state onto kDefaultStateKey.
std::string NormalizeState(const std::optional<std::string>& state);

} // namespace oauthrelay
