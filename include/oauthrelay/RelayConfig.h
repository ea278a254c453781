//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RelayConfig.h
// Purpose: Settings shared by the relay coordinator, its HTTP callback endpoint and waiting clients
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace oauthrelay {

//==========================================================================================================
// TransportKind
// Purpose: Listening/connecting transport between clients and the coordinator.
//==========================================================================================================
enum class TransportKind {
    UnixSocket,  // filesystem-path addressed local stream socket
    Tcp          // loopback TCP port
};

const char* TransportKindToString(TransportKind kind);

// True when the platform supports filesystem-path local stream sockets.
bool LocalSocketsSupported();

//==========================================================================================================
// RelayConfig
// Purpose: Relay settings with defaults. Load from OAUTH_* environment variables via FromEnvironment().
// Fields:
//   socketPath: Local socket path (OAUTH_SOCKET_PATH).
//   useTcp: Force the loopback TCP transport (OAUTH_USE_TCP).
//   tcpPort: TCP port for bind and connect (OAUTH_TCP_FALLBACK_PORT). 0 binds an ephemeral port.
//   tcpBindAddress: Coordinator bind address for TCP (OAUTH_TCP_BIND_ADDRESS).
//   tcpHost: Client connect address for TCP (OAUTH_TCP_HOST).
//   defaultTimeout: Coordinator per-registration wait and client default wait (OAUTH_DEFAULT_TIMEOUT, seconds).
//   logUnmatched: Log deliveries that find no waiter (OAUTH_LOG_UNMATCHED).
//   callbackPath: HTTP path receiving provider redirects (OAUTH_CALLBACK_PATH).
//   codeKeys: Candidate payload keys holding the code, in priority order (OAUTH_CODE_KEYS, comma-separated).
//==========================================================================================================
struct RelayConfig {
    std::string socketPath{"/tmp/oauth-relay.sock"};
    bool useTcp{false};
    unsigned short tcpPort{9999};
    std::string tcpBindAddress{"127.0.0.1"};
    std::string tcpHost{"127.0.0.1"};
    std::chrono::milliseconds defaultTimeout{std::chrono::seconds(300)};
    bool logUnmatched{true};
    std::string callbackPath{"/oauth/callback"};
    std::vector<std::string> codeKeys{"code", "authorization_code"};

    // Transport actually used: TCP when requested or when local sockets are unavailable.
    TransportKind EffectiveTransport() const;

    // Human-readable endpoint for logs ("/tmp/oauth-relay.sock" or "127.0.0.1:9999").
    std::string DescribeEndpoint() const;

    static RelayConfig FromEnvironment();
};

// Split a comma-separated list, trimming whitespace and dropping empty items.
std::vector<std::string> SplitList(const std::string& text);

} // namespace oauthrelay
