//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RelayConfig.cpp
// Purpose: Relay settings defaults and environment loading
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include <boost/asio/local/stream_protocol.hpp>

#include "oauthrelay/RelayConfig.h"
#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace oauthrelay {

const char* TransportKindToString(TransportKind kind) {
    switch (kind) {
        case TransportKind::UnixSocket: return "unix";
        case TransportKind::Tcp: return "tcp";
    }
    return "unknown";
}

bool LocalSocketsSupported() {
#if defined(BOOST_ASIO_HAS_LOCAL_SOCKETS)
    return true;
#else
    return false;
#endif
}

TransportKind RelayConfig::EffectiveTransport() const {
    if (useTcp || !LocalSocketsSupported()) {
        return TransportKind::Tcp;
    }
    return TransportKind::UnixSocket;
}

std::string RelayConfig::DescribeEndpoint() const {
    if (EffectiveTransport() == TransportKind::Tcp) {
        return tcpHost + ":" + std::to_string(tcpPort);
    }
    return socketPath;
}

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        std::string item = (comma == std::string::npos) ? text.substr(start) : text.substr(start, comma - start);
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        item.erase(item.begin(), std::find_if(item.begin(), item.end(), notSpace));
        item.erase(std::find_if(item.rbegin(), item.rend(), notSpace).base(), item.end());
        if (!item.empty()) { items.push_back(item); }
        if (comma == std::string::npos) { break; }
        start = comma + 1;
    }
    return items;
}

RelayConfig RelayConfig::FromEnvironment() {
    RelayConfig cfg;
    cfg.socketPath = GetEnvOrDefault("OAUTH_SOCKET_PATH", cfg.socketPath);
    cfg.useTcp = GetEnvFlag("OAUTH_USE_TCP", cfg.useTcp);
    cfg.tcpBindAddress = GetEnvOrDefault("OAUTH_TCP_BIND_ADDRESS", cfg.tcpBindAddress);
    cfg.tcpHost = GetEnvOrDefault("OAUTH_TCP_HOST", cfg.tcpHost);
    cfg.logUnmatched = GetEnvFlag("OAUTH_LOG_UNMATCHED", cfg.logUnmatched);
    cfg.callbackPath = GetEnvOrDefault("OAUTH_CALLBACK_PATH", cfg.callbackPath);

    const std::string port = GetEnvOrDefault("OAUTH_TCP_FALLBACK_PORT", "");
    if (!port.empty()) {
        try {
            unsigned long v = std::stoul(port);
            if (v > 65535ul) {
                throw std::out_of_range("port");
            }
            cfg.tcpPort = static_cast<unsigned short>(v);
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid OAUTH_TCP_FALLBACK_PORT={} (using {})", port, cfg.tcpPort);
        }
    }

    const std::string timeout = GetEnvOrDefault("OAUTH_DEFAULT_TIMEOUT", "");
    if (!timeout.empty()) {
        try {
            double seconds = std::stod(timeout);
            if (!std::isfinite(seconds) || seconds <= 0.0) {
                throw std::out_of_range("timeout");
            }
            cfg.defaultTimeout = std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
        } catch (const std::exception&) {
            LOG_WARN("Ignoring invalid OAUTH_DEFAULT_TIMEOUT={} (using {} ms)", timeout, cfg.defaultTimeout.count());
        }
    }

    const std::string keys = GetEnvOrDefault("OAUTH_CODE_KEYS", "");
    if (!keys.empty()) {
        auto parsed = SplitList(keys);
        if (!parsed.empty()) {
            cfg.codeKeys = std::move(parsed);
        }
    }
    return cfg;
}

} // namespace oauthrelay
