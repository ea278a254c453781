//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: OAuth relay server: coordinator plus HTTP callback endpoint
//==========================================================================================================

#include <chrono>
#include <csignal>
#include <cstddef>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "oauthrelay/CallbackServer.hpp"
#include "oauthrelay/Coordinator.hpp"
#include "oauthrelay/RelayConfig.h"
#include "oauthrelay/version.h"

using namespace oauthrelay;

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--listen")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevelFromString(GetEnvOrDefault("OAUTHRELAY_LOG_LEVEL", "INFO"));

    RelayConfig config = RelayConfig::FromEnvironment();
    if (auto v = getArgValue(argc, argv, "--socket"); v.has_value()) {
        config.socketPath = v.value();
    }
    if (auto v = getArgValue(argc, argv, "--tcp-port"); v.has_value()) {
        try {
            unsigned long port = std::stoul(v.value());
            if (port > 65535ul) {
                throw std::out_of_range("port");
            }
            config.tcpPort = static_cast<unsigned short>(port);
        } catch (const std::exception&) {
            LOG_ERROR("Invalid --tcp-port value: {}", v.value());
            return 1;
        }
    }
    if (hasFlag(argc, argv, "--use-tcp")) {
        config.useTcp = true;
    }
    if (auto v = getArgValue(argc, argv, "--timeout-ms"); v.has_value()) {
        try {
            long long ms = std::stoll(v.value());
            if (ms <= 0) {
                throw std::out_of_range("timeout");
            }
            config.defaultTimeout = std::chrono::milliseconds(ms);
        } catch (const std::exception&) {
            LOG_ERROR("Invalid --timeout-ms value: {}", v.value());
            return 1;
        }
    }

    std::string listen = getArgValue(argc, argv, "--listen")
                             .value_or(GetEnvOrDefault("OAUTHRELAY_LISTEN", "http://0.0.0.0:8000"));
    CallbackServer::Options httpOpts;
    httpOpts.callbackPath = config.callbackPath;
    httpOpts.codeKeys = config.codeKeys;
    httpOpts = ParseListenUri(listen, httpOpts);

    LOG_INFO("OAuth relay {} starting (coordinator={} via {}, callback={})", getVersionString(),
             config.DescribeEndpoint(), TransportKindToString(config.EffectiveTransport()), listen);

    Coordinator coordinator(config);
    try {
        coordinator.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start coordinator: {}", e.what());
        return 1;
    }

    CallbackServer callbackServer(httpOpts, coordinator);
    try {
        callbackServer.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start callback endpoint: {}", e.what());
        coordinator.Stop().get();
        return 1;
    }

    boost::asio::io_context signals;
    boost::asio::signal_set stopSignals(signals, SIGINT, SIGTERM);
    stopSignals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}, shutting down", signo);
        }
    });
    signals.run();

    callbackServer.Stop().get();
    coordinator.Stop().get();
    LOG_INFO("OAuth relay stopped");
    return 0;
}
