//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line waiter: register a state with the relay and print the delivered code
//==========================================================================================================

#include <chrono>
#include <cstddef>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "oauthrelay/RelayClient.hpp"
#include "oauthrelay/RelayConfig.h"
#include "oauthrelay/errors/Errors.h"

using namespace oauthrelay;

namespace {

constexpr int kExitCode = 0;
constexpr int kExitRawPayload = 1;
constexpr int kExitTimeout = 2;
constexpr int kExitConnection = 3;
constexpr int kExitOther = 4;

std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
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

bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] != nullptr && flag == argv[i]) {
            return true;
        }
    }
    return false;
}

} // namespace

int main(int argc, char** argv) {
    // stdout carries the result only
    Logger::setUseStderr(true);
    Logger::setLogLevelFromString(GetEnvOrDefault("OAUTHRELAY_LOG_LEVEL", "WARN"));

    RelayConfig config = RelayConfig::FromEnvironment();
    std::optional<std::string> state = getArgValue(argc, argv, "--state");
    std::optional<std::chrono::milliseconds> timeout;
    try {
        if (auto v = getArgValue(argc, argv, "--timeout-ms"); v.has_value()) {
            timeout = std::chrono::milliseconds(std::stoll(v.value()));
        }
        if (auto v = getArgValue(argc, argv, "--tcp-port"); v.has_value()) {
            unsigned long port = std::stoul(v.value());
            if (port > 65535ul) {
                throw std::out_of_range("port");
            }
            config.tcpPort = static_cast<unsigned short>(port);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Invalid numeric argument: {}", e.what());
        return kExitOther;
    }
    if (auto v = getArgValue(argc, argv, "--socket"); v.has_value()) {
        config.socketPath = v.value();
    }
    if (hasFlag(argc, argv, "--use-tcp")) {
        config.useTcp = true;
    }

    try {
        DeliveryResult result = WaitForCode(state, timeout, config);
        if (result.Success()) {
            std::cout << *result.code << std::endl;
            return kExitCode;
        }
        std::cout << (result.raw ? SerializeJSON(*result.raw) : std::string("null")) << std::endl;
        return kExitRawPayload;
    } catch (const errors::TimeoutError& e) {
        LOG_ERROR("{}", e.what());
        return kExitTimeout;
    } catch (const errors::ConnectionError& e) {
        LOG_ERROR("{}", e.what());
        return kExitConnection;
    } catch (const errors::RelayError& e) {
        LOG_ERROR("{} error: {}", errors::errorCategoryName(e.category()), e.what());
        return kExitOther;
    }
}
