//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RelayClient.hpp
// Purpose: Client side of the relay: register a state with the coordinator and wait for its callback
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "oauthrelay/Protocol.h"
#include "oauthrelay/RelayConfig.h"

namespace oauthrelay {

// Fixed bound on reaching the coordinator, independent of the wait timeout.
constexpr std::chrono::seconds kConnectTimeout{10};

//==========================================================================================================
// Registers `state` with the coordinator and waits for its DELIVER record.
// Args:
//   state: Correlation token; std::nullopt (or "") uses the coordinator's default slot.
//   timeout: Reply wait bound; std::nullopt uses config.defaultTimeout.
//   config: Transport selection and endpoint.
// Returns:
//   The delivered result (code, or raw payload when no code could be extracted).
// Throws:
//   errors::ConnectionError when the coordinator cannot be reached or the REGISTER cannot be sent,
//   errors::TimeoutError when no reply arrives in time, errors::ProtocolError on a malformed reply,
//   errors::RelayError when the connection closes without a result or the reply is not DELIVER.
//==========================================================================================================
boost::asio::awaitable<DeliveryResult> AsyncWaitForCode(std::optional<std::string> state,
                                                        std::optional<std::chrono::milliseconds> timeout,
                                                        RelayConfig config);

// Blocking form of AsyncWaitForCode; runs a private I/O context on the calling thread.
DeliveryResult WaitForCode(const std::optional<std::string>& state,
                           std::optional<std::chrono::milliseconds> timeout,
                           const RelayConfig& config);

// As above, with the configuration loaded from the OAUTH_* environment variables.
DeliveryResult WaitForCode(const std::optional<std::string>& state = std::nullopt,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

} // namespace oauthrelay
