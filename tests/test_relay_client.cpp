//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_relay_client.cpp
// Purpose: End-to-end GoogleTests for WaitForCode against a live coordinator
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <future>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include "RelayTestUtil.h"
#include "oauthrelay/Coordinator.hpp"
#include "oauthrelay/RelayClient.hpp"
#include "oauthrelay/errors/Errors.h"

using namespace oauthrelay;
using namespace std::chrono;

namespace {

//==========================================================================================================
// startWaiter
// Purpose: Run a blocking WaitForCode on a background thread and hand back its future.
//==========================================================================================================
std::future<DeliveryResult> startWaiter(const std::optional<std::string>& state,
                                        std::optional<milliseconds> timeout,
                                        const RelayConfig& cfg) {
    return std::async(std::launch::async, [state, timeout, cfg]() {
        return WaitForCode(state, timeout, cfg);
    });
}

} // namespace

TEST(RelayClient, ReceivesDeliveredCode) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    auto fut = startWaiter(std::string("s1"), std::nullopt, cfg);
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("s1")); }));
    EXPECT_TRUE(coordinator.DeliverResult(std::string("s1"), std::string("abc123")));

    ASSERT_EQ(fut.wait_for(seconds(5)), std::future_status::ready);
    DeliveryResult result = fut.get();
    EXPECT_TRUE(result.Success());
    EXPECT_EQ(result.code.value_or(""), "abc123");
    coordinator.Stop().get();
}

TEST(RelayClient, ReceivesRawPayloadWhenNoCode) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    auto fut = startWaiter(std::string("s2"), std::nullopt, cfg);
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("s2")); }));
    const JSONValue raw = ParseJSON("{\"error\":\"access_denied\",\"state\":\"s2\"}");
    EXPECT_TRUE(coordinator.DeliverResult(std::string("s2"), std::nullopt, raw));

    ASSERT_EQ(fut.wait_for(seconds(5)), std::future_status::ready);
    DeliveryResult result = fut.get();
    EXPECT_FALSE(result.Success());
    ASSERT_TRUE(result.raw.has_value());
    EXPECT_EQ(*result.raw, raw);
    coordinator.Stop().get();
}

TEST(RelayClient, DefaultSlotWithoutState) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    auto fut = startWaiter(std::nullopt, std::nullopt, cfg);
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::nullopt); }));
    EXPECT_TRUE(coordinator.DeliverResult(std::string(""), std::string("no-state-code")));

    ASSERT_EQ(fut.wait_for(seconds(5)), std::future_status::ready);
    EXPECT_EQ(fut.get().code.value_or(""), "no-state-code");
    coordinator.Stop().get();
}

TEST(RelayClient, TimesOutWithoutDelivery) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    const auto started = steady_clock::now();
    EXPECT_THROW(WaitForCode(std::string("timeout-state"), milliseconds(500), cfg), errors::TimeoutError);
    const auto elapsed = steady_clock::now() - started;
    EXPECT_GE(elapsed, milliseconds(450));
    EXPECT_LT(elapsed, seconds(5));

    // The abandoned registration is withdrawn once the client hangs up, so nothing can be delivered into it.
    ASSERT_TRUE(relaytest::WaitUntil([&] { return !coordinator.HasPendingRegistration(std::string("timeout-state")); }));
    EXPECT_FALSE(coordinator.DeliverResult(std::string("timeout-state"), std::string("lost")));

    auto fut = startWaiter(std::string("timeout-state"), std::nullopt, cfg);
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("timeout-state")); }));
    EXPECT_TRUE(coordinator.DeliverResult(std::string("timeout-state"), std::string("after")));
    ASSERT_EQ(fut.wait_for(seconds(5)), std::future_status::ready);
    EXPECT_EQ(fut.get().code.value_or(""), "after");
    coordinator.Stop().get();
}

TEST(RelayClient, ConnectionErrorWhenNoCoordinator) {
    auto cfg = relaytest::LocalConfig();
    EXPECT_THROW(WaitForCode(std::string("test"), milliseconds(500), cfg), errors::ConnectionError);

    auto tcp = relaytest::TcpConfig();
    // Bind and release a port so that nothing listens on it.
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::acceptor acc(ioc, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        tcp.tcpPort = acc.local_endpoint().port();
    }
    EXPECT_THROW(WaitForCode(std::string("test"), milliseconds(500), tcp), errors::ConnectionError);
}

TEST(RelayClient, ReplacedWaiterSeesClosedConnection) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    auto first = startWaiter(std::string("dup"), std::nullopt, cfg);
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("dup")); }));
    auto second = startWaiter(std::string("dup"), std::nullopt, cfg);

    ASSERT_EQ(first.wait_for(seconds(5)), std::future_status::ready);
    try {
        first.get();
        FAIL() << "replaced waiter must not receive a result";
    } catch (const errors::RelayError& e) {
        EXPECT_EQ(e.category(), errors::ErrorCategory::Relay);
    }

    EXPECT_TRUE(coordinator.DeliverResult(std::string("dup"), std::string("winner")));
    ASSERT_EQ(second.wait_for(seconds(5)), std::future_status::ready);
    EXPECT_EQ(second.get().code.value_or(""), "winner");
    coordinator.Stop().get();
}

TEST(RelayClient, ShutdownWakesWaiters) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    auto fut = startWaiter(std::string("bye"), std::nullopt, cfg);
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("bye")); }));
    coordinator.Stop().get();

    ASSERT_EQ(fut.wait_for(seconds(5)), std::future_status::ready);
    EXPECT_THROW(fut.get(), errors::RelayError);
}

TEST(RelayClient, OverTcpTransport) {
    auto cfg = relaytest::TcpConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());
    cfg.tcpPort = coordinator.GetBoundPort();

    auto fut = startWaiter(std::string("tcp"), std::nullopt, cfg);
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("tcp")); }));
    EXPECT_TRUE(coordinator.DeliverResult(std::string("tcp"), std::string("over-tcp")));
    ASSERT_EQ(fut.wait_for(seconds(5)), std::future_status::ready);
    EXPECT_EQ(fut.get().code.value_or(""), "over-tcp");
    coordinator.Stop().get();
}

TEST(RelayClient, AsyncWaitRunsInsideCallerContext) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    boost::asio::io_context ioc;
    auto fut = boost::asio::co_spawn(ioc, AsyncWaitForCode(std::string("async"), seconds(5), cfg), boost::asio::use_future);
    std::thread runner([&ioc] { ioc.run(); });

    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("async")); }));
    EXPECT_TRUE(coordinator.DeliverResult(std::string("async"), std::string("from-coroutine")));
    ASSERT_EQ(fut.wait_for(seconds(5)), std::future_status::ready);
    EXPECT_EQ(fut.get().code.value_or(""), "from-coroutine");
    runner.join();
    coordinator.Stop().get();
}

TEST(RelayClient, MalformedReplyIsProtocolError) {
    auto cfg = relaytest::TcpConfig();
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acc(ioc, boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    cfg.tcpPort = acc.local_endpoint().port();

    // Fake coordinator: accept, read the REGISTER line, reply with garbage then an unexpected type.
    std::thread fake([&acc] {
        for (const char* reply : {"not-json\n", "{\"type\":\"ERROR\",\"error\":\"nope\"}\n"}) {
            boost::asio::ip::tcp::socket s = acc.accept();
            std::string buf;
            boost::asio::read_until(s, boost::asio::dynamic_buffer(buf), '\n');
            boost::asio::write(s, boost::asio::buffer(std::string(reply)));
            boost::system::error_code ec;
            s.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        }
    });

    EXPECT_THROW(WaitForCode(std::string("x"), seconds(3), cfg), errors::ProtocolError);
    try {
        WaitForCode(std::string("x"), seconds(3), cfg);
        FAIL() << "expected RelayError";
    } catch (const errors::RelayError& e) {
        EXPECT_NE(std::string(e.what()).find("ERROR"), std::string::npos);
    }
    fake.join();
}

TEST(RelayClient, EnvironmentOverloadUsesOauthVariables) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    ::setenv("OAUTH_SOCKET_PATH", cfg.socketPath.c_str(), 1);
    ::unsetenv("OAUTH_USE_TCP");
    auto fut = std::async(std::launch::async, []() {
        return WaitForCode(std::string("env"), milliseconds(3000));
    });
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("env")); }));
    EXPECT_TRUE(coordinator.DeliverResult(std::string("env"), std::string("env-code")));
    ASSERT_EQ(fut.wait_for(seconds(5)), std::future_status::ready);
    EXPECT_EQ(fut.get().code.value_or(""), "env-code");
    ::unsetenv("OAUTH_SOCKET_PATH");
    coordinator.Stop().get();
}
