//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_coordinator.cpp
// Purpose: GoogleTests for the coordinator registration table and its socket transports
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "RelayTestUtil.h"
#include "oauthrelay/Coordinator.hpp"
#include "oauthrelay/Protocol.h"
#include "oauthrelay/errors/Errors.h"

using namespace oauthrelay;
using namespace std::chrono;
using relaytest::RawConnection;
using Reply = relaytest::RawConnection::Reply;

namespace {

std::string registerLine(const std::optional<std::string>& state) {
    SocketMessage m;
    m.type = MessageType::Register;
    m.state = state;
    return EncodeMessage(m);
}

} // namespace

TEST(Coordinator, NormalizeStateMapsEmptyToDefaultSlot) {
    EXPECT_EQ(NormalizeState(std::nullopt), kDefaultStateKey);
    EXPECT_EQ(NormalizeState(std::string()), kDefaultStateKey);
    EXPECT_EQ(NormalizeState(std::string("s1")), "s1");
}

TEST(Coordinator, DeliverWithoutWaiterReturnsFalse) {
    Coordinator coordinator(relaytest::LocalConfig());
    EXPECT_FALSE(coordinator.DeliverResult(std::string("never-registered"), std::string("code")));
    EXPECT_EQ(coordinator.PendingCount(), 0u);
    EXPECT_FALSE(coordinator.IsRunning());
}

TEST(Coordinator, StopIsIdempotentAndSafeWhenNeverStarted) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Stop().get());
    ASSERT_NO_THROW(coordinator.Start().get());
    EXPECT_TRUE(coordinator.IsRunning());
    EXPECT_TRUE(std::filesystem::exists(cfg.socketPath));
    ASSERT_NO_THROW(coordinator.Stop().get());
    ASSERT_NO_THROW(coordinator.Stop().get());
    EXPECT_FALSE(coordinator.IsRunning());
    EXPECT_FALSE(std::filesystem::exists(cfg.socketPath));
}

TEST(Coordinator, StartTwiceReportsBindError) {
    Coordinator coordinator(relaytest::LocalConfig());
    ASSERT_NO_THROW(coordinator.Start().get());
    EXPECT_THROW(coordinator.Start().get(), errors::BindError);
    coordinator.Stop().get();
}

TEST(Coordinator, SingleDeliveryReachesWaiter) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());
    EXPECT_EQ(coordinator.GetTransportKind(), TransportKind::UnixSocket);
    EXPECT_EQ(coordinator.GetBoundPort(), 0);

    RawConnection conn(cfg);
    conn.Send(registerLine(std::string("s1")));
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("s1")); }));

    EXPECT_TRUE(coordinator.DeliverResult(std::string("s1"), std::string("abc123")));
    // A second delivery for the same registration is rejected.
    EXPECT_FALSE(coordinator.DeliverResult(std::string("s1"), std::string("again")));

    Reply reply = conn.ReadLine(seconds(3));
    ASSERT_EQ(reply.kind, Reply::Kind::Line);
    SocketMessage msg = DecodeMessage(reply.line);
    EXPECT_EQ(msg.type, MessageType::Deliver);
    EXPECT_EQ(msg.state.value_or(""), "s1");
    EXPECT_EQ(msg.code.value_or(""), "abc123");
    EXPECT_FALSE(msg.raw.has_value());

    EXPECT_EQ(conn.ReadLine(seconds(3)).kind, Reply::Kind::Closed);
    EXPECT_TRUE(relaytest::WaitUntil([&] { return coordinator.PendingCount() == 0; }));
    coordinator.Stop().get();
}

TEST(Coordinator, RawPayloadIsForwardedWhenNoCode) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    RawConnection conn(cfg);
    conn.Send(registerLine(std::string("s2")));
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("s2")); }));

    const JSONValue raw = ParseJSON("{\"error\":\"access_denied\",\"state\":\"s2\"}");
    EXPECT_TRUE(coordinator.DeliverResult(std::string("s2"), std::nullopt, raw));

    Reply reply = conn.ReadLine(seconds(3));
    ASSERT_EQ(reply.kind, Reply::Kind::Line);
    SocketMessage msg = DecodeMessage(reply.line);
    EXPECT_FALSE(msg.code.has_value());
    ASSERT_TRUE(msg.raw.has_value());
    EXPECT_EQ(*msg.raw, raw);
    coordinator.Stop().get();
}

TEST(Coordinator, NewerRegistrationReplacesOlder) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    RawConnection first(cfg);
    first.Send(registerLine(std::string("dup")));
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("dup")); }));

    RawConnection second(cfg);
    second.Send(registerLine(std::string("dup")));

    // The older waiter observes cancellation: closed without a DELIVER record.
    EXPECT_EQ(first.ReadLine(seconds(3)).kind, Reply::Kind::Closed);
    EXPECT_EQ(coordinator.PendingCount(), 1u);

    EXPECT_TRUE(coordinator.DeliverResult(std::string("dup"), std::string("fresh")));
    Reply reply = second.ReadLine(seconds(3));
    ASSERT_EQ(reply.kind, Reply::Kind::Line);
    EXPECT_EQ(DecodeMessage(reply.line).code.value_or(""), "fresh");
    coordinator.Stop().get();
}

TEST(Coordinator, ClientHangUpWithdrawsRegistration) {
    auto cfg = relaytest::LocalConfig(seconds(300));
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    RawConnection gone(cfg);
    gone.Send(registerLine(std::string("hangup")));
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("hangup")); }));
    gone.Close();

    ASSERT_TRUE(relaytest::WaitUntil([&] { return !coordinator.HasPendingRegistration(std::string("hangup")); }));
    EXPECT_EQ(coordinator.PendingCount(), 0u);
    EXPECT_FALSE(coordinator.DeliverResult(std::string("hangup"), std::string("lost-code")));

    // A fresh waiter for the same state still gets the next delivery.
    RawConnection next(cfg);
    next.Send(registerLine(std::string("hangup")));
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("hangup")); }));
    EXPECT_TRUE(coordinator.DeliverResult(std::string("hangup"), std::string("kept-code")));
    Reply reply = next.ReadLine(seconds(3));
    ASSERT_EQ(reply.kind, Reply::Kind::Line);
    EXPECT_EQ(DecodeMessage(reply.line).code.value_or(""), "kept-code");
    coordinator.Stop().get();
}

TEST(Coordinator, StrayBytesAfterRegisterKeepWaiterParked) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    RawConnection conn(cfg);
    conn.Send(registerLine(std::string("chatty")));
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("chatty")); }));
    conn.Send("noise\n");
    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_TRUE(coordinator.HasPendingRegistration(std::string("chatty")));

    EXPECT_TRUE(coordinator.DeliverResult(std::string("chatty"), std::string("still-here")));
    Reply reply = conn.ReadLine(seconds(3));
    ASSERT_EQ(reply.kind, Reply::Kind::Line);
    EXPECT_EQ(DecodeMessage(reply.line).code.value_or(""), "still-here");
    coordinator.Stop().get();
}

TEST(Coordinator, AbsentAndEmptyStateShareDefaultSlot) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    RawConnection conn(cfg);
    conn.Send("{\"type\":\"REGISTER\",\"state\":\"\"}\n");
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::nullopt); }));
    EXPECT_TRUE(coordinator.HasPendingRegistration(std::string(kDefaultStateKey)));

    EXPECT_TRUE(coordinator.DeliverResult(std::nullopt, std::string("default-code")));
    Reply reply = conn.ReadLine(seconds(3));
    ASSERT_EQ(reply.kind, Reply::Kind::Line);
    EXPECT_EQ(DecodeMessage(reply.line).code.value_or(""), "default-code");
    coordinator.Stop().get();
}

TEST(Coordinator, ProtocolViolationClosesOnlyThatConnection) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    RawConnection waiter(cfg);
    waiter.Send(registerLine(std::string("ok")));
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("ok")); }));

    RawConnection garbage(cfg);
    garbage.Send("hello there\n");
    EXPECT_EQ(garbage.ReadLine(seconds(3)).kind, Reply::Kind::Closed);

    RawConnection wrongType(cfg);
    wrongType.Send("{\"type\":\"DELIVER\",\"state\":\"ok\",\"code\":\"forged\"}\n");
    EXPECT_EQ(wrongType.ReadLine(seconds(3)).kind, Reply::Kind::Closed);

    EXPECT_EQ(coordinator.PendingCount(), 1u);
    EXPECT_TRUE(coordinator.DeliverResult(std::string("ok"), std::string("real")));
    Reply reply = waiter.ReadLine(seconds(3));
    ASSERT_EQ(reply.kind, Reply::Kind::Line);
    EXPECT_EQ(DecodeMessage(reply.line).code.value_or(""), "real");
    coordinator.Stop().get();
}

TEST(Coordinator, RegistrationExpiresAfterConfiguredTimeout) {
    auto cfg = relaytest::LocalConfig(milliseconds(200));
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    RawConnection conn(cfg);
    conn.Send(registerLine(std::string("slow")));
    EXPECT_EQ(conn.ReadLine(seconds(3)).kind, Reply::Kind::Closed);
    EXPECT_EQ(coordinator.PendingCount(), 0u);
    EXPECT_FALSE(coordinator.DeliverResult(std::string("slow"), std::string("late")));
    coordinator.Stop().get();
}

TEST(Coordinator, StopCancelsEveryPendingRegistration) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    std::vector<std::unique_ptr<RawConnection>> conns;
    for (int i = 0; i < 3; ++i) {
        conns.push_back(std::make_unique<RawConnection>(cfg));
        conns.back()->Send(registerLine("pending-" + std::to_string(i)));
    }
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.PendingCount() == 3; }));

    coordinator.Stop().get();
    for (auto& c : conns) {
        EXPECT_EQ(c->ReadLine(seconds(3)).kind, Reply::Kind::Closed);
    }
    EXPECT_EQ(coordinator.PendingCount(), 0u);
    EXPECT_FALSE(coordinator.DeliverResult(std::string("pending-0"), std::string("x")));
    EXPECT_FALSE(std::filesystem::exists(cfg.socketPath));
}

TEST(Coordinator, ConcurrentDeliveriesResolveExactlyOnce) {
    auto cfg = relaytest::LocalConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());

    RawConnection conn(cfg);
    conn.Send(registerLine(std::string("race")));
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("race")); }));

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i] {
            if (coordinator.DeliverResult(std::string("race"), "code-" + std::to_string(i))) {
                accepted.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) { t.join(); }
    EXPECT_EQ(accepted.load(), 1);

    Reply reply = conn.ReadLine(seconds(3));
    ASSERT_EQ(reply.kind, Reply::Kind::Line);
    EXPECT_EQ(DecodeMessage(reply.line).code.value_or("").rfind("code-", 0), 0u);
    coordinator.Stop().get();
}

TEST(Coordinator, RefusesPathOwnedByLiveCoordinator) {
    auto cfg = relaytest::LocalConfig();
    Coordinator owner(cfg);
    ASSERT_NO_THROW(owner.Start().get());

    Coordinator intruder(cfg);
    EXPECT_THROW(intruder.Start().get(), errors::BindError);
    EXPECT_FALSE(intruder.IsRunning());

    // The owner keeps serving on its path.
    RawConnection conn(cfg);
    conn.Send(registerLine(std::string("still-here")));
    ASSERT_TRUE(relaytest::WaitUntil([&] { return owner.HasPendingRegistration(std::string("still-here")); }));
    owner.Stop().get();
}

TEST(Coordinator, RemovesStaleSocketFile) {
    auto cfg = relaytest::LocalConfig();
    {
        boost::asio::io_context ioc;
        boost::asio::local::stream_protocol::acceptor stale(ioc, boost::asio::local::stream_protocol::endpoint(cfg.socketPath));
        stale.close();
    }
    ASSERT_TRUE(std::filesystem::exists(cfg.socketPath));

    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());
    EXPECT_TRUE(coordinator.IsRunning());
    coordinator.Stop().get();
}

TEST(Coordinator, RefusesPathThatIsNotASocket) {
    auto cfg = relaytest::LocalConfig();
    { std::ofstream f(cfg.socketPath); f << "not a socket"; }
    Coordinator coordinator(cfg);
    EXPECT_THROW(coordinator.Start().get(), errors::BindError);
    EXPECT_TRUE(std::filesystem::exists(cfg.socketPath));
    std::filesystem::remove(cfg.socketPath);
}

TEST(Coordinator, TcpTransportWithEphemeralPort) {
    auto cfg = relaytest::TcpConfig();
    Coordinator coordinator(cfg);
    ASSERT_NO_THROW(coordinator.Start().get());
    EXPECT_EQ(coordinator.GetTransportKind(), TransportKind::Tcp);
    const unsigned short port = coordinator.GetBoundPort();
    ASSERT_NE(port, 0);

    RawConnection conn(cfg, port);
    conn.Send(registerLine(std::string("tcp-state")));
    ASSERT_TRUE(relaytest::WaitUntil([&] { return coordinator.HasPendingRegistration(std::string("tcp-state")); }));
    EXPECT_TRUE(coordinator.DeliverResult(std::string("tcp-state"), std::string("tcp-code")));
    Reply reply = conn.ReadLine(seconds(3));
    ASSERT_EQ(reply.kind, Reply::Kind::Line);
    EXPECT_EQ(DecodeMessage(reply.line).code.value_or(""), "tcp-code");

    // Exactly one coordinator per port.
    auto clash = cfg;
    clash.tcpPort = port;
    Coordinator second(clash);
    EXPECT_THROW(second.Start().get(), errors::BindError);

    coordinator.Stop().get();
    EXPECT_EQ(coordinator.GetBoundPort(), 0);
}
