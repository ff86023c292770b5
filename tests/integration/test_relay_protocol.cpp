/**
 * @file test_relay_protocol.cpp
 * @brief Wire-level behaviour of the relay, driven with raw framed sockets
 */

#include <gtest/gtest.h>
#include "ClientId.h"
#include "Envelope.h"
#include "FrameIO.h"
#include "Logger.h"
#include "MetricsCollector.h"
#include "SignalingServer.h"
#include "TcpSocket.h"
#include "TestHelpers.h"

#include <memory>
#include <string>
#include <vector>

using namespace Tessera;
using namespace Tessera::Signaling;
using Tessera::Testing::waitFor;

namespace {

/// A relay connection with no client logic on top
class RawPeer {
public:
    explicit RawPeer(int port) {
        Endpoint endpoint{"127.0.0.1", port};
        auto sock = connectTcp(endpoint, std::chrono::milliseconds(2000));
        if (sock) {
            socket_ = std::move(*sock);
        }
    }

    bool connected() const { return socket_.valid(); }

    bool send(const Envelope& envelope) {
        return static_cast<bool>(writeFrame(socket_.get(), encodeEnvelope(envelope)));
    }

    bool sendRaw(const std::string& payload) {
        return static_cast<bool>(writeFrame(socket_.get(), payload));
    }

    /// Next envelope, or an error on timeout or close
    tsr::Result<Envelope> receive(int timeoutMs = 2000) {
        int ready = waitReadable(socket_.get(), timeoutMs);
        if (ready <= 0) {
            return tsr::Err<Envelope>(tsr::ErrorCode::ConnectionTimeout, "nothing to read");
        }
        auto frame = readFrame(socket_.get());
        if (!frame) {
            return frame.error();
        }
        return decodeEnvelope(*frame);
    }

    /// Skip envelopes until one of the given type arrives
    tsr::Result<Envelope> receiveType(EnvelopeType type, int timeoutMs = 2000) {
        while (true) {
            auto envelope = receive(timeoutMs);
            if (!envelope || envelope->type == type) {
                return envelope;
            }
        }
    }

    /// Register and consume the relay's acknowledgement
    std::string registerAs(const std::string& id) {
        send(Envelope::makeRegister(id));
        auto registered = receiveType(EnvelopeType::Registered);
        return registered ? registered->clientId : "";
    }

private:
    tsr::SocketGuard socket_;
};

} // namespace

class RelayProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
        ServerOptions options;
        options.host = "127.0.0.1";
        options.port = 0;
        options.handshakeTimeoutMs = 200;
        options.maxFrameBytes = 1024;
        server = std::make_unique<SignalingServer>(options);
        ASSERT_TRUE(server->start());
        port = server->getListeningPort();
        ASSERT_GT(port, 0);
    }

    void TearDown() override {
        server->stop();
        Logger::instance().setConsoleOutput(true);
    }

    std::unique_ptr<SignalingServer> server;
    int port = 0;
};

// ============================================================================
// Registration
// ============================================================================

TEST_F(RelayProtocolTest, RegisterIsAcknowledgedThenPeersFollow) {
    RawPeer peer(port);
    ASSERT_TRUE(peer.connected());
    ASSERT_TRUE(peer.send(Envelope::makeRegister("alice")));

    auto registered = peer.receive();
    ASSERT_TRUE(registered);
    EXPECT_EQ(registered->type, EnvelopeType::Registered);
    EXPECT_EQ(registered->clientId, "alice");

    auto peers = peer.receive();
    ASSERT_TRUE(peers);
    EXPECT_EQ(peers->type, EnvelopeType::Peers);
    EXPECT_EQ(peers->peers, (std::vector<std::string>{"alice"}));
}

TEST_F(RelayProtocolTest, SilentConnectionGetsAssignedId) {
    RawPeer peer(port);
    ASSERT_TRUE(peer.connected());

    auto registered = peer.receive(3000);
    ASSERT_TRUE(registered);
    EXPECT_EQ(registered->type, EnvelopeType::Registered);
    EXPECT_TRUE(ClientId::isValid(registered->clientId));
    EXPECT_TRUE(waitFor([&] { return server->getPeerIds() == std::vector<std::string>{registered->clientId}; }));
}

TEST_F(RelayProtocolTest, RegisterWithoutIdGetsAssignedId) {
    RawPeer peer(port);
    ASSERT_TRUE(peer.sendRaw(R"({"type":"register"})"));

    auto registered = peer.receive();
    ASSERT_TRUE(registered);
    EXPECT_TRUE(ClientId::isValid(registered->clientId));
}

TEST_F(RelayProtocolTest, FirstFrameOtherThanRegisterIsStillHandled) {
    RawPeer peer(port);
    ASSERT_TRUE(peer.send(Envelope::makePing(42)));

    auto registered = peer.receive();
    ASSERT_TRUE(registered);
    EXPECT_EQ(registered->type, EnvelopeType::Registered);

    auto pong = peer.receiveType(EnvelopeType::Pong);
    ASSERT_TRUE(pong);
    EXPECT_EQ(pong->ts, 42);
}

TEST_F(RelayProtocolTest, EveryMembershipChangeIsBroadcast) {
    RawPeer alice(port);
    RawPeer bob(port);
    ASSERT_EQ(alice.registerAs("alice"), "alice");
    auto first = alice.receiveType(EnvelopeType::Peers);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->peers, (std::vector<std::string>{"alice"}));

    ASSERT_EQ(bob.registerAs("bob"), "bob");
    auto joined = alice.receiveType(EnvelopeType::Peers);
    ASSERT_TRUE(joined);
    EXPECT_EQ(joined->peers, (std::vector<std::string>{"alice", "bob"}));

    {
        RawPeer carol(port);
        ASSERT_EQ(carol.registerAs("carol"), "carol");
        auto withCarol = alice.receiveType(EnvelopeType::Peers);
        ASSERT_TRUE(withCarol);
        EXPECT_EQ(withCarol->peers.size(), 3u);
    }

    auto left = alice.receiveType(EnvelopeType::Peers);
    ASSERT_TRUE(left);
    EXPECT_EQ(left->peers, (std::vector<std::string>{"alice", "bob"}));
}

TEST_F(RelayProtocolTest, DuplicateIdEvictsOlderConnection) {
    RawPeer stale(port);
    ASSERT_EQ(stale.registerAs("dup"), "dup");

    RawPeer fresh(port);
    ASSERT_EQ(fresh.registerAs("dup"), "dup");
    auto peers = fresh.receiveType(EnvelopeType::Peers);
    ASSERT_TRUE(peers);
    EXPECT_EQ(peers->peers, (std::vector<std::string>{"dup"}));

    // The stale connection drains whatever was queued, then hits EOF
    tsr::Result<Envelope> last = stale.receive();
    while (last) {
        last = stale.receive();
    }
    EXPECT_NE(last.error().code, tsr::ErrorCode::ConnectionTimeout);
    EXPECT_EQ(server->getPeerIds(), (std::vector<std::string>{"dup"}));
}

// ============================================================================
// Forwarding and keepalive
// ============================================================================

TEST_F(RelayProtocolTest, ForwardedMessageCarriesSenderId) {
    RawPeer alice(port);
    RawPeer bob(port);
    ASSERT_EQ(alice.registerAs("alice"), "alice");
    ASSERT_EQ(bob.registerAs("bob"), "bob");

    Json::Value payload;
    payload["candidate"] = "udp 1 2";
    ASSERT_TRUE(alice.send(Envelope::makeMessage("bob", "mallory", payload)));

    auto message = bob.receiveType(EnvelopeType::Message);
    ASSERT_TRUE(message);
    EXPECT_EQ(message->from, "alice");
    EXPECT_EQ(message->to, "bob");
    EXPECT_EQ(message->message, payload);
}

TEST_F(RelayProtocolTest, MessageToUnknownTargetIsCountedAndDropped) {
    auto before = MetricsCollector::instance().getSignalingMetrics().messagesDropped;
    RawPeer alice(port);
    ASSERT_EQ(alice.registerAs("alice"), "alice");

    ASSERT_TRUE(alice.send(Envelope::makeMessage("ghost", "", Json::Value("hi"))));
    EXPECT_TRUE(waitFor([&] {
        return MetricsCollector::instance().getSignalingMetrics().messagesDropped > before;
    }));

    // Sender stays connected
    ASSERT_TRUE(alice.send(Envelope::makePing(1)));
    EXPECT_TRUE(alice.receiveType(EnvelopeType::Pong));
}

TEST_F(RelayProtocolTest, PingIsAnsweredWithSameTimestamp) {
    RawPeer peer(port);
    ASSERT_EQ(peer.registerAs("p"), "p");
    ASSERT_TRUE(peer.send(Envelope::makePing(1700000000000)));

    auto pong = peer.receiveType(EnvelopeType::Pong);
    ASSERT_TRUE(pong);
    EXPECT_EQ(pong->ts, 1700000000000);
}

// ============================================================================
// Malformed input
// ============================================================================

TEST_F(RelayProtocolTest, MalformedFrameKeepsConnectionOpen) {
    RawPeer peer(port);
    ASSERT_EQ(peer.registerAs("p"), "p");

    ASSERT_TRUE(peer.sendRaw("{this is not json"));
    ASSERT_TRUE(peer.sendRaw(R"({"type":"message","message":{}})"));
    ASSERT_TRUE(peer.sendRaw(R"({"type":"offer","sdp":"x"})"));
    ASSERT_TRUE(peer.send(Envelope::makePing(5)));

    auto pong = peer.receiveType(EnvelopeType::Pong);
    ASSERT_TRUE(pong);
    EXPECT_EQ(pong->ts, 5);
    EXPECT_EQ(server->getPeerIds(), (std::vector<std::string>{"p"}));
}

TEST_F(RelayProtocolTest, OversizedFrameClosesConnection) {
    RawPeer watcher(port);
    ASSERT_EQ(watcher.registerAs("watcher"), "watcher");
    RawPeer peer(port);
    ASSERT_EQ(peer.registerAs("big"), "big");
    ASSERT_TRUE(waitFor([&] { return server->getPeerIds().size() == 2; }));

    peer.sendRaw(std::string(4096, 'x'));

    EXPECT_TRUE(waitFor([&] { return server->getPeerIds() == std::vector<std::string>{"watcher"}; }));
    tsr::Result<Envelope> last = peer.receive();
    while (last) {
        last = peer.receive();
    }
    EXPECT_NE(last.error().code, tsr::ErrorCode::ConnectionTimeout);
}

TEST_F(RelayProtocolTest, StopClosesEveryConnection) {
    RawPeer a(port);
    RawPeer b(port);
    ASSERT_EQ(a.registerAs("a"), "a");
    ASSERT_EQ(b.registerAs("b"), "b");

    server->stop();
    EXPECT_FALSE(server->isRunning());
    EXPECT_EQ(server->getListeningPort(), 0);
    EXPECT_EQ(server->connectionCount(), 0u);

    tsr::Result<Envelope> last = a.receive();
    while (last) {
        last = a.receive();
    }
    EXPECT_NE(last.error().code, tsr::ErrorCode::ConnectionTimeout);
}
