/**
 * @file test_signaling.cpp
 * @brief SignalingClient against a live SignalingServer on loopback
 *
 * Covers peer list propagation, directed delivery, the offline outbox,
 * discovery-backed connections and reconnection after a relay restart.
 */

#include <gtest/gtest.h>
#include "DiscoveryProvider.h"
#include "Logger.h"
#include "SignalingClient.h"
#include "SignalingServer.h"
#include "TestHelpers.h"

#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace Tessera;
using namespace Tessera::Signaling;
using Tessera::Testing::waitFor;

namespace {

/// Thread-safe record of everything a client's message handler saw
class Inbox {
public:
    void attach(SignalingClient& client) {
        client.setOnMessage([this](const std::string& from, const Json::Value& payload) {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.emplace_back(from, payload);
        });
    }

    std::vector<std::pair<std::string, Json::Value>> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, Json::Value>> messages_;
};

Json::Value numbered(int n) {
    Json::Value payload;
    payload["n"] = n;
    return payload;
}

} // namespace

class SignalingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setConsoleOutput(false);
        server = startServer(0);
        ASSERT_NE(server, nullptr);
        port = server->getListeningPort();
    }

    void TearDown() override {
        clients.clear();
        if (server) {
            server->stop();
        }
        Logger::instance().setConsoleOutput(true);
    }

    static std::unique_ptr<SignalingServer> startServer(int listenPort) {
        ServerOptions options;
        options.host = "127.0.0.1";
        options.port = listenPort;
        options.handshakeTimeoutMs = 500;
        auto relay = std::make_unique<SignalingServer>(options);
        if (!relay->start()) {
            return nullptr;
        }
        return relay;
    }

    ClientOptions clientOptions() const {
        ClientOptions options;
        options.url = "tcp://127.0.0.1:" + std::to_string(port);
        options.connectTimeout = std::chrono::milliseconds(2000);
        options.heartbeatInterval = std::chrono::milliseconds(0);
        options.reconnect.baseDelay = std::chrono::milliseconds(50);
        options.reconnect.maxDelay = std::chrono::milliseconds(200);
        options.reconnect.jitter = std::chrono::milliseconds(0);
        return options;
    }

    SignalingClient& newClient() {
        clients.push_back(std::make_unique<SignalingClient>(clientOptions()));
        return *clients.back();
    }

    SignalingClient& connectedClient() {
        auto& client = newClient();
        auto result = client.connect();
        EXPECT_TRUE(result) << (result ? "" : result.error().message);
        return client;
    }

    // Outlives every client, so a late delivery never touches a dead inbox
    Inbox& inboxFor(SignalingClient& client) {
        inboxes.emplace_back();
        inboxes.back().attach(client);
        return inboxes.back();
    }

    static bool hasPeers(SignalingClient& client, const std::vector<std::string>& expected) {
        return client.peers().get() == expected;
    }

    std::unique_ptr<SignalingServer> server;
    int port = 0;
    std::list<Inbox> inboxes;
    std::vector<std::unique_ptr<SignalingClient>> clients;
};

// ============================================================================
// Peer lists
// ============================================================================

TEST_F(SignalingTest, ConnectPublishesStatus) {
    std::vector<ConnectionState> states;
    SignalingClient client(clientOptions());
    client.connectionState().subscribe([&](const ConnectionState& s) { states.push_back(s); });

    ASSERT_TRUE(client.connect());
    EXPECT_TRUE(client.isConnected());
    EXPECT_EQ(client.backend().get(), Backend::Relay);
    EXPECT_EQ(states, (std::vector<ConnectionState>{ConnectionState::Connecting, ConnectionState::Connected}));

    // A second connect() on a live connection is a no-op
    EXPECT_TRUE(client.connect());
}

TEST_F(SignalingTest, PeerListsTrackOpenConnections) {
    auto& alice = connectedClient();
    auto& bob = connectedClient();
    std::vector<std::string> both{alice.getClientId(), bob.getClientId()};

    EXPECT_TRUE(waitFor([&] { return hasPeers(alice, both) && hasPeers(bob, both); }));
    EXPECT_EQ(server->getPeerIds(), both);

    bob.disconnect();
    EXPECT_TRUE(waitFor([&] { return hasPeers(alice, {alice.getClientId()}); }));
    EXPECT_TRUE(bob.peers().get().empty());
    EXPECT_TRUE(waitFor([&] { return server->getPeerIds().size() == 1; }));
}

TEST_F(SignalingTest, ClientIdsAreStableAndDistinct) {
    auto& alice = newClient();
    auto& bob = newClient();
    std::string aliceId = alice.getClientId();

    EXPECT_NE(aliceId, bob.getClientId());
    ASSERT_TRUE(alice.connect());
    alice.disconnect();
    ASSERT_TRUE(alice.connect());
    EXPECT_EQ(alice.getClientId(), aliceId);
    EXPECT_TRUE(waitFor([&] { return server->getPeerIds() == std::vector<std::string>{aliceId}; }));
}

// ============================================================================
// Directed messages
// ============================================================================

TEST_F(SignalingTest, MessageReachesOnlyItsTarget) {
    auto& alice = connectedClient();
    auto& bob = connectedClient();
    auto& carol = connectedClient();
    auto& bobInbox = inboxFor(bob);
    auto& carolInbox = inboxFor(carol);

    Json::Value offer;
    offer["type"] = "offer";
    offer["sdp"] = "v=0";
    alice.send(bob.getClientId(), offer);

    ASSERT_TRUE(waitFor([&] { return bobInbox.size() == 1; }));
    auto received = bobInbox.messages();
    EXPECT_EQ(received[0].first, alice.getClientId());
    EXPECT_EQ(received[0].second, offer);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(carolInbox.size(), 0u);
    EXPECT_EQ(bobInbox.size(), 1u);
}

TEST_F(SignalingTest, MessageToAbsentPeerIsDropped) {
    auto& alice = connectedClient();
    auto& bob = connectedClient();
    auto& bobInbox = inboxFor(bob);

    alice.send("nobody-home", numbered(1));
    alice.send(bob.getClientId(), numbered(2));

    ASSERT_TRUE(waitFor([&] { return bobInbox.size() == 1; }));
    EXPECT_EQ(bobInbox.messages()[0].second["n"].asInt(), 2);
    EXPECT_TRUE(alice.isConnected());
}

TEST_F(SignalingTest, OutboxFlushesInOrderBeforeNewMessages) {
    auto& bob = connectedClient();
    auto& bobInbox = inboxFor(bob);

    auto& alice = newClient();
    alice.send(bob.getClientId(), numbered(1));
    alice.send(bob.getClientId(), numbered(2));
    EXPECT_EQ(alice.outboxSize(), 2u);

    ASSERT_TRUE(alice.connect());
    EXPECT_EQ(alice.outboxSize(), 0u);
    alice.send(bob.getClientId(), numbered(3));

    ASSERT_TRUE(waitFor([&] { return bobInbox.size() == 3; }));
    auto received = bobInbox.messages();
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(received[i].first, alice.getClientId());
        EXPECT_EQ(received[i].second["n"].asInt(), i + 1);
    }
}

TEST_F(SignalingTest, ReplacedHandlerReceivesLaterMessages) {
    auto& alice = connectedClient();
    auto& bob = connectedClient();
    auto& first = inboxFor(bob);

    alice.send(bob.getClientId(), numbered(1));
    ASSERT_TRUE(waitFor([&] { return first.size() == 1; }));

    auto& second = inboxFor(bob);
    alice.send(bob.getClientId(), numbered(2));
    ASSERT_TRUE(waitFor([&] { return second.size() == 1; }));
    EXPECT_EQ(first.size(), 1u);
}

// ============================================================================
// Connection lifecycle
// ============================================================================

TEST_F(SignalingTest, UnreachableRelayFailsWithoutRetry) {
    auto options = clientOptions();
    options.url = "tcp://127.0.0.1:1";
    SignalingClient client(options);

    auto result = client.connect();
    EXPECT_TRUE(result.isError());
    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(client.connectionState().get(), ConnectionState::Disconnected);

    // Messages sent meanwhile are kept for later
    client.send("someone", numbered(1));
    EXPECT_EQ(client.outboxSize(), 1u);
}

TEST_F(SignalingTest, InvalidUrlFails) {
    auto options = clientOptions();
    options.url = "ws://127.0.0.1:9000";
    SignalingClient client(options);

    auto result = client.connect();
    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, tsr::ErrorCode::InvalidArgument);
}

TEST_F(SignalingTest, DiscoveryPreferredOverUrl) {
    auto options = clientOptions();
    auto relays = StaticDiscoveryProvider::parseList({"127.0.0.1:" + std::to_string(port)});
    ASSERT_TRUE(relays);
    options.url = "tcp://127.0.0.1:1";
    options.preferDht = true;
    options.discovery = std::make_shared<StaticDiscoveryProvider>(*relays);

    SignalingClient client(options);
    ASSERT_TRUE(client.connect());
    EXPECT_EQ(client.backend().get(), Backend::Discovery);
    client.disconnect();
}

TEST_F(SignalingTest, UnreachableDiscoveredRelayFallsBackToUrl) {
    auto options = clientOptions();
    auto relays = StaticDiscoveryProvider::parseList({"127.0.0.1:1"});
    ASSERT_TRUE(relays);
    options.preferDht = true;
    options.discovery = std::make_shared<StaticDiscoveryProvider>(*relays);

    SignalingClient client(options);
    auto result = client.connect();
    ASSERT_TRUE(result) << (result ? "" : result.error().message);
    EXPECT_TRUE(client.isConnected());
    EXPECT_EQ(client.backend().get(), Backend::Relay);
    EXPECT_TRUE(waitFor([&] { return server->getPeerIds() == std::vector<std::string>{client.getClientId()}; }));
    client.disconnect();
}

TEST_F(SignalingTest, DisconnectResetsObservables) {
    auto& alice = connectedClient();
    connectedClient();
    ASSERT_TRUE(waitFor([&] { return alice.peers().get().size() == 2; }));

    alice.disconnect();
    EXPECT_FALSE(alice.isConnected());
    EXPECT_TRUE(alice.peers().get().empty());
    EXPECT_EQ(alice.connectionState().get(), ConnectionState::Disconnected);
    EXPECT_EQ(alice.backend().get(), Backend::None);

    // Disconnecting twice is harmless
    alice.disconnect();
}

TEST_F(SignalingTest, ReconnectsAfterRelayRestart) {
    auto& alice = connectedClient();
    std::string aliceId = alice.getClientId();

    server->stop();
    ASSERT_TRUE(waitFor([&] { return !alice.isConnected(); }));
    EXPECT_TRUE(waitFor([&] { return alice.connectionState().get() == ConnectionState::Reconnecting; }));
    EXPECT_TRUE(alice.peers().get().empty());

    // Queued while the relay is down
    alice.send(aliceId, numbered(7));
    auto& inbox = inboxFor(alice);

    server = startServer(port);
    ASSERT_NE(server, nullptr);

    ASSERT_TRUE(waitFor([&] { return alice.isConnected(); }, std::chrono::milliseconds(10000)));
    EXPECT_EQ(alice.getClientId(), aliceId);
    EXPECT_TRUE(waitFor([&] { return hasPeers(alice, {aliceId}); }));
    ASSERT_TRUE(waitFor([&] { return inbox.size() == 1; }));
    EXPECT_EQ(inbox.messages()[0].second["n"].asInt(), 7);
}

TEST_F(SignalingTest, NoReconnectWhenDisabled) {
    auto options = clientOptions();
    options.autoReconnect = false;
    SignalingClient client(options);
    ASSERT_TRUE(client.connect());

    server->stop();
    ASSERT_TRUE(waitFor([&] { return !client.isConnected(); }));
    EXPECT_TRUE(waitFor([&] { return client.connectionState().get() == ConnectionState::Disconnected; }));

    server = startServer(port);
    ASSERT_NE(server, nullptr);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_FALSE(client.isConnected());
}

TEST_F(SignalingTest, DisconnectCancelsPendingReconnect) {
    auto& alice = connectedClient();

    server->stop();
    ASSERT_TRUE(waitFor([&] { return alice.connectionState().get() == ConnectionState::Reconnecting; }));

    alice.disconnect();
    EXPECT_EQ(alice.connectionState().get(), ConnectionState::Disconnected);

    server = startServer(port);
    ASSERT_NE(server, nullptr);
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    EXPECT_EQ(server->connectionCount(), 0u);
    EXPECT_FALSE(alice.isConnected());
    EXPECT_EQ(alice.connectionState().get(), ConnectionState::Disconnected);
}
