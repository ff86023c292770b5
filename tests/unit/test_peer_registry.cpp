/**
 * @file test_peer_registry.cpp
 * @brief Relay-side registry of open sessions
 */

#include <gtest/gtest.h>
#include "PeerRegistry.h"
#include "RelaySession.h"

#include <memory>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

using namespace Tessera::Signaling;

class PeerRegistryTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (int fd : remoteEnds_) {
            ::close(fd);
        }
    }

    // The session owns one end of a socket pair; the test keeps the other
    std::shared_ptr<RelaySession> makeSession() {
        int fds[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
            ADD_FAILURE() << "socketpair failed";
            return nullptr;
        }
        remoteEnds_.push_back(fds[1]);
        return std::make_shared<RelaySession>(fds[0], "local");
    }

    PeerRegistry registry;
    std::vector<int> remoteEnds_;
};

TEST_F(PeerRegistryTest, IdsInRegistrationOrder) {
    registry.insert("zed", makeSession());
    registry.insert("alpha", makeSession());
    registry.insert("mid", makeSession());

    EXPECT_EQ(registry.ids(), (std::vector<std::string>{"zed", "alpha", "mid"}));
    EXPECT_EQ(registry.sessions().size(), 3u);
    EXPECT_EQ(registry.size(), 3u);
    EXPECT_TRUE(registry.contains("alpha"));
    EXPECT_FALSE(registry.contains("nobody"));
    EXPECT_EQ(registry.find("nobody"), nullptr);
}

TEST_F(PeerRegistryTest, InsertReturnsReplacedSession) {
    auto first = makeSession();
    auto second = makeSession();

    EXPECT_EQ(registry.insert("dup", first), nullptr);
    EXPECT_EQ(registry.insert("dup", second), first);
    EXPECT_EQ(registry.find("dup"), second);
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(PeerRegistryTest, ReplacedSessionMovesToEndOfOrder) {
    registry.insert("a", makeSession());
    registry.insert("b", makeSession());
    registry.insert("a", makeSession());

    EXPECT_EQ(registry.ids(), (std::vector<std::string>{"b", "a"}));
}

TEST_F(PeerRegistryTest, RemoveOnlyMatchingSession) {
    auto stale = makeSession();
    auto current = makeSession();
    registry.insert("dup", stale);
    registry.insert("dup", current);

    // The evicted session's cleanup must not unregister its replacement
    EXPECT_FALSE(registry.remove("dup", stale));
    EXPECT_TRUE(registry.contains("dup"));

    EXPECT_TRUE(registry.remove("dup", current));
    EXPECT_FALSE(registry.contains("dup"));
    EXPECT_FALSE(registry.remove("dup", current));
    EXPECT_TRUE(registry.ids().empty());
}
