/**
 * @file test_endpoint.cpp
 * @brief Relay address parsing
 */

#include <gtest/gtest.h>
#include "Constants.h"
#include "Endpoint.h"

using Tessera::Signaling::Endpoint;

TEST(EndpointTest, ParsesUrlForms) {
    auto url = Endpoint::parse("tcp://relay.example.org:9100");
    ASSERT_TRUE(url);
    EXPECT_EQ(url->host, "relay.example.org");
    EXPECT_EQ(url->port, 9100);

    auto bare = Endpoint::parse("127.0.0.1:9001/");
    ASSERT_TRUE(bare);
    EXPECT_EQ(bare->host, "127.0.0.1");
    EXPECT_EQ(bare->port, 9001);

    auto hostOnly = Endpoint::parse("localhost");
    ASSERT_TRUE(hostOnly);
    EXPECT_EQ(hostOnly->port, tsr::config::DEFAULT_RELAY_PORT);
}

TEST(EndpointTest, FormatsBackToUrl) {
    auto parsed = Endpoint::parse("relay:9000");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->toString(), "relay:9000");
    EXPECT_EQ(parsed->toUrl(), "tcp://relay:9000");

    auto again = Endpoint::parse(parsed->toUrl());
    ASSERT_TRUE(again);
    EXPECT_EQ(*again, *parsed);
}

TEST(EndpointTest, RejectsBadInput) {
    EXPECT_FALSE(Endpoint::parse(""));
    EXPECT_FALSE(Endpoint::parse("tcp://"));
    EXPECT_FALSE(Endpoint::parse("ws://relay:9000"));
    EXPECT_FALSE(Endpoint::parse(":9000"));
    EXPECT_FALSE(Endpoint::parse("relay:"));
    EXPECT_FALSE(Endpoint::parse("relay:port"));
    EXPECT_FALSE(Endpoint::parse("relay:0"));
    EXPECT_FALSE(Endpoint::parse("relay:70000"));

    auto scheme = Endpoint::parse("udp://relay:9000");
    ASSERT_TRUE(scheme.isError());
    EXPECT_EQ(scheme.error().code, tsr::ErrorCode::InvalidArgument);
}
