#include "cloudflare_turn.h"

#include <gtest/gtest.h>

namespace {

TEST(CloudflareTurnTest, ParsesGenerateIceServersResponse) {
    const char* response = R"({
        "iceServers": [{
            "urls": [
                "stun:stun.cloudflare.com:3478",
                "turn:turn.cloudflare.com:3478?transport=tcp",
                "turn:turn.cloudflare.com:3478?transport=udp",
                "turns:turn.cloudflare.com:5349?transport=tcp"
            ],
            "username": "abc123",
            "credential": "s3cret"
        }]
    })";

    auto before = std::chrono::system_clock::now();
    CloudflareTurn::Credentials creds;
    ASSERT_TRUE(CloudflareTurn::parseResponse(response, 3600, &creds));

    EXPECT_TRUE(creds.valid);
    EXPECT_EQ("abc123", creds.username);
    EXPECT_EQ("s3cret", creds.password);
    EXPECT_EQ("turn:turn.cloudflare.com:3478?transport=udp", creds.turn_uri);
    EXPECT_EQ("turns:turn.cloudflare.com:5349?transport=tcp", creds.turns_uri);
    EXPECT_GE(creds.expires_at, before + std::chrono::seconds(3600));
}

TEST(CloudflareTurnTest, MissingUrlsFallBackToDefaults) {
    CloudflareTurn::Credentials creds;
    ASSERT_TRUE(CloudflareTurn::parseResponse(
        R"({"iceServers":[{"username":"u","credential":"p"}]})", 60, &creds));
    EXPECT_EQ("turn:turn.cloudflare.com:3478", creds.turn_uri);
    EXPECT_EQ("turns:turn.cloudflare.com:5349", creds.turns_uri);
}

TEST(CloudflareTurnTest, RejectsBadResponses) {
    const char* bad[] = {
        "<html>rate limited</html>",
        R"({"result":{}})",
        R"({"iceServers":[]})",
        R"({"iceServers":[{"urls":["turn:x"],"credential":"p"}]})",
        R"({"iceServers":[{"urls":["turn:x"],"username":"u","credential":42}]})",
    };
    for (const char* text : bad) {
        CloudflareTurn::Credentials creds;
        EXPECT_FALSE(CloudflareTurn::parseResponse(text, 60, &creds)) << text;
        EXPECT_FALSE(creds.valid);
    }
}

TEST(CloudflareTurnTest, ConfigFromSettings) {
    CloudflareTurn::Config config;
    ASSERT_TRUE(CloudflareTurn::configFromSettings({
        {"CLOUDFLARE_ACCOUNT_ID", "acct"},
        {"CLOUDFLARE_TURN_KEY_ID", "key"},
        {"CLOUDFLARE_API_TOKEN", "token"},
        {"CLOUDFLARE_TURN_TTL", "7200"},
    }, &config));
    EXPECT_EQ("acct", config.account_id);
    EXPECT_EQ("key", config.turn_key_id);
    EXPECT_EQ("token", config.api_token);
    EXPECT_EQ(7200, config.ttl_seconds);
}

TEST(CloudflareTurnTest, BadTtlKeepsDefault) {
    CloudflareTurn::Config config;
    ASSERT_TRUE(CloudflareTurn::configFromSettings({
        {"CLOUDFLARE_TURN_KEY_ID", "key"},
        {"CLOUDFLARE_API_TOKEN", "token"},
        {"CLOUDFLARE_TURN_TTL", "-5"},
    }, &config));
    EXPECT_EQ(86400, config.ttl_seconds);

    ASSERT_TRUE(CloudflareTurn::configFromSettings({
        {"CLOUDFLARE_TURN_KEY_ID", "key"},
        {"CLOUDFLARE_API_TOKEN", "token"},
        {"CLOUDFLARE_TURN_TTL", "1d"},
    }, &config));
    EXPECT_EQ(86400, config.ttl_seconds);
}

TEST(CloudflareTurnTest, KeyAndTokenAreRequired) {
    CloudflareTurn::Config config;
    EXPECT_FALSE(CloudflareTurn::configFromSettings({{"CLOUDFLARE_TURN_KEY_ID", "key"}}, &config));
    EXPECT_FALSE(CloudflareTurn::configFromSettings({{"CLOUDFLARE_API_TOKEN", "token"}}, &config));
}

TEST(CloudflareTurnTest, UnconfiguredInstanceHasNoServer) {
    CloudflareTurn turn;
    EXPECT_FALSE(turn.isConfigured());

    IceServer server;
    server.uri = "unchanged";
    EXPECT_FALSE(turn.turnServer(&server));
    EXPECT_EQ("unchanged", server.uri);
}

}  // namespace
