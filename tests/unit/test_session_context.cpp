#include <gtest/gtest.h>
#include "nearfetch/network/session_context.hpp"
#include "nearfetch/transfer/transfer_types.hpp"

using namespace nearfetch::network;
using nearfetch::transfer::make_transfer_payload;

TEST(SessionContextTest, DefaultIsActiveAndIdle) {
    SessionContext session;

    EXPECT_TRUE(session.is_active());
    EXPECT_FALSE(session.is_listening());
    EXPECT_FALSE(session.is_advertising());
    EXPECT_FALSE(session.is_browsing());
    EXPECT_TRUE(session.connected_peers().empty());
}

TEST(SessionContextTest, UpdatesReturnNewValues) {
    SessionContext idle;
    auto busy = idle.with_listening(true)
                    .with_browsing(true)
                    .with_advertising(make_transfer_payload("a.txt"));

    EXPECT_FALSE(idle.is_listening());
    EXPECT_TRUE(busy.is_listening());
    EXPECT_TRUE(busy.is_browsing());
    ASSERT_TRUE(busy.advertised_payload().has_value());
    EXPECT_EQ(*busy.advertised_payload(), make_transfer_payload("a.txt"));

    EXPECT_FALSE(busy.with_advertising(std::nullopt).is_advertising());
}

TEST(SessionContextTest, PeerStatesTrackConnections) {
    auto session = SessionContext{}
        .with_peer_state("alpha", SessionState::CONNECTING)
        .with_peer_state("beta", SessionState::CONNECTED)
        .with_peer_state("gamma", SessionState::CONNECTED);

    EXPECT_FALSE(session.is_connected("alpha"));
    EXPECT_TRUE(session.is_connected("beta"));

    session = session.with_peer_state("beta", SessionState::NOT_CONNECTED);
    EXPECT_FALSE(session.is_connected("beta"));
    EXPECT_TRUE(session.is_connected("gamma"));

    EXPECT_TRUE(session.without_peers().connected_peers().empty());
}

TEST(SessionContextTest, TearDownKeepsOnlyListeningIntent) {
    auto busy = SessionContext{}
        .with_listening(true)
        .with_browsing(true)
        .with_advertising(make_transfer_payload("a.txt"))
        .with_peer_state("beta", SessionState::CONNECTED);

    auto suspended = busy.torn_down();
    EXPECT_FALSE(suspended.is_active());
    EXPECT_TRUE(suspended.is_listening());
    EXPECT_FALSE(suspended.is_browsing());
    EXPECT_FALSE(suspended.is_advertising());
    EXPECT_TRUE(suspended.connected_peers().empty());

    auto resumed = suspended.rebuilt();
    EXPECT_TRUE(resumed.is_active());
    EXPECT_TRUE(resumed.is_listening());
    EXPECT_FALSE(resumed.is_browsing());
}

TEST(SessionContextTest, StateNames) {
    EXPECT_STREQ(to_string(SessionState::CONNECTING), "Connecting");
    EXPECT_STREQ(to_string(SessionState::NOT_CONNECTED), "NotConnected");
}
