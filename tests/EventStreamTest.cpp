#include "chat/EventStream.h"
#include "protocol/Error.h"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace lanchat;
using namespace lanchat::chat;
using namespace std::chrono_literals;

TEST(EventStream, DeliversInPushOrder) {
    EventStream events;
    events.push(ClientEvent::joined("alice", {"alice"}));
    events.push(ClientEvent::notice("bob joined"));
    events.push(ClientEvent::chat(protocol::ChatMessage{3, "bob", "hey", 100}));

    ClientEvent e;
    ASSERT_TRUE(events.next(e));
    EXPECT_EQ(e.kind, ClientEvent::Kind::Joined);
    EXPECT_EQ(e.text, "alice");
    ASSERT_TRUE(events.next(e));
    EXPECT_EQ(e.kind, ClientEvent::Kind::Notice);
    ASSERT_TRUE(events.next(e));
    EXPECT_EQ(e.kind, ClientEvent::Kind::Message);
    EXPECT_EQ(e.message.text, "hey");
}

TEST(EventStream, CloseLetsPendingEventsDrain) {
    EventStream events;
    events.push(ClientEvent::failure(make_error_code(errc::name_conflict), "taken"));
    events.push(ClientEvent::closed());
    events.close();
    events.push(ClientEvent::notice("too late"));

    ClientEvent e;
    ASSERT_TRUE(events.next(e));
    EXPECT_EQ(e.kind, ClientEvent::Kind::Error);
    EXPECT_EQ(e.error, make_error_code(errc::name_conflict));
    ASSERT_TRUE(events.next(e));
    EXPECT_EQ(e.kind, ClientEvent::Kind::Closed);
    EXPECT_FALSE(events.next(e));
    EXPECT_TRUE(events.closed());
}

TEST(EventStream, NextForTimesOut) {
    EventStream events;
    ClientEvent e;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(events.next_for(e, 50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
}

TEST(EventStream, WakesABlockedReader) {
    EventStream events;
    std::thread producer([&] {
        std::this_thread::sleep_for(20ms);
        events.push(ClientEvent::roster({"alice", "bob"}));
        events.close();
    });

    ClientEvent e;
    ASSERT_TRUE(events.next(e));
    EXPECT_EQ(e.kind, ClientEvent::Kind::Roster);
    EXPECT_EQ(e.users.size(), 2u);
    EXPECT_FALSE(events.next(e));
    producer.join();
}

TEST(EventStream, KindNames) {
    EXPECT_STREQ(to_string(ClientEvent::Kind::Message), "message");
    EXPECT_STREQ(to_string(ClientEvent::Kind::Closed), "closed");
}
