#include "chat/SessionRegistry.h"
#include "protocol/Error.h"

#include "TestSupport.h"

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace lanchat;
using namespace lanchat::chat;

namespace {

std::shared_ptr<OutboundChannel> channel() { return std::make_shared<test::RecordingChannel>(); }

ClientIdentity identity(ClientId id, const std::string& name) {
    return ClientIdentity{id, name, "127.0.0.1:" + std::to_string(40000 + id)};
}

} // namespace

TEST(SessionRegistry, JoinAndSnapshotInJoinOrder) {
    SessionRegistry registry;
    boost::system::error_code ec;
    for (ClientId id : {1, 2, 3}) {
        registry.join(identity(id, "user" + std::to_string(id)), channel(), ec);
        ASSERT_FALSE(ec);
    }
    registry.leave(2);
    registry.join(identity(4, "user2"), channel(), ec);
    ASSERT_FALSE(ec);

    EXPECT_EQ(registry.names(), (std::vector<std::string>{"user1", "user3", "user2"}));
    const auto snap = registry.snapshot();
    ASSERT_EQ(snap.size(), 3u);
    EXPECT_EQ(snap[2].id(), 4u);
    EXPECT_EQ(snap[0].endpoint(), "127.0.0.1:40001");
}

TEST(SessionRegistry, DuplicateNameIsRejected) {
    SessionRegistry registry;
    boost::system::error_code ec;
    ASSERT_TRUE(registry.join(identity(1, "alice"), channel(), ec));
    EXPECT_FALSE(ec);

    EXPECT_EQ(registry.join(identity(2, "alice"), channel(), ec), nullptr);
    EXPECT_EQ(ec, make_error_code(errc::name_conflict));
    EXPECT_EQ(registry.names(), std::vector<std::string>{"alice"});
    EXPECT_EQ(registry.size(), 1u);
}

TEST(SessionRegistry, NamesAreCaseSensitive) {
    SessionRegistry registry;
    boost::system::error_code ec;
    registry.join(identity(1, "alice"), channel(), ec);
    registry.join(identity(2, "Alice"), channel(), ec);
    EXPECT_FALSE(ec);
    EXPECT_EQ(registry.size(), 2u);
}

TEST(SessionRegistry, LeaveIsIdempotent) {
    SessionRegistry registry;
    boost::system::error_code ec;
    registry.join(identity(1, "alice"), channel(), ec);

    EXPECT_TRUE(registry.leave(1));
    EXPECT_FALSE(registry.leave(1));
    EXPECT_FALSE(registry.leave(99));
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(registry.contains("alice"));
}

TEST(SessionRegistry, StaleLeaveKeepsTheNewHolder) {
    SessionRegistry registry;
    boost::system::error_code ec;
    registry.join(identity(1, "alice"), channel(), ec);
    registry.leave(1);
    registry.join(identity(2, "alice"), channel(), ec);
    ASSERT_FALSE(ec);

    EXPECT_FALSE(registry.leave(1));
    EXPECT_TRUE(registry.contains("alice"));
    EXPECT_EQ(registry.snapshot().front().id(), 2u);
}

TEST(SessionRegistry, ConcurrentDistinctJoinsAllLand) {
    SessionRegistry registry;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const ClientId id = static_cast<ClientId>(t * kPerThread + i + 1);
                boost::system::error_code ec;
                registry.join(identity(id, "u" + std::to_string(id)), channel(), ec);
                EXPECT_FALSE(ec);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(registry.size(), static_cast<std::size_t>(kThreads * kPerThread));
    const auto names = registry.names();
    EXPECT_EQ(std::set<std::string>(names.begin(), names.end()).size(), names.size());
}

TEST(SessionRegistry, ConcurrentJoinsOfOneNameHaveOneWinner) {
    SessionRegistry registry;
    constexpr int kThreads = 16;
    std::atomic<int> winners{0};
    std::atomic<int> conflicts{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            boost::system::error_code ec;
            registry.join(identity(static_cast<ClientId>(t + 1), "alice"), channel(), ec);
            if (ec == errc::name_conflict) {
                ++conflicts;
            } else if (!ec) {
                ++winners;
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(conflicts.load(), kThreads - 1);
    EXPECT_EQ(registry.names(), std::vector<std::string>{"alice"});
}

TEST(SessionRegistry, ChurnNeverShowsDuplicates) {
    SessionRegistry registry;
    std::atomic<bool> done{false};
    std::atomic<bool> duplicate_seen{false};

    std::thread reader([&] {
        while (!done) {
            const auto names = registry.names();
            if (std::set<std::string>(names.begin(), names.end()).size() != names.size()) {
                duplicate_seen = true;
            }
        }
    });

    std::vector<std::thread> writers;
    std::atomic<ClientId> next_id{1};
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                const ClientId id = next_id++;
                boost::system::error_code ec;
                registry.join(identity(id, "n" + std::to_string(i % 5)), channel(), ec);
                if (!ec) registry.leave(id);
            }
        });
    }
    for (auto& th : writers) th.join();
    done = true;
    reader.join();

    EXPECT_FALSE(duplicate_seen.load());
    EXPECT_EQ(registry.size(), 0u);
}

TEST(SessionRegistry, SearchMatchesSubstringsInJoinOrder) {
    SessionRegistry registry;
    boost::system::error_code ec;
    ClientId id = 1;
    for (const char* name : {"alice", "Bob", "malory", "albert"}) {
        registry.join(identity(id++, name), channel(), ec);
        ASSERT_FALSE(ec);
    }

    EXPECT_EQ(registry.search("al"), (std::vector<std::string>{"alice", "malory", "albert"}));
    EXPECT_EQ(registry.search("bob"), std::vector<std::string>{});
    EXPECT_EQ(registry.search("Bob"), std::vector<std::string>{"Bob"});
    EXPECT_EQ(registry.search(""), registry.names());
}
