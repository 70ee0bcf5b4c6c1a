#include "chat/ClientIdentity.h"

#include <gtest/gtest.h>

using lanchat::chat::ClientIdentity;

TEST(ClientIdentity, KeepsWhatItWasGiven) {
    const auto before = ClientIdentity::Clock::now();
    ClientIdentity id(7, "alice", "192.168.0.4:51000");
    EXPECT_EQ(id.id(), 7u);
    EXPECT_EQ(id.name(), "alice");
    EXPECT_EQ(id.endpoint(), "192.168.0.4:51000");
    EXPECT_GE(id.joined_at(), before);
}

TEST(ClientIdentity, NormalizeTrimsWhitespace) {
    EXPECT_EQ(ClientIdentity::normalize_name("  alice\t"), "alice");
    EXPECT_EQ(ClientIdentity::normalize_name("mary ann"), "mary ann");
    EXPECT_EQ(ClientIdentity::normalize_name("caf\xC3\xA9"), "caf\xC3\xA9");
}

TEST(ClientIdentity, NormalizeRejectsUnusableNames) {
    EXPECT_FALSE(ClientIdentity::normalize_name(""));
    EXPECT_FALSE(ClientIdentity::normalize_name("   "));
    EXPECT_FALSE(ClientIdentity::normalize_name("bell\a"));
    EXPECT_FALSE(ClientIdentity::normalize_name("two\nlines"));
    EXPECT_FALSE(ClientIdentity::normalize_name(std::string(ClientIdentity::kMaxNameLen + 1, 'n')));
    EXPECT_TRUE(ClientIdentity::normalize_name(std::string(ClientIdentity::kMaxNameLen, 'n')));
}
