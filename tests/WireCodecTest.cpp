#include "protocol/WireCodec.h"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace lanchat;
using namespace lanchat::protocol;

namespace {

std::string frame_of(const std::string& body) {
    const auto n = static_cast<std::uint32_t>(body.size());
    std::string out;
    out.push_back(static_cast<char>((n >> 24) & 0xFF));
    out.push_back(static_cast<char>((n >> 16) & 0xFF));
    out.push_back(static_cast<char>((n >> 8) & 0xFF));
    out.push_back(static_cast<char>(n & 0xFF));
    return out + body;
}

DecodeStatus decode_body(const std::string& body) {
    Packet p;
    std::size_t consumed = 0;
    return decode(frame_of(body), p, consumed);
}

Packet round_trip(const Packet& in) {
    const std::string bytes = encode(in);
    Packet out;
    std::size_t consumed = 0;
    EXPECT_EQ(decode(bytes, out, consumed), DecodeStatus::Complete);
    EXPECT_EQ(consumed, bytes.size());
    return out;
}

} // namespace

TEST(WireCodec, HeaderIsBigEndianBodyLength) {
    const std::string bytes = encode(Packet::who());
    ASSERT_GT(bytes.size(), kHeaderSize);
    const std::size_t n = (static_cast<unsigned char>(bytes[0]) << 24) |
                          (static_cast<unsigned char>(bytes[1]) << 16) |
                          (static_cast<unsigned char>(bytes[2]) << 8) |
                          static_cast<unsigned char>(bytes[3]);
    EXPECT_EQ(n, bytes.size() - kHeaderSize);
}

TEST(WireCodec, EveryPacketTypeSurvives) {
    ChatMessage m{7, "alice", "hello", 1700000000};
    const std::vector<Packet> packets = {
        Packet::join("alice"),
        Packet::say("hi there"),
        Packet::who(),
        Packet::leave(),
        Packet::welcome("alice", 3, {"bob", "alice"}),
        Packet::chat(m),
        Packet::notice(4, "bob joined"),
        Packet::roster({"alice", "bob", "carol"}),
        Packet::failure(errc::name_conflict, "name \"alice\" is already in use"),
        Packet::failure(errc::malformed_message, "bad frame"),
    };
    for (const auto& p : packets) {
        EXPECT_EQ(round_trip(p), p) << to_string(p.type);
    }
}

TEST(WireCodec, TextIsCarriedByteForByte) {
    const std::vector<std::string> texts = {
        "line one\nline two",
        std::string("nul\0inside", 10),
        std::string("\x00\x00\x00\x05", 4) + "looks like a header",
        "quote \" and backslash \\",
        "caf\xC3\xA9 \xE2\x9C\x93 \xF0\x9F\x98\x80",
        std::string(kMaxTextLen, 'x'),
    };
    for (const auto& text : texts) {
        ChatMessage m{1, "bob", text, 42};
        EXPECT_EQ(round_trip(Packet::chat(m)).message.text, text);
        EXPECT_EQ(round_trip(Packet::say(text)).text, text);
    }
}

TEST(WireCodec, EmptyRosterAndEmptyText) {
    EXPECT_TRUE(round_trip(Packet::roster({})).users.empty());
    EXPECT_EQ(round_trip(Packet::say("")).text, "");
}

TEST(WireCodec, EveryProperPrefixIsIncomplete) {
    const std::string bytes = encode(Packet::chat(ChatMessage{9, "carol", "partial frames", 5}));
    for (std::size_t len = 0; len < bytes.size(); ++len) {
        Packet p;
        std::size_t consumed = 123;
        EXPECT_EQ(decode(std::string_view(bytes.data(), len), p, consumed), DecodeStatus::Incomplete)
            << "prefix length " << len;
        EXPECT_EQ(consumed, 0u);
    }
}

TEST(WireCodec, BackToBackFramesDecodeInOrder) {
    const Packet a = Packet::notice(1, "alice joined");
    const Packet b = Packet::chat(ChatMessage{2, "alice", "first", 10});
    const Packet c = Packet::chat(ChatMessage{3, "alice", "second", 11});
    std::string stream = encode(a) + encode(b) + encode(c);

    std::vector<Packet> got;
    std::string_view view(stream);
    for (;;) {
        Packet p;
        std::size_t consumed = 0;
        const auto status = decode(view, p, consumed);
        if (status != DecodeStatus::Complete) {
            EXPECT_EQ(status, DecodeStatus::Incomplete);
            break;
        }
        got.push_back(p);
        view.remove_prefix(consumed);
    }
    ASSERT_EQ(got.size(), 3u);
    EXPECT_EQ(got[0], a);
    EXPECT_EQ(got[1], b);
    EXPECT_EQ(got[2], c);
    EXPECT_TRUE(view.empty());
}

TEST(WireCodec, BadLengthIsMalformedBeforeTheBodyArrives) {
    Packet p;
    std::size_t consumed = 0;
    EXPECT_EQ(decode(std::string("\x00\x00\x00\x00", 4), p, consumed), DecodeStatus::Malformed);

    const std::uint32_t big = kMaxBodySize + 1;
    std::string header;
    header.push_back(static_cast<char>((big >> 24) & 0xFF));
    header.push_back(static_cast<char>((big >> 16) & 0xFF));
    header.push_back(static_cast<char>((big >> 8) & 0xFF));
    header.push_back(static_cast<char>(big & 0xFF));
    EXPECT_EQ(decode(header, p, consumed), DecodeStatus::Malformed);
    EXPECT_EQ(decode(std::string("\xFF\xFF\xFF\xFF", 4), p, consumed), DecodeStatus::Malformed);
}

TEST(WireCodec, BadBodiesAreMalformed) {
    EXPECT_EQ(decode_body("not json"), DecodeStatus::Malformed);
    EXPECT_EQ(decode_body("[1,2,3]"), DecodeStatus::Malformed);
    EXPECT_EQ(decode_body(R"({"name":"alice"})"), DecodeStatus::Malformed);
    EXPECT_EQ(decode_body(R"({"type":"shout","text":"x"})"), DecodeStatus::Malformed);
    EXPECT_EQ(decode_body(R"({"type":"join"})"), DecodeStatus::Malformed);
    EXPECT_EQ(decode_body(R"({"type":"join","name":5})"), DecodeStatus::Malformed);
    EXPECT_EQ(decode_body(R"({"type":"notice","seq":-1,"text":"x"})"), DecodeStatus::Malformed);
    EXPECT_EQ(decode_body(R"({"type":"roster","users":["a",2]})"), DecodeStatus::Malformed);
    EXPECT_EQ(decode_body(R"({"type":"error","code":"bogus","text":"x"})"), DecodeStatus::Malformed);
    EXPECT_EQ(decode_body(R"({"type":"msg","seq":1,"from":"a","text":"x"})"), DecodeStatus::Malformed);
}

TEST(WireCodec, OverlongTextIsMalformed) {
    const std::string body = R"({"type":"say","text":")" + std::string(kMaxTextLen + 1, 'y') + R"("})";
    EXPECT_EQ(decode_body(body), DecodeStatus::Malformed);
}

TEST(WireCodec, UnknownFieldsAreIgnored) {
    EXPECT_EQ(decode_body(R"({"type":"who","extra":true})"), DecodeStatus::Complete);
}

TEST(WireCodec, EncodeRefusesOversizedBodies) {
    EXPECT_THROW(encode(Packet::notice(1, std::string(kMaxBodySize, 'n'))), std::length_error);
}

TEST(WireCodec, JoinCarriesTheProtocolVersion) {
    EXPECT_EQ(Packet::join("alice").version, kProtocolVersion);
    EXPECT_EQ(round_trip(Packet::join("alice", "9.9")).version, "9.9");
    EXPECT_EQ(decode_body(R"({"type":"join","name":"alice","version":"1.1"})"), DecodeStatus::Complete);
    EXPECT_EQ(decode_body(R"({"type":"join","name":"alice"})"), DecodeStatus::Malformed);
    EXPECT_EQ(decode_body(R"({"type":"join","name":"alice","version":11})"), DecodeStatus::Malformed);
}

TEST(WireCodec, SupportedVersions) {
    EXPECT_TRUE(is_supported_version("1.1"));
    EXPECT_FALSE(is_supported_version("1.0"));
    EXPECT_FALSE(is_supported_version(""));
    EXPECT_EQ(supported_versions(), "1.1");
}

TEST(WireCodec, WhoFilterIsOptional) {
    EXPECT_EQ(round_trip(Packet::who("al")).text, "al");
    EXPECT_EQ(encode(Packet::who()).find("filter"), std::string::npos);
    EXPECT_EQ(decode_body(R"({"type":"who","filter":7})"), DecodeStatus::Malformed);
}

TEST(WireCodec, HugeRosterIsCutToFit) {
    // Backslashes double in JSON, so the body is twice the raw name bytes.
    const std::vector<std::string> users(4000, std::string(24, '\\'));
    const std::string bytes = encode(Packet::roster(users));
    EXPECT_LE(bytes.size(), kHeaderSize + kMaxBodySize);

    const Packet back = round_trip(Packet::roster(users));
    EXPECT_GT(back.more, 0u);
    EXPECT_EQ(back.users.size() + back.more, users.size());
    EXPECT_EQ(back.users.front(), users.front());
}

TEST(WireCodec, HugeWelcomeKeepsItsHeader) {
    const std::vector<std::string> users(5000, std::string(20, 'w'));
    const Packet back = round_trip(Packet::welcome("newcomer", 77, users));
    EXPECT_EQ(back.name, "newcomer");
    EXPECT_EQ(back.seq, 77u);
    EXPECT_EQ(back.users.size() + back.more, users.size());
    EXPECT_GT(back.more, 0u);
}

TEST(WireCodec, MoreIsOmittedWhenNothingWasCut) {
    EXPECT_EQ(encode(Packet::roster({"a", "b"})).find("more"), std::string::npos);
    EXPECT_EQ(decode_body(R"({"type":"roster","users":[],"more":"x"})"), DecodeStatus::Malformed);
}
