#pragma once

#include "protocol/Error.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lanchat::protocol {

// Version a client announces in its join. The server lists what it accepts
// in the error it sends back on a mismatch.
static constexpr std::string_view kProtocolVersion = "1.1";

bool is_supported_version(std::string_view version) noexcept;
std::string supported_versions();

struct ChatMessage {
    std::uint64_t seq = 0;
    std::string sender;
    std::string text;
    std::int64_t timestamp = 0;  // unix seconds, set by the server

    bool operator==(const ChatMessage& o) const {
        return seq == o.seq && sender == o.sender && text == o.text && timestamp == o.timestamp;
    }
    bool operator!=(const ChatMessage& o) const { return !(*this == o); }
};

enum class PacketType {
    // client -> server
    Join,
    Say,
    Who,
    Leave,
    // server -> client
    Welcome,
    Message,
    Notice,
    Roster,
    Error,
};

const char* to_string(PacketType type) noexcept;

// One packet on the chat stream. Which fields are meaningful depends on `type`:
//   Join     name, version
//   Say      text
//   Who      text (name filter, may be empty)
//   Welcome  name, seq, users, more
//   Message  message
//   Notice   seq, text
//   Roster   users, more
//   Error    error, text
// `more` counts names left off a list that would not fit in one frame.
struct Packet {
    PacketType type = PacketType::Leave;
    std::string name;
    std::string text;
    std::uint64_t seq = 0;
    ChatMessage message;
    std::vector<std::string> users;
    std::size_t more = 0;
    std::string version;
    errc error = errc::malformed_message;

    static Packet join(std::string name, std::string version = std::string(kProtocolVersion));
    static Packet say(std::string text);
    static Packet who(std::string filter = {});
    static Packet leave();
    static Packet welcome(std::string name, std::uint64_t seq, std::vector<std::string> users);
    static Packet chat(ChatMessage message);
    static Packet notice(std::uint64_t seq, std::string text);
    static Packet roster(std::vector<std::string> users);
    static Packet failure(errc code, std::string text);

    bool operator==(const Packet& o) const;
    bool operator!=(const Packet& o) const { return !(*this == o); }
};

} // namespace lanchat::protocol
