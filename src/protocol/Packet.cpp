#include "protocol/Packet.h"

#include <utility>

namespace lanchat::protocol {

namespace {

constexpr std::string_view kSupportedVersions[] = {"1.1"};

} // namespace

bool is_supported_version(std::string_view version) noexcept {
    for (auto v : kSupportedVersions) {
        if (v == version) return true;
    }
    return false;
}

std::string supported_versions() {
    std::string out;
    for (auto v : kSupportedVersions) {
        if (!out.empty()) out += ", ";
        out += v;
    }
    return out;
}

const char* to_string(PacketType type) noexcept {
    switch (type) {
        case PacketType::Join:    return "join";
        case PacketType::Say:     return "say";
        case PacketType::Who:     return "who";
        case PacketType::Leave:   return "leave";
        case PacketType::Welcome: return "welcome";
        case PacketType::Message: return "msg";
        case PacketType::Notice:  return "notice";
        case PacketType::Roster:  return "roster";
        case PacketType::Error:   return "error";
    }
    return "unknown";
}

Packet Packet::join(std::string name, std::string version) {
    Packet p;
    p.type = PacketType::Join;
    p.name = std::move(name);
    p.version = std::move(version);
    return p;
}

Packet Packet::say(std::string text) {
    Packet p;
    p.type = PacketType::Say;
    p.text = std::move(text);
    return p;
}

Packet Packet::who(std::string filter) {
    Packet p;
    p.type = PacketType::Who;
    p.text = std::move(filter);
    return p;
}

Packet Packet::leave() {
    Packet p;
    p.type = PacketType::Leave;
    return p;
}

Packet Packet::welcome(std::string name, std::uint64_t seq, std::vector<std::string> users) {
    Packet p;
    p.type = PacketType::Welcome;
    p.name = std::move(name);
    p.seq = seq;
    p.users = std::move(users);
    return p;
}

Packet Packet::chat(ChatMessage message) {
    Packet p;
    p.type = PacketType::Message;
    p.message = std::move(message);
    return p;
}

Packet Packet::notice(std::uint64_t seq, std::string text) {
    Packet p;
    p.type = PacketType::Notice;
    p.seq = seq;
    p.text = std::move(text);
    return p;
}

Packet Packet::roster(std::vector<std::string> users) {
    Packet p;
    p.type = PacketType::Roster;
    p.users = std::move(users);
    return p;
}

Packet Packet::failure(errc code, std::string text) {
    Packet p;
    p.type = PacketType::Error;
    p.error = code;
    p.text = std::move(text);
    return p;
}

bool Packet::operator==(const Packet& o) const {
    if (type != o.type) return false;
    switch (type) {
        case PacketType::Join:    return name == o.name && version == o.version;
        case PacketType::Say:
        case PacketType::Who:     return text == o.text;
        case PacketType::Leave:   return true;
        case PacketType::Welcome:
            return name == o.name && seq == o.seq && users == o.users && more == o.more;
        case PacketType::Message: return message == o.message;
        case PacketType::Notice:  return seq == o.seq && text == o.text;
        case PacketType::Roster:  return users == o.users && more == o.more;
        case PacketType::Error:   return error == o.error && text == o.text;
    }
    return false;
}

} // namespace lanchat::protocol
