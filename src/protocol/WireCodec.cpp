#include "protocol/WireCodec.h"

#include <boost/json.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>

namespace lanchat::protocol {

namespace json = boost::json;

namespace {

json::array to_array(const std::vector<std::string>& users) {
    json::array arr;
    arr.reserve(users.size());
    for (const auto& u : users) arr.emplace_back(u);
    return arr;
}

json::object to_object(const Packet& p) {
    json::object obj{{"type", to_string(p.type)}};
    switch (p.type) {
        case PacketType::Join:
            obj["name"] = p.name;
            obj["version"] = p.version;
            break;
        case PacketType::Say:
            obj["text"] = p.text;
            break;
        case PacketType::Who:
            if (!p.text.empty()) obj["filter"] = p.text;
            break;
        case PacketType::Leave:
            break;
        case PacketType::Welcome:
            obj["name"] = p.name;
            obj["seq"] = p.seq;
            obj["users"] = to_array(p.users);
            if (p.more != 0) obj["more"] = static_cast<std::uint64_t>(p.more);
            break;
        case PacketType::Message:
            obj["seq"] = p.message.seq;
            obj["from"] = p.message.sender;
            obj["text"] = p.message.text;
            obj["ts"] = p.message.timestamp;
            break;
        case PacketType::Notice:
            obj["seq"] = p.seq;
            obj["text"] = p.text;
            break;
        case PacketType::Roster:
            obj["users"] = to_array(p.users);
            if (p.more != 0) obj["more"] = static_cast<std::uint64_t>(p.more);
            break;
        case PacketType::Error:
            obj["code"] = std::string(wire_code(p.error));
            obj["text"] = p.text;
            break;
    }
    return obj;
}

// ---- field readers: empty optional means missing or mistyped ----

std::optional<std::string> get_string(const json::object& obj, std::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (!v) return std::nullopt;
    const json::string* s = v->if_string();
    if (!s) return std::nullopt;
    return std::string(s->data(), s->size());
}

std::optional<std::string> get_text(const json::object& obj, std::string_view key) {
    auto s = get_string(obj, key);
    if (s && s->size() > kMaxTextLen) return std::nullopt;
    return s;
}

std::optional<std::uint64_t> get_u64(const json::object& obj, std::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (!v) return std::nullopt;
    if (const auto* u = v->if_uint64()) return *u;
    if (const auto* i = v->if_int64()) {
        if (*i < 0) return std::nullopt;
        return static_cast<std::uint64_t>(*i);
    }
    return std::nullopt;
}

// Absent means zero; present but mistyped is an error.
std::optional<std::uint64_t> get_optional_u64(const json::object& obj, std::string_view key) {
    if (!obj.contains(key)) return 0;
    return get_u64(obj, key);
}

std::optional<std::int64_t> get_i64(const json::object& obj, std::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (!v) return std::nullopt;
    if (const auto* i = v->if_int64()) return *i;
    if (const auto* u = v->if_uint64()) {
        if (*u > static_cast<std::uint64_t>(INT64_MAX)) return std::nullopt;
        return static_cast<std::int64_t>(*u);
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> get_users(const json::object& obj) {
    const json::value* v = obj.if_contains("users");
    if (!v) return std::nullopt;
    const json::array* arr = v->if_array();
    if (!arr) return std::nullopt;

    std::vector<std::string> users;
    users.reserve(arr->size());
    for (const auto& item : *arr) {
        const json::string* s = item.if_string();
        if (!s) return std::nullopt;
        users.emplace_back(s->data(), s->size());
    }
    return users;
}

std::optional<PacketType> type_from(std::string_view name) {
    for (auto t : {PacketType::Join, PacketType::Say, PacketType::Who, PacketType::Leave,
                   PacketType::Welcome, PacketType::Message, PacketType::Notice,
                   PacketType::Roster, PacketType::Error}) {
        if (name == to_string(t)) return t;
    }
    return std::nullopt;
}

bool from_object(const json::object& obj, Packet& out) {
    auto type_name = get_string(obj, "type");
    if (!type_name) return false;
    auto type = type_from(*type_name);
    if (!type) return false;

    Packet p;
    p.type = *type;
    switch (p.type) {
        case PacketType::Join: {
            auto name = get_string(obj, "name");
            auto version = get_string(obj, "version");
            if (!name || !version) return false;
            p.name = std::move(*name);
            p.version = std::move(*version);
            break;
        }
        case PacketType::Say: {
            auto text = get_text(obj, "text");
            if (!text) return false;
            p.text = std::move(*text);
            break;
        }
        case PacketType::Who: {
            if (obj.contains("filter")) {
                auto filter = get_text(obj, "filter");
                if (!filter) return false;
                p.text = std::move(*filter);
            }
            break;
        }
        case PacketType::Leave:
            break;
        case PacketType::Welcome: {
            auto name = get_string(obj, "name");
            auto seq = get_u64(obj, "seq");
            auto users = get_users(obj);
            auto more = get_optional_u64(obj, "more");
            if (!name || !seq || !users || !more) return false;
            p.name = std::move(*name);
            p.seq = *seq;
            p.users = std::move(*users);
            p.more = static_cast<std::size_t>(*more);
            break;
        }
        case PacketType::Message: {
            auto seq = get_u64(obj, "seq");
            auto from = get_string(obj, "from");
            auto text = get_text(obj, "text");
            auto ts = get_i64(obj, "ts");
            if (!seq || !from || !text || !ts) return false;
            p.message.seq = *seq;
            p.message.sender = std::move(*from);
            p.message.text = std::move(*text);
            p.message.timestamp = *ts;
            break;
        }
        case PacketType::Notice: {
            auto seq = get_u64(obj, "seq");
            auto text = get_text(obj, "text");
            if (!seq || !text) return false;
            p.seq = *seq;
            p.text = std::move(*text);
            break;
        }
        case PacketType::Roster: {
            auto users = get_users(obj);
            auto more = get_optional_u64(obj, "more");
            if (!users || !more) return false;
            p.users = std::move(*users);
            p.more = static_cast<std::size_t>(*more);
            break;
        }
        case PacketType::Error: {
            auto code = get_string(obj, "code");
            auto text = get_text(obj, "text");
            if (!code || !text) return false;
            auto e = errc_from_wire(*code);
            if (!e) return false;
            p.error = *e;
            p.text = std::move(*text);
            break;
        }
    }
    out = std::move(p);
    return true;
}

bool carries_user_list(PacketType type) {
    return type == PacketType::Welcome || type == PacketType::Roster;
}

// Drops names from the tail of the list until the body fits, counting them in `more`.
std::string fit_user_list(const Packet& packet, std::string body) {
    Packet trimmed = packet;
    std::size_t keep = packet.users.size();
    while (body.size() > kMaxBodySize && keep > 0) {
        keep = std::min(keep - 1, keep * kMaxBodySize / body.size());
        trimmed.users.assign(packet.users.begin(), packet.users.begin() + keep);
        trimmed.more = packet.more + (packet.users.size() - keep);
        body = json::serialize(to_object(trimmed));
    }
    return body;
}

} // namespace

std::string encode(const Packet& packet) {
    std::string body = json::serialize(to_object(packet));
    if (body.size() > kMaxBodySize && carries_user_list(packet.type)) {
        body = fit_user_list(packet, std::move(body));
    }
    if (body.size() > kMaxBodySize) {
        throw std::length_error("packet body exceeds frame limit");
    }

    const auto n = static_cast<std::uint32_t>(body.size());
    std::string frame;
    frame.reserve(kHeaderSize + body.size());
    frame.push_back(static_cast<char>((n >> 24) & 0xFF));
    frame.push_back(static_cast<char>((n >> 16) & 0xFF));
    frame.push_back(static_cast<char>((n >> 8) & 0xFF));
    frame.push_back(static_cast<char>(n & 0xFF));
    frame += body;
    return frame;
}

DecodeStatus decode(std::string_view bytes, Packet& out, std::size_t& consumed) {
    consumed = 0;
    if (bytes.size() < kHeaderSize) return DecodeStatus::Incomplete;

    const auto b = [&](std::size_t i) {
        return static_cast<std::uint32_t>(static_cast<unsigned char>(bytes[i]));
    };
    const std::uint32_t n = (b(0) << 24) | (b(1) << 16) | (b(2) << 8) | b(3);

    // A bad length is fatal even before the body shows up.
    if (n == 0 || n > kMaxBodySize) return DecodeStatus::Malformed;
    if (bytes.size() - kHeaderSize < n) return DecodeStatus::Incomplete;

    json::error_code ec;
    json::value v = json::parse(bytes.substr(kHeaderSize, n), ec);
    if (ec) return DecodeStatus::Malformed;

    const json::object* obj = v.if_object();
    if (!obj || !from_object(*obj, out)) return DecodeStatus::Malformed;

    consumed = kHeaderSize + n;
    return DecodeStatus::Complete;
}

} // namespace lanchat::protocol
