#include "chat/ClientIdentity.h"

#include <algorithm>
#include <utility>

namespace lanchat::chat {

ClientIdentity::ClientIdentity(ClientId id, std::string name, std::string endpoint)
    : id_(id),
      name_(std::move(name)),
      endpoint_(std::move(endpoint)),
      joined_at_(Clock::now()) {}

ClientId ClientIdentity::id() const noexcept { return id_; }
const std::string& ClientIdentity::name() const noexcept { return name_; }
const std::string& ClientIdentity::endpoint() const noexcept { return endpoint_; }
ClientIdentity::Clock::time_point ClientIdentity::joined_at() const noexcept { return joined_at_; }

bool ClientIdentity::is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string ClientIdentity::trim_copy(std::string s) {
    std::size_t start = 0;
    while (start < s.size() && is_space(s[start])) ++start;

    std::size_t end = s.size();
    while (end > start && is_space(s[end - 1])) --end;

    if (start == 0 && end == s.size()) return s;
    return s.substr(start, end - start);
}

std::optional<std::string> ClientIdentity::normalize_name(std::string s) {
    s = trim_copy(std::move(s));

    if (s.empty() || s.size() > kMaxNameLen) return std::nullopt;

    const bool has_control = std::any_of(s.begin(), s.end(), [](char c) {
        const auto u = static_cast<unsigned char>(c);
        return u < 0x20 || u == 0x7F;
    });
    if (has_control) return std::nullopt;

    return s;
}

} // namespace lanchat::chat
