#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lanchat::chat {

using ClientId = std::uint64_t;

class ClientIdentity {
public:
    using Clock = std::chrono::system_clock;
    static constexpr std::size_t kMaxNameLen = 24;

    // `name` must already be normalized.
    ClientIdentity(ClientId id, std::string name, std::string endpoint);

    ClientId id() const noexcept;
    const std::string& name() const noexcept;
    const std::string& endpoint() const noexcept;
    Clock::time_point joined_at() const noexcept;

    // Trims surrounding whitespace. Rejects empty names, names longer than
    // kMaxNameLen and names containing control characters.
    static std::optional<std::string> normalize_name(std::string s);

private:
    static std::string trim_copy(std::string s);
    static bool is_space(char c) noexcept;

private:
    ClientId id_;
    std::string name_;
    std::string endpoint_;
    Clock::time_point joined_at_;
};

} // namespace lanchat::chat
