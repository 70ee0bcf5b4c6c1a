#pragma once

#include <boost/system/error_code.hpp>

#include <optional>
#include <string_view>
#include <type_traits>

namespace lanchat {

enum class errc {
    malformed_message = 1,
    name_conflict,
    discovery_timeout,
    transport_error,
    unsupported_version,
    server_full,
};

const boost::system::error_category& chat_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

// Codes carried in `error` packets. discovery_timeout and transport_error never
// travel on the wire.
std::string_view wire_code(errc e) noexcept;
std::optional<errc> errc_from_wire(std::string_view code) noexcept;

} // namespace lanchat

namespace boost::system {
template <>
struct is_error_code_enum<lanchat::errc> : std::true_type {};
} // namespace boost::system
