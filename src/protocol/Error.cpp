#include "protocol/Error.h"

#include <string>

namespace lanchat {

namespace {

class ChatCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "lanchat"; }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::malformed_message: return "malformed message";
            case errc::name_conflict:     return "name already in use";
            case errc::discovery_timeout: return "no server answered discovery";
            case errc::transport_error:   return "connection lost";
            case errc::unsupported_version: return "unsupported protocol version";
            case errc::server_full:       return "server is full";
        }
        return "unknown lanchat error";
    }
};

} // namespace

const boost::system::error_category& chat_category() noexcept {
    static const ChatCategory category;
    return category;
}

boost::system::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), chat_category()};
}

std::string_view wire_code(errc e) noexcept {
    switch (e) {
        case errc::malformed_message: return "malformed_message";
        case errc::name_conflict:     return "name_conflict";
        case errc::discovery_timeout: return "discovery_timeout";
        case errc::transport_error:   return "transport_error";
        case errc::unsupported_version: return "unsupported_version";
        case errc::server_full:       return "server_full";
    }
    return "unknown";
}

std::optional<errc> errc_from_wire(std::string_view code) noexcept {
    for (auto e : {errc::malformed_message, errc::name_conflict, errc::discovery_timeout,
                   errc::transport_error, errc::unsupported_version, errc::server_full}) {
        if (wire_code(e) == code) return e;
    }
    return std::nullopt;
}

} // namespace lanchat
