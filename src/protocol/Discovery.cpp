#include "protocol/Discovery.h"

#include <charconv>

namespace lanchat::protocol {

namespace asio = boost::asio;

bool is_discovery_request(std::string_view datagram) noexcept {
    return datagram == kDiscoveryRequest;
}

std::string make_discovery_response(const asio::ip::address& host, unsigned short port) {
    return std::string(kDiscoveryResponsePrefix) + host.to_string() + ":" + std::to_string(port);
}

std::optional<asio::ip::tcp::endpoint>
parse_discovery_response(std::string_view datagram, const asio::ip::address& sender) {
    if (datagram.size() > kMaxDiscoveryDatagram) return std::nullopt;
    if (datagram.substr(0, kDiscoveryResponsePrefix.size()) != kDiscoveryResponsePrefix) {
        return std::nullopt;
    }
    std::string_view rest = datagram.substr(kDiscoveryResponsePrefix.size());

    const auto colon = rest.rfind(':');
    if (colon == std::string_view::npos || colon == 0) return std::nullopt;
    std::string_view host_part = rest.substr(0, colon);
    std::string_view port_part = rest.substr(colon + 1);

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_part.data(), port_part.data() + port_part.size(), port);
    if (ec != std::errc() || ptr != port_part.data() + port_part.size()) return std::nullopt;
    if (port == 0 || port > 65535) return std::nullopt;

    boost::system::error_code addr_ec;
    auto host = asio::ip::make_address(std::string(host_part), addr_ec);
    if (addr_ec) return std::nullopt;
    if (host.is_unspecified()) host = sender;

    return asio::ip::tcp::endpoint(host, static_cast<unsigned short>(port));
}

} // namespace lanchat::protocol
