#pragma once

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace lanchat::protocol {

// Shared by client and server; both sides must agree byte for byte.
static constexpr std::string_view kDiscoveryRequest = "LANCHAT?WHERE";
static constexpr std::string_view kDiscoveryResponsePrefix = "LANCHAT!HERE ";

// Longest response: prefix + "255.255.255.255:65535".
static constexpr std::size_t kMaxDiscoveryDatagram = 64;

bool is_discovery_request(std::string_view datagram) noexcept;

std::string make_discovery_response(const boost::asio::ip::address& host, unsigned short port);

// Returns the advertised chat endpoint. An unspecified host (0.0.0.0) resolves to
// `sender`, the address the response arrived from.
std::optional<boost::asio::ip::tcp::endpoint>
parse_discovery_response(std::string_view datagram, const boost::asio::ip::address& sender);

} // namespace lanchat::protocol
