#pragma once

#include "app/Config.h"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <optional>

namespace lanchat::networking {

struct DiscoveryOptions {
    unsigned short port = app::kDefaultDiscoveryPort;
    boost::asio::ip::address target = boost::asio::ip::address_v4::broadcast();
    std::chrono::milliseconds timeout{3000};
};

// One-shot lookup of a chat server on the local network. Sends a single
// request and returns the first valid answer. Never retries; when nothing
// answers before the timeout `ec` is errc::discovery_timeout.
std::optional<boost::asio::ip::tcp::endpoint>
discover_server(const DiscoveryOptions& options, boost::system::error_code& ec);

} // namespace lanchat::networking
