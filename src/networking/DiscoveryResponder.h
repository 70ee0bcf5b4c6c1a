#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace lanchat::networking {

// Answers discovery requests with the chat service address. Keeps no state
// between requests. Give it an io_context of its own so chat load cannot delay it.
class DiscoveryResponder {
public:
    // Binds the discovery port immediately; throws boost::system::system_error.
    // An empty `advertise_host` advertises the interface address that faces
    // each requester.
    DiscoveryResponder(boost::asio::io_context& ioc,
                       unsigned short discovery_port,
                       unsigned short chat_port,
                       const std::string& advertise_host = {});

    DiscoveryResponder(const DiscoveryResponder&) = delete;
    DiscoveryResponder& operator=(const DiscoveryResponder&) = delete;

    void start();
    void stop();

    boost::asio::ip::udp::endpoint local_endpoint() const;
    std::uint64_t answered() const noexcept { return answered_; }

private:
    void do_receive();
    void on_receive(const boost::system::error_code& ec, std::size_t bytes);
    boost::asio::ip::address advertised_for(const boost::asio::ip::udp::endpoint& requester);

    boost::asio::io_context& ioc_;
    boost::asio::ip::udp::socket socket_;
    boost::asio::ip::udp::endpoint remote_;
    std::array<char, 512> buffer_{};
    unsigned short chat_port_;
    std::optional<boost::asio::ip::address> advertise_;
    std::atomic<std::uint64_t> answered_{0};
};

} // namespace lanchat::networking
