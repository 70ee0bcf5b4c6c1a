#include "networking/DiscoveryResponder.h"

#include "protocol/Discovery.h"
#include "util/Log.h"

#include <boost/asio/post.hpp>

#include <memory>
#include <string_view>

namespace lanchat::networking {

namespace asio = boost::asio;
using udp = asio::ip::udp;

DiscoveryResponder::DiscoveryResponder(asio::io_context& ioc,
                                       unsigned short discovery_port,
                                       unsigned short chat_port,
                                       const std::string& advertise_host)
    : ioc_(ioc), socket_(ioc), chat_port_(chat_port) {
    if (!advertise_host.empty()) advertise_ = asio::ip::make_address(advertise_host);

    socket_.open(udp::v4());
    socket_.set_option(asio::socket_base::reuse_address(true));
    socket_.set_option(asio::socket_base::broadcast(true));
    socket_.bind(udp::endpoint(udp::v4(), discovery_port));
}

void DiscoveryResponder::start() {
    const auto ep = local_endpoint();
    util::log(util::Level::Info, "Discovery",
              "answering on udp port " + std::to_string(ep.port()) + " for chat port " +
                  std::to_string(chat_port_));
    asio::post(ioc_, [this] { do_receive(); });
}

void DiscoveryResponder::stop() {
    asio::post(ioc_, [this] {
        boost::system::error_code ec;
        socket_.close(ec);
    });
}

udp::endpoint DiscoveryResponder::local_endpoint() const {
    boost::system::error_code ec;
    return socket_.local_endpoint(ec);
}

void DiscoveryResponder::do_receive() {
    socket_.async_receive_from(
        asio::buffer(buffer_), remote_,
        [this](const boost::system::error_code& ec, std::size_t bytes) { on_receive(ec, bytes); });
}

void DiscoveryResponder::on_receive(const boost::system::error_code& ec, std::size_t bytes) {
    if (ec == asio::error::operation_aborted || !socket_.is_open()) return;
    if (ec) {
        util::log(util::Level::Debug, "Discovery", "receive: " + ec.message());
        return do_receive();
    }

    if (!protocol::is_discovery_request(std::string_view(buffer_.data(), bytes))) {
        return do_receive();
    }

    const udp::endpoint requester = remote_;
    auto response = std::make_shared<std::string>(
        protocol::make_discovery_response(advertised_for(requester), chat_port_));

    util::log(util::Level::Debug, "Discovery",
              "request from " + requester.address().to_string() + ", answering " + *response);

    socket_.async_send_to(
        asio::buffer(*response), requester,
        [this, response](const boost::system::error_code& send_ec, std::size_t) {
            if (send_ec) {
                util::log(util::Level::Debug, "Discovery", "reply: " + send_ec.message());
                return;
            }
            ++answered_;
        });

    do_receive();
}

asio::ip::address DiscoveryResponder::advertised_for(const udp::endpoint& requester) {
    if (advertise_) return *advertise_;

    // Connecting a UDP socket sends nothing; it only picks the outgoing interface.
    boost::system::error_code ec;
    udp::socket route(ioc_);
    route.open(requester.protocol(), ec);
    if (!ec) route.connect(requester, ec);
    if (!ec) {
        auto local = route.local_endpoint(ec);
        if (!ec && !local.address().is_unspecified()) return local.address();
    }
    return asio::ip::address_v4::any();
}

} // namespace lanchat::networking
