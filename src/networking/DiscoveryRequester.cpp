#include "networking/DiscoveryRequester.h"

#include "protocol/Discovery.h"
#include "protocol/Error.h"
#include "util/Log.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <string_view>

namespace lanchat::networking {

namespace asio = boost::asio;
using udp = asio::ip::udp;
using tcp = asio::ip::tcp;

namespace {

class Requester {
public:
    explicit Requester(const DiscoveryOptions& options)
        : options_(options), socket_(ioc_), timer_(ioc_) {}

    std::optional<tcp::endpoint> run(boost::system::error_code& ec) {
        socket_.open(udp::v4(), ec);
        if (ec) return std::nullopt;
        socket_.set_option(asio::socket_base::broadcast(true), ec);
        if (ec) return std::nullopt;
        socket_.bind(udp::endpoint(udp::v4(), 0), ec);
        if (ec) return std::nullopt;

        const udp::endpoint target(options_.target, options_.port);
        util::log(util::Level::Info, "Discovery",
                  "looking for a server via " + target.address().to_string() + ":" +
                      std::to_string(target.port()));

        socket_.async_send_to(
            asio::buffer(protocol::kDiscoveryRequest.data(), protocol::kDiscoveryRequest.size()),
            target, [](const boost::system::error_code& send_ec, std::size_t) {
                // Keep waiting anyway; the outcome is decided by the deadline.
                if (send_ec) util::log(util::Level::Warn, "Discovery", "request: " + send_ec.message());
            });

        timer_.expires_after(options_.timeout);
        timer_.async_wait([this](const boost::system::error_code& wait_ec) {
            if (wait_ec == asio::error::operation_aborted) return;
            boost::system::error_code ignored;
            socket_.close(ignored);
        });

        do_receive();
        ioc_.run();

        if (!found_) {
            ec = errc::discovery_timeout;
            return std::nullopt;
        }
        ec = {};
        return found_;
    }

private:
    void do_receive() {
        socket_.async_receive_from(
            asio::buffer(buffer_), sender_,
            [this](const boost::system::error_code& ec, std::size_t bytes) {
                if (ec == asio::error::operation_aborted || !socket_.is_open()) return;
                if (!ec) {
                    found_ = protocol::parse_discovery_response(
                        std::string_view(buffer_.data(), bytes), sender_.address());
                    if (found_) {
                        util::log(util::Level::Info, "Discovery",
                                  "found server at " + found_->address().to_string() + ":" +
                                      std::to_string(found_->port()));
                        timer_.cancel();
                        boost::system::error_code ignored;
                        socket_.close(ignored);
                        return;
                    }
                }
                do_receive();
            });
    }

    DiscoveryOptions options_;
    asio::io_context ioc_;
    udp::socket socket_;
    asio::steady_timer timer_;
    udp::endpoint sender_;
    std::array<char, 512> buffer_{};
    std::optional<tcp::endpoint> found_;
};

} // namespace

std::optional<tcp::endpoint> discover_server(const DiscoveryOptions& options,
                                             boost::system::error_code& ec) {
    Requester requester(options);
    return requester.run(ec);
}

} // namespace lanchat::networking
