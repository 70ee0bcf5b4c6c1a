#include "app/Config.h"
#include "networking/ChatServer.h"
#include "networking/DiscoveryResponder.h"
#include "util/Log.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/system/system_error.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

int main(int argc, char* argv[]) {
    using namespace lanchat;

    app::ServerConfig config;
    try {
        config = app::parse_server_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << app::server_usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << app::server_usage(argv[0]);
        return 0;
    }
    util::set_level(config.log_level);

    boost::asio::io_context ioc;
    boost::asio::io_context discovery_ioc;

    std::unique_ptr<networking::ChatServer> server;
    std::unique_ptr<networking::DiscoveryResponder> responder;
    try {
        server = std::make_unique<networking::ChatServer>(ioc, config);
        if (config.discovery_enabled) {
            // A server bound to one address advertises that address.
            std::string advertise = config.advertise_host;
            if (advertise.empty() && config.host != "0.0.0.0") advertise = config.host;
            responder = std::make_unique<networking::DiscoveryResponder>(
                discovery_ioc, config.discovery_port, server->local_endpoint().port(), advertise);
        }
    } catch (const boost::system::system_error& e) {
        util::log(util::Level::Error, "LanChat", std::string("startup failed: ") + e.what());
        return 1;
    }

    server->start();
    if (responder) responder->start();

    // Graceful shutdown on Ctrl+C / SIGTERM
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        util::log(util::Level::Info, "LanChat", "shutting down...");
        server->stop();
        if (responder) responder->stop();
    });

    std::thread discovery_thread;
    if (responder) discovery_thread = std::thread([&discovery_ioc] { discovery_ioc.run(); });

    util::log(util::Level::Info, "LanChat",
              "server running with " + std::to_string(config.threads) + " thread(s)");

    std::vector<std::thread> workers;
    for (std::size_t i = 1; i < config.threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }
    ioc.run();

    for (auto& w : workers) w.join();
    if (discovery_thread.joinable()) discovery_thread.join();

    util::log(util::Level::Info, "LanChat", "exit.");
    return 0;
}
