#include "app/Config.h"
#include "chat/EventStream.h"
#include "networking/ClientSession.h"
#include "networking/DiscoveryRequester.h"
#include "protocol/Error.h"
#include "ui/Console.h"
#include "ui/LineReader.h"
#include "util/Log.h"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <unistd.h>

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

using tcp = boost::asio::ip::tcp;

// Discovery first when enabled, then the explicit address.
std::optional<tcp::endpoint> resolve_server(const lanchat::app::ClientConfig& config,
                                            lanchat::ui::Console& console) {
    if (config.discovery_enabled) {
        lanchat::networking::DiscoveryOptions options;
        options.port = config.discovery_port;
        options.timeout = config.discovery_timeout;

        boost::system::error_code ec;
        auto found = lanchat::networking::discover_server(options, ec);
        if (found) return found;

        if (config.server_host.empty()) {
            console.print_error("discovery failed: " + ec.message());
            return std::nullopt;
        }
        lanchat::util::log(lanchat::util::Level::Warn, "LanChat",
                           "discovery failed (" + ec.message() + "), using " + config.server_host);
    }

    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(config.server_host, ec);
    if (ec) {
        console.print_error("invalid server address: " + config.server_host);
        return std::nullopt;
    }
    return tcp::endpoint(address, config.chat_port);
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace lanchat;

    app::ClientConfig config;
    try {
        config = app::parse_client_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << app::client_usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << app::client_usage(argv[0]);
        return 0;
    }
    util::set_level(config.log_level);

    ui::Console console(std::cout, config.color);

    auto server = resolve_server(config, console);
    if (!server) return 1;

    chat::EventStream events;
    boost::asio::io_context ioc;
    networking::ClientSession session(ioc, events);
    session.start(*server, config.name);

    // Input is read on the io thread, so the prompt goes away with the session.
    ui::LineReader input(
        ioc,
        [&session](const std::string& line) {
            if (line == "/quit") {
                session.leave();
                return false;
            }
            if (line == "/who" || line.rfind("/who ", 0) == 0) {
                session.who(line.size() > 5 ? line.substr(5) : std::string());
            } else if (!line.empty()) {
                session.say(line);
            }
            return true;
        },
        [&session] { session.leave(); });

    boost::system::error_code ec;
    if (!input.start(STDIN_FILENO, ec)) {
        util::log(util::Level::Warn, "LanChat", "cannot read input: " + ec.message());
        session.leave();
    }

    auto guard = boost::asio::make_work_guard(ioc);
    std::thread io_thread([&ioc] { ioc.run(); });

    bool failed = false;
    chat::ClientEvent event;
    while (events.next(event)) {
        if (event.kind == chat::ClientEvent::Kind::Error) failed = true;
        console.print(event);
    }

    input.stop();
    guard.reset();
    ioc.stop();
    io_thread.join();
    return failed ? 1 : 0;
}
