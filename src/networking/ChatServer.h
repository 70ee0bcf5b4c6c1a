#pragma once

#include "app/Config.h"
#include "chat/Broadcaster.h"
#include "chat/SessionRegistry.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <cstddef>
#include <memory>

namespace lanchat::networking {

// Accepts chat connections and runs one handler per connection. The
// io_context may be run by any number of threads.
class ChatServer {
public:
    // Binds and listens immediately; throws boost::system::system_error on failure.
    ChatServer(boost::asio::io_context& ioc, const app::ServerConfig& config);
    ~ChatServer();

    ChatServer(const ChatServer&) = delete;
    ChatServer& operator=(const ChatServer&) = delete;

    void start();  // start accepting
    void stop();   // stop accepting + close active connections; completes asynchronously

    boost::asio::ip::tcp::endpoint local_endpoint() const;

    chat::SessionRegistry& registry();
    chat::Broadcaster& broadcaster();

    // Accepted connections that are not closed yet, joined or not.
    std::size_t connection_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace lanchat::networking
