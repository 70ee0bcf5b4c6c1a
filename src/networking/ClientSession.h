#pragma once

#include "chat/EventStream.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace lanchat::networking {

// Client side of one chat connection. Incoming traffic is surfaced as
// ClientEvents on `events`; the stream is closed when the connection ends.
// The public methods may be called from any thread.
class ClientSession {
public:
    static constexpr std::chrono::seconds kConnectTimeout{5};
    // How long to wait for the server to close after a leave.
    static constexpr std::chrono::seconds kLeaveTimeout{2};

    ClientSession(boost::asio::io_context& ioc, chat::EventStream& events);
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // Connects and sends the join request.
    void start(const boost::asio::ip::tcp::endpoint& server, std::string name);

    // Text longer than protocol::kMaxTextLen goes out as several messages.
    // Invalid UTF-8 is replaced before sending.
    void say(const std::string& text);

    // Asks for the names containing `filter`; all of them when it is empty.
    void who(std::string filter = {});

    // Sends a leave request and closes once it is written.
    void leave();

    // Drops the connection without saying goodbye.
    void close();

    // Splits `text` into pieces of at most `limit` bytes without cutting a
    // UTF-8 sequence in half.
    static std::vector<std::string> split_text(const std::string& text, std::size_t limit);

    // Copy of `text` with every byte that is not part of a well-formed UTF-8
    // sequence replaced by U+FFFD.
    static std::string repair_utf8(const std::string& text);

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace lanchat::networking
