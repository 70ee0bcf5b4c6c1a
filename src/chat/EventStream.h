#pragma once

#include "protocol/Packet.h"

#include <boost/system/error_code.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace lanchat::chat {

// What the client core hands to the UI. The kind is what the UI colors by.
struct ClientEvent {
    enum class Kind { Joined, Message, Notice, Roster, Error, Closed };

    Kind kind = Kind::Closed;
    protocol::ChatMessage message;   // Message
    std::string text;                // Joined (own name), Notice, Error
    std::vector<std::string> users;  // Joined, Roster
    std::size_t more = 0;            // Joined, Roster: names left out of `users`
    boost::system::error_code error; // Error

    static ClientEvent joined(std::string name, std::vector<std::string> users, std::size_t more = 0);
    static ClientEvent chat(protocol::ChatMessage message);
    static ClientEvent notice(std::string text);
    static ClientEvent roster(std::vector<std::string> users, std::size_t more = 0);
    static ClientEvent failure(boost::system::error_code error, std::string text);
    static ClientEvent closed();
};

const char* to_string(ClientEvent::Kind kind) noexcept;

// Unbounded, thread-safe sequence of events. Ends after close(); events
// pushed before close() are still handed out.
class EventStream {
public:
    EventStream() = default;

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    void push(ClientEvent event);
    void close();

    // Blocks until an event is available. Returns false once closed and drained.
    bool next(ClientEvent& out);

    // Like next(), but gives up after `timeout`.
    bool next_for(ClientEvent& out, std::chrono::milliseconds timeout);

    bool closed() const;

private:
    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<ClientEvent> events_;
    bool closed_ = false;
};

} // namespace lanchat::chat
