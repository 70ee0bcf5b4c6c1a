#include "chat/EventStream.h"

#include <utility>

namespace lanchat::chat {

ClientEvent ClientEvent::joined(std::string name, std::vector<std::string> users, std::size_t more) {
    ClientEvent e;
    e.kind = Kind::Joined;
    e.text = std::move(name);
    e.users = std::move(users);
    e.more = more;
    return e;
}

ClientEvent ClientEvent::chat(protocol::ChatMessage message) {
    ClientEvent e;
    e.kind = Kind::Message;
    e.message = std::move(message);
    return e;
}

ClientEvent ClientEvent::notice(std::string text) {
    ClientEvent e;
    e.kind = Kind::Notice;
    e.text = std::move(text);
    return e;
}

ClientEvent ClientEvent::roster(std::vector<std::string> users, std::size_t more) {
    ClientEvent e;
    e.kind = Kind::Roster;
    e.users = std::move(users);
    e.more = more;
    return e;
}

ClientEvent ClientEvent::failure(boost::system::error_code error, std::string text) {
    ClientEvent e;
    e.kind = Kind::Error;
    e.error = error;
    e.text = std::move(text);
    return e;
}

ClientEvent ClientEvent::closed() {
    ClientEvent e;
    e.kind = Kind::Closed;
    return e;
}

const char* to_string(ClientEvent::Kind kind) noexcept {
    switch (kind) {
        case ClientEvent::Kind::Joined:  return "joined";
        case ClientEvent::Kind::Message: return "message";
        case ClientEvent::Kind::Notice:  return "notice";
        case ClientEvent::Kind::Roster:  return "roster";
        case ClientEvent::Kind::Error:   return "error";
        case ClientEvent::Kind::Closed:  return "closed";
    }
    return "unknown";
}

void EventStream::push(ClientEvent event) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return;
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void EventStream::close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventStream::next(ClientEvent& out) {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return !events_.empty() || closed_; });
    if (events_.empty()) return false;
    out = std::move(events_.front());
    events_.pop_front();
    return true;
}

bool EventStream::next_for(ClientEvent& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cv_.wait_for(lk, timeout, [this] { return !events_.empty() || closed_; })) return false;
    if (events_.empty()) return false;
    out = std::move(events_.front());
    events_.pop_front();
    return true;
}

bool EventStream::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

} // namespace lanchat::chat
