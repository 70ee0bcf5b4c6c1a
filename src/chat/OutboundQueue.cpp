#include "chat/OutboundQueue.h"

#include <algorithm>
#include <utility>

namespace lanchat::chat {

const char* to_string(OverflowPolicy policy) noexcept {
    switch (policy) {
        case OverflowPolicy::DropOldest: return "drop-oldest";
        case OverflowPolicy::Disconnect: return "disconnect";
    }
    return "drop-oldest";
}

bool parse_overflow_policy(std::string_view text, OverflowPolicy& out) noexcept {
    if (text == "drop-oldest") {
        out = OverflowPolicy::DropOldest;
        return true;
    }
    if (text == "disconnect") {
        out = OverflowPolicy::Disconnect;
        return true;
    }
    return false;
}

OutboundQueue::OutboundQueue(std::size_t capacity, OverflowPolicy policy)
    : capacity_(std::max<std::size_t>(capacity, 1)), policy_(policy) {}

OutboundQueue::PushResult OutboundQueue::push(Frame frame) {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return PushResult::Closed;

    if (frames_.size() < capacity_) {
        frames_.push_back(std::move(frame));
        return PushResult::Queued;
    }

    if (policy_ == OverflowPolicy::Disconnect) return PushResult::Overflow;

    frames_.pop_front();
    ++dropped_;
    frames_.push_back(std::move(frame));
    return PushResult::DroppedOldest;
}

bool OutboundQueue::pop(Frame& out) {
    std::lock_guard<std::mutex> lk(mu_);
    if (frames_.empty()) return false;
    out = std::move(frames_.front());
    frames_.pop_front();
    return true;
}

void OutboundQueue::close() {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
}

void OutboundQueue::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    frames_.clear();
}

bool OutboundQueue::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

bool OutboundQueue::empty() const {
    std::lock_guard<std::mutex> lk(mu_);
    return frames_.empty();
}

std::size_t OutboundQueue::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return frames_.size();
}

std::size_t OutboundQueue::dropped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return dropped_;
}

} // namespace lanchat::chat
