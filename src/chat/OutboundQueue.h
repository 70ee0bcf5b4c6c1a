#pragma once

#include "chat/OutboundChannel.h"

#include <cstddef>
#include <deque>
#include <mutex>
#include <string_view>

namespace lanchat::chat {

enum class OverflowPolicy { DropOldest, Disconnect };

const char* to_string(OverflowPolicy policy) noexcept;
bool parse_overflow_policy(std::string_view text, OverflowPolicy& out) noexcept;

// Bounded FIFO between the Broadcaster (producer) and one connection's
// writer (consumer). Thread-safe.
class OutboundQueue {
public:
    enum class PushResult {
        Queued,
        DroppedOldest,  // queued, but the oldest frame was discarded to make room
        Overflow,       // not queued; the consumer is too slow and must be disconnected
        Closed,         // not queued; the queue has been closed
    };

    OutboundQueue(std::size_t capacity, OverflowPolicy policy);

    OutboundQueue(const OutboundQueue&) = delete;
    OutboundQueue& operator=(const OutboundQueue&) = delete;

    PushResult push(Frame frame);

    // Returns false when nothing is queued.
    bool pop(Frame& out);

    // Refuses further pushes. Frames already queued can still be popped.
    void close();
    void clear();

    bool closed() const;
    bool empty() const;
    std::size_t size() const;
    std::size_t capacity() const noexcept { return capacity_; }
    std::size_t dropped() const;

private:
    const std::size_t capacity_;
    const OverflowPolicy policy_;

    mutable std::mutex mu_;
    std::deque<Frame> frames_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace lanchat::chat
