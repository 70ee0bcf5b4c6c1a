#pragma once

#include <memory>
#include <string>

namespace lanchat::chat {

// An encoded frame, shared by every recipient of one broadcast.
using Frame = std::shared_ptr<const std::string>;

// Per-client delivery path fed by the Broadcaster.
// deliver() may be called from any thread and must never block.
class OutboundChannel {
public:
    virtual ~OutboundChannel() = default;
    virtual void deliver(Frame frame) = 0;
};

} // namespace lanchat::chat
