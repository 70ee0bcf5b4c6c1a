#pragma once

#include "chat/SessionRegistry.h"
#include "protocol/Packet.h"

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace lanchat::chat {

// Fans messages out to every registered client. One publish at a time holds the
// sequence lock, so all clients observe the same total order.
class Broadcaster {
public:
    explicit Broadcaster(SessionRegistry& registry);

    Broadcaster(const Broadcaster&) = delete;
    Broadcaster& operator=(const Broadcaster&) = delete;

    // Joins the registry, sends the welcome to `channel` and announces the
    // arrival to everyone. Fails with errc::name_conflict.
    SessionEntryPtr admit(ClientIdentity identity,
                          std::shared_ptr<OutboundChannel> channel,
                          boost::system::error_code& ec);

    // Leaves the registry and announces the departure. No-op for unknown ids.
    void dismiss(ClientId id);

    // The sender is among the recipients.
    protocol::ChatMessage publish(const std::string& sender, const std::string& text);

    void announce(const std::string& text);

    std::uint64_t last_sequence() const;

    SessionRegistry& registry() noexcept { return registry_; }

private:
    void fan_out_locked(const protocol::Packet& packet);

    SessionRegistry& registry_;

    mutable std::mutex mu_;
    std::uint64_t seq_ = 0;
};

} // namespace lanchat::chat
