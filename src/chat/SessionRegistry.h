#pragma once

#include "chat/ClientIdentity.h"
#include "chat/OutboundChannel.h"

#include <boost/system/error_code.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lanchat::chat {

struct SessionEntry {
    ClientIdentity identity;
    std::shared_ptr<OutboundChannel> channel;
};

using SessionEntryPtr = std::shared_ptr<const SessionEntry>;

// Table of joined clients. Every operation is atomic with respect to the others.
class SessionRegistry {
public:
    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Fails with errc::name_conflict if the name is already active.
    SessionEntryPtr join(ClientIdentity identity,
                         std::shared_ptr<OutboundChannel> channel,
                         boost::system::error_code& ec);

    // Idempotent. Returns true if an entry was removed.
    bool leave(ClientId id);

    // Identities in join order.
    std::vector<ClientIdentity> snapshot() const;
    std::vector<std::string> names() const;
    std::vector<SessionEntryPtr> entries() const;

    // Names containing `fragment`, case-sensitive, in join order. An empty
    // fragment matches everyone.
    std::vector<std::string> search(std::string_view fragment) const;

    std::size_t size() const;
    bool contains(const std::string& name) const;

private:
    mutable std::mutex mu_;
    std::vector<SessionEntryPtr> entries_;            // join order
    std::unordered_map<std::string, ClientId> names_;
};

} // namespace lanchat::chat
