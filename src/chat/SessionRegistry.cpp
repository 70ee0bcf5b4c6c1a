#include "chat/SessionRegistry.h"

#include "protocol/Error.h"

#include <algorithm>
#include <utility>

namespace lanchat::chat {

SessionEntryPtr SessionRegistry::join(ClientIdentity identity,
                                      std::shared_ptr<OutboundChannel> channel,
                                      boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lk(mu_);

    if (names_.count(identity.name()) != 0) {
        ec = errc::name_conflict;
        return nullptr;
    }

    ec = {};
    names_.emplace(identity.name(), identity.id());
    auto entry = std::make_shared<const SessionEntry>(SessionEntry{std::move(identity), std::move(channel)});
    entries_.push_back(entry);
    return entry;
}

bool SessionRegistry::leave(ClientId id) {
    std::lock_guard<std::mutex> lk(mu_);

    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [id](const SessionEntryPtr& e) { return e->identity.id() == id; });
    if (it == entries_.end()) return false;

    names_.erase((*it)->identity.name());
    entries_.erase(it);
    return true;
}

std::vector<ClientIdentity> SessionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<ClientIdentity> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e->identity);
    return out;
}

std::vector<std::string> SessionRegistry::names() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e->identity.name());
    return out;
}

std::vector<std::string> SessionRegistry::search(std::string_view fragment) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& e : entries_) {
        const std::string& name = e->identity.name();
        if (name.find(fragment) != std::string::npos) out.push_back(name);
    }
    return out;
}

std::vector<SessionEntryPtr> SessionRegistry::entries() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

bool SessionRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    return names_.count(name) != 0;
}

} // namespace lanchat::chat
