#include "chat/Broadcaster.h"

#include "protocol/Error.h"
#include "protocol/WireCodec.h"
#include "util/Log.h"

#include <chrono>
#include <utility>

namespace lanchat::chat {

namespace {

std::int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

Frame make_frame(const protocol::Packet& packet) {
    return std::make_shared<const std::string>(protocol::encode(packet));
}

} // namespace

Broadcaster::Broadcaster(SessionRegistry& registry) : registry_(registry) {}

SessionEntryPtr Broadcaster::admit(ClientIdentity identity,
                                   std::shared_ptr<OutboundChannel> channel,
                                   boost::system::error_code& ec) {
    std::lock_guard<std::mutex> lk(mu_);

    const std::string name = identity.name();
    if (registry_.contains(name)) {
        ec = errc::name_conflict;
        return nullptr;
    }

    // Built before the join so an encoding failure leaves the registry untouched.
    // Everything with a sequence above this one reaches the new client.
    auto users = registry_.names();
    users.push_back(name);
    const Frame welcome = make_frame(protocol::Packet::welcome(name, seq_, std::move(users)));

    auto entry = registry_.join(std::move(identity), channel, ec);
    if (ec) return nullptr;

    channel->deliver(welcome);
    fan_out_locked(protocol::Packet::notice(++seq_, name + " joined"));
    return entry;
}

void Broadcaster::dismiss(ClientId id) {
    std::lock_guard<std::mutex> lk(mu_);

    std::string name;
    for (const auto& e : registry_.entries()) {
        if (e->identity.id() == id) {
            name = e->identity.name();
            break;
        }
    }
    if (!registry_.leave(id)) return;

    fan_out_locked(protocol::Packet::notice(++seq_, name + " left"));
}

protocol::ChatMessage Broadcaster::publish(const std::string& sender, const std::string& text) {
    std::lock_guard<std::mutex> lk(mu_);

    protocol::ChatMessage message;
    message.seq = ++seq_;
    message.sender = sender;
    message.text = text;
    message.timestamp = unix_now();

    fan_out_locked(protocol::Packet::chat(message));
    return message;
}

void Broadcaster::announce(const std::string& text) {
    std::lock_guard<std::mutex> lk(mu_);
    fan_out_locked(protocol::Packet::notice(++seq_, text));
}

std::uint64_t Broadcaster::last_sequence() const {
    std::lock_guard<std::mutex> lk(mu_);
    return seq_;
}

void Broadcaster::fan_out_locked(const protocol::Packet& packet) {
    const Frame frame = make_frame(packet);
    const auto recipients = registry_.entries();

    util::log(util::Level::Debug, "Broadcaster",
              std::string(protocol::to_string(packet.type)) + " to " +
                  std::to_string(recipients.size()) + " client(s)");

    for (const auto& entry : recipients) {
        entry->channel->deliver(frame);
    }
}

} // namespace lanchat::chat
