#include "networking/ClientSession.h"

#include "protocol/WireCodec.h"
#include "util/Log.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>

#include <algorithm>
#include <deque>
#include <string_view>
#include <utility>

namespace lanchat::networking {

namespace beast = boost::beast;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class ClientSession::Impl : public std::enable_shared_from_this<ClientSession::Impl> {
public:
    static constexpr std::size_t kReadChunk = 4096;

    Impl(asio::io_context& ioc, chat::EventStream& events)
        : events_(events), stream_(asio::make_strand(ioc)), linger_(stream_.get_executor()) {}

    void start(tcp::endpoint server, std::string name) {
        asio::dispatch(stream_.get_executor(), [self = shared_from_this(), server, name = std::move(name)] {
            self->name_ = name;
            self->stream_.expires_after(kConnectTimeout);
            self->stream_.async_connect(
                server, [self, server](beast::error_code ec) {
                    if (ec) {
                        return self->finish(make_error_code(errc::transport_error),
                                            "cannot connect to " + server.address().to_string() +
                                                ":" + std::to_string(server.port()) + ": " + ec.message());
                    }
                    self->stream_.expires_never();
                    util::log(util::Level::Info, "ClientSession", "connected to " +
                              server.address().to_string() + ":" + std::to_string(server.port()));
                    if (self->closed_) return;

                    // Anything queued while connecting goes out after the join.
                    self->connected_ = true;
                    self->write_queue_.push_front(protocol::encode(protocol::Packet::join(self->name_)));
                    self->do_write();
                    self->do_read();
                });
        });
    }

    void send(protocol::Packet packet) {
        asio::dispatch(stream_.get_executor(), [self = shared_from_this(), packet = std::move(packet)] {
            if (self->closed_ || self->leaving_) return;
            bool writing = !self->write_queue_.empty();
            self->write_queue_.push_back(protocol::encode(packet));
            if (!writing && self->connected_) self->do_write();
        });
    }

    void leave() {
        asio::dispatch(stream_.get_executor(), [self = shared_from_this()] {
            if (self->closed_ || self->leaving_) return;
            bool writing = !self->write_queue_.empty();
            self->write_queue_.push_back(protocol::encode(protocol::Packet::leave()));
            self->leaving_ = true;
            if (!writing && self->connected_) self->do_write();
        });
    }

    void close() {
        asio::post(stream_.get_executor(), [self = shared_from_this()] { self->finish({}, {}); });
    }

private:
    void do_read() {
        stream_.async_read_some(
            buffer_.prepare(kReadChunk),
            [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }

    void on_read(beast::error_code ec, std::size_t bytes) {
        if (closed_) return;
        if (ec) {
            // After a leave or a server error the close is expected.
            if (leaving_ || server_error_) return finish({}, {});
            return finish(make_error_code(errc::transport_error), "connection lost: " + ec.message());
        }

        buffer_.commit(bytes);
        for (;;) {
            const auto data = buffer_.data();
            std::string_view view(static_cast<const char*>(data.data()), data.size());

            protocol::Packet packet;
            std::size_t consumed = 0;
            const auto status = protocol::decode(view, packet, consumed);
            if (status == protocol::DecodeStatus::Incomplete) break;
            if (status == protocol::DecodeStatus::Malformed) {
                return finish(make_error_code(errc::malformed_message), "server sent malformed data");
            }
            buffer_.consume(consumed);
            if (!handle(packet)) return;
        }
        do_read();
    }

    bool handle(protocol::Packet& packet) {
        switch (packet.type) {
            case protocol::PacketType::Welcome:
                events_.push(chat::ClientEvent::joined(std::move(packet.name), std::move(packet.users), packet.more));
                return true;
            case protocol::PacketType::Message:
                events_.push(chat::ClientEvent::chat(std::move(packet.message)));
                return true;
            case protocol::PacketType::Notice:
                events_.push(chat::ClientEvent::notice(std::move(packet.text)));
                return true;
            case protocol::PacketType::Roster:
                events_.push(chat::ClientEvent::roster(std::move(packet.users), packet.more));
                return true;
            case protocol::PacketType::Error:
                server_error_ = true;
                events_.push(chat::ClientEvent::failure(make_error_code(packet.error), std::move(packet.text)));
                return true;
            default:
                finish(make_error_code(errc::malformed_message),
                       std::string("server sent unexpected ") + protocol::to_string(packet.type));
                return false;
        }
    }

    void do_write() {
        asio::async_write(
            stream_, asio::buffer(write_queue_.front()),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (self->closed_) return;
                if (ec) {
                    return self->finish(make_error_code(errc::transport_error),
                                        "connection lost: " + ec.message());
                }
                self->write_queue_.pop_front();
                if (!self->write_queue_.empty()) return self->do_write();
                if (self->leaving_) {
                    // Let the server see the leave before the socket goes away.
                    beast::error_code ignored;
                    self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
                    self->await_close();
                }
            });
    }

    // The server normally closes right after a leave. Give up waiting if it does not.
    void await_close() {
        linger_.expires_after(kLeaveTimeout);
        linger_.async_wait([self = shared_from_this()](beast::error_code ec) {
            if (ec == asio::error::operation_aborted || self->closed_) return;
            util::log(util::Level::Info, "ClientSession", "no close from server after leave");
            self->finish({}, {});
        });
    }

    // Ends the session once: reports `error` if set, then the terminal event.
    void finish(boost::system::error_code error, std::string text) {
        if (closed_) return;
        closed_ = true;

        if (error) {
            util::log(util::Level::Warn, "ClientSession", text);
            events_.push(chat::ClientEvent::failure(error, std::move(text)));
        }

        linger_.cancel();

        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
        stream_.close();

        events_.push(chat::ClientEvent::closed());
        events_.close();
    }

    chat::EventStream& events_;
    beast::tcp_stream stream_;
    asio::steady_timer linger_;
    beast::flat_buffer buffer_;
    std::deque<std::string> write_queue_;

    std::string name_;
    bool connected_ = false;
    bool leaving_ = false;
    bool server_error_ = false;
    bool closed_ = false;
};

ClientSession::ClientSession(asio::io_context& ioc, chat::EventStream& events)
    : impl_(std::make_shared<Impl>(ioc, events)) {}

ClientSession::~ClientSession() { impl_->close(); }

void ClientSession::start(const tcp::endpoint& server, std::string name) {
    impl_->start(server, repair_utf8(name));
}

void ClientSession::say(const std::string& text) {
    for (auto& piece : split_text(repair_utf8(text), protocol::kMaxTextLen)) {
        impl_->send(protocol::Packet::say(std::move(piece)));
    }
}

void ClientSession::who(std::string filter) {
    impl_->send(protocol::Packet::who(repair_utf8(filter)));
}

void ClientSession::leave() { impl_->leave(); }

void ClientSession::close() { impl_->close(); }

std::vector<std::string> ClientSession::split_text(const std::string& text, std::size_t limit) {
    std::vector<std::string> pieces;
    if (limit == 0) return pieces;

    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t end = std::min(pos + limit, text.size());
        if (end < text.size()) {
            // Back up to the start of a UTF-8 sequence.
            std::size_t cut = end;
            while (cut > pos && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) --cut;
            if (cut > pos) end = cut;
        }
        pieces.push_back(text.substr(pos, end - pos));
        pos = end;
    }
    return pieces;
}

std::string ClientSession::repair_utf8(const std::string& text) {
    static const std::string kReplacement = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(text.size());
    const auto byte = [&text](std::size_t i) { return static_cast<unsigned char>(text[i]); };

    std::size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = byte(i);
        std::size_t length = 0;
        unsigned char lo = 0x80;  // bounds for the second byte
        unsigned char hi = 0xBF;
        if (lead < 0x80) {
            length = 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) lo = 0xA0;  // overlong
            if (lead == 0xED) hi = 0x9F;  // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) lo = 0x90;  // overlong
            if (lead == 0xF4) hi = 0x8F;  // above U+10FFFF
        }

        bool valid = length != 0 && i + length <= text.size();
        for (std::size_t k = 1; valid && k < length; ++k) {
            const unsigned char c = byte(i + k);
            valid = k == 1 ? (c >= lo && c <= hi) : (c & 0xC0) == 0x80;
        }

        if (valid) {
            out.append(text, i, length);
            i += length;
        } else {
            out += kReplacement;
            ++i;
        }
    }
    return out;
}

} // namespace lanchat::networking
