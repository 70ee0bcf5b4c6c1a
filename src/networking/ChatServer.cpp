#include "networking/ChatServer.h"

#include "chat/ClientIdentity.h"
#include "chat/OutboundQueue.h"
#include "protocol/WireCodec.h"
#include "util/Log.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>

#include <atomic>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lanchat::networking {

namespace beast = boost::beast;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

class ChatServer::Impl {
public:
    Impl(asio::io_context& ioc, const app::ServerConfig& config)
        : ioc_(ioc),
          config_(config),
          acceptor_(asio::make_strand(ioc),
                    tcp::endpoint(asio::ip::make_address(config.host), config.chat_port)),
          local_endpoint_(acceptor_.local_endpoint()),
          broadcaster_(registry_) {}

    void start() {
        asio::dispatch(acceptor_.get_executor(), [this] { do_accept(); });
        util::log(util::Level::Info, "ChatServer",
                  "listening on " + local_endpoint_.address().to_string() + ":" +
                      std::to_string(local_endpoint_.port()));
    }

    void stop() {
        asio::dispatch(acceptor_.get_executor(), [this] {
            beast::error_code ec;
            acceptor_.close(ec);
        });

        std::vector<std::shared_ptr<Connection>> open;
        {
            std::lock_guard<std::mutex> lk(mu_);
            stopped_ = true;
            for (auto& [id, c] : connections_) open.push_back(c);
        }
        for (auto& c : open) c->close();
    }

    tcp::endpoint local_endpoint() const { return local_endpoint_; }
    chat::SessionRegistry& registry() { return registry_; }
    chat::Broadcaster& broadcaster() { return broadcaster_; }

    std::size_t connection_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return connections_.size();
    }

private:
    // Handles one client: Connecting -> Joining -> Active -> Closing -> Closed.
    // Every member below is touched only on the stream's strand, except the
    // outbound queue and the write flag.
    class Connection : public chat::OutboundChannel,
                       public std::enable_shared_from_this<Connection> {
    public:
        enum class State { Connecting, Joining, Active, Closing, Closed };

        static constexpr std::size_t kReadChunk = 4096;

        Connection(Impl& server, tcp::socket socket, chat::ClientId id)
            : server_(server),
              id_(id),
              endpoint_(peer_of(socket)),
              stream_(std::move(socket)),
              queue_(server.config_.outbound_capacity, server.config_.overflow_policy) {}

        chat::ClientId id() const { return id_; }

        // A refused connection is told the server is full and closed without reading.
        void start(bool refuse) {
            asio::dispatch(stream_.get_executor(),
                           beast::bind_front_handler(&Connection::on_start, shared_from_this(), refuse));
        }

        // Called by the Broadcaster, possibly from another connection's strand.
        void deliver(chat::Frame frame) override {
            switch (queue_.push(std::move(frame))) {
                case chat::OutboundQueue::PushResult::Queued:
                    schedule_write();
                    break;
                case chat::OutboundQueue::PushResult::DroppedOldest:
                    util::log(util::Level::Debug, tag(), "slow reader, dropped oldest frame");
                    schedule_write();
                    break;
                case chat::OutboundQueue::PushResult::Overflow:
                    asio::post(stream_.get_executor(), [self = shared_from_this()] {
                        util::log(util::Level::Warn, self->tag(), "outbound queue full, disconnecting");
                        self->shutdown();
                    });
                    break;
                case chat::OutboundQueue::PushResult::Closed:
                    break;
            }
        }

        void close() {
            asio::post(stream_.get_executor(), [self = shared_from_this()] { self->shutdown(); });
        }

    private:
        static std::string peer_of(const tcp::socket& socket) {
            beast::error_code ec;
            auto ep = socket.remote_endpoint(ec);
            if (ec) return "unknown";
            return ep.address().to_string() + ":" + std::to_string(ep.port());
        }

        std::string tag() const { return "Connection " + std::to_string(id_); }

        void on_start(bool refuse) {
            if (refuse) return fail(errc::server_full, "server is full");

            beast::error_code ec;
            stream_.socket().set_option(asio::socket_base::keep_alive(true), ec);

            state_ = State::Joining;
            stream_.expires_after(server_.config_.join_timeout);
            util::log(util::Level::Info, tag(), "accepted " + endpoint_);
            do_read();
        }

        // ---- read path ----

        void do_read() {
            stream_.async_read_some(
                buffer_.prepare(kReadChunk),
                beast::bind_front_handler(&Connection::on_read, shared_from_this()));
        }

        void on_read(beast::error_code ec, std::size_t bytes) {
            if (ec) return on_close_or_fail(ec);
            if (state_ != State::Joining && state_ != State::Active) return;

            buffer_.commit(bytes);

            for (;;) {
                const auto data = buffer_.data();
                std::string_view view(static_cast<const char*>(data.data()), data.size());

                protocol::Packet packet;
                std::size_t consumed = 0;
                const auto status = protocol::decode(view, packet, consumed);
                if (status == protocol::DecodeStatus::Incomplete) break;
                if (status == protocol::DecodeStatus::Malformed) {
                    return fail(errc::malformed_message, "malformed message");
                }

                buffer_.consume(consumed);
                handle(packet);
                if (state_ != State::Joining && state_ != State::Active) return;
            }

            do_read();
        }

        void handle(const protocol::Packet& packet) {
            if (state_ == State::Joining) {
                if (packet.type != protocol::PacketType::Join) {
                    return fail(errc::malformed_message, "expected join");
                }
                return on_join(packet);
            }

            switch (packet.type) {
                case protocol::PacketType::Say:
                    if (!packet.text.empty()) server_.broadcaster_.publish(name_, packet.text);
                    break;
                case protocol::PacketType::Who:
                    deliver(std::make_shared<const std::string>(
                        protocol::encode(protocol::Packet::roster(server_.registry_.search(packet.text)))));
                    break;
                case protocol::PacketType::Leave:
                    util::log(util::Level::Info, tag(), name_ + " is leaving");
                    begin_close();
                    break;
                default:
                    fail(errc::malformed_message,
                         std::string("unexpected ") + protocol::to_string(packet.type));
                    break;
            }
        }

        void on_join(const protocol::Packet& join) {
            if (!protocol::is_supported_version(join.version)) {
                return fail(errc::unsupported_version,
                            "unsupported protocol version; server speaks " + protocol::supported_versions());
            }

            auto name = chat::ClientIdentity::normalize_name(join.name);
            if (!name) return fail(errc::malformed_message, "invalid name");

            boost::system::error_code ec;
            server_.broadcaster_.admit(chat::ClientIdentity{id_, *name, endpoint_},
                                       shared_from_this(), ec);
            if (ec) return fail(errc::name_conflict, "name \"" + *name + "\" is already in use");

            name_ = *name;
            joined_ = true;
            state_ = State::Active;
            stream_.expires_never();
            util::log(util::Level::Info, tag(), name_ + " joined from " + endpoint_);
        }

        // ---- write path ----

        void schedule_write() {
            if (!write_scheduled_.exchange(true)) {
                asio::post(stream_.get_executor(),
                           beast::bind_front_handler(&Connection::do_write, shared_from_this()));
            }
        }

        void do_write() {
            if (state_ == State::Closed) return;

            if (!queue_.pop(writing_)) {
                write_scheduled_ = false;
                // A push may have landed between the failed pop and the reset.
                if (!queue_.empty() && !write_scheduled_.exchange(true)) return do_write();
                if (close_after_flush_) shutdown();
                return;
            }

            stream_.expires_after(server_.config_.write_timeout);
            asio::async_write(stream_, asio::buffer(*writing_),
                              beast::bind_front_handler(&Connection::on_write, shared_from_this()));
        }

        void on_write(beast::error_code ec, std::size_t) {
            writing_.reset();
            if (ec) {
                write_scheduled_ = false;
                return on_close_or_fail(ec);
            }
            if (state_ == State::Active) stream_.expires_never();
            do_write();
        }

        // ---- shutdown ----

        void leave_registry() {
            if (!joined_) return;
            joined_ = false;
            server_.broadcaster_.dismiss(id_);
        }

        // Graceful: flush what is queued, then close.
        void begin_close() {
            state_ = State::Closing;
            leave_registry();
            queue_.close();
            close_after_flush_ = true;
            if (!write_scheduled_.exchange(true)) do_write();
        }

        // Sends an error packet, then closes once it is written.
        void fail(errc code, const std::string& text) {
            util::log(util::Level::Warn, tag(), std::string(wire_code(code)) + ": " + text);

            state_ = State::Closing;
            leave_registry();

            auto frame = std::make_shared<const std::string>(
                protocol::encode(protocol::Packet::failure(code, text)));
            const auto pushed = queue_.push(std::move(frame));
            queue_.close();
            close_after_flush_ = true;

            if (pushed == chat::OutboundQueue::PushResult::Overflow ||
                pushed == chat::OutboundQueue::PushResult::Closed) {
                return shutdown();
            }
            if (!write_scheduled_.exchange(true)) do_write();
        }

        void on_close_or_fail(beast::error_code ec) {
            if (state_ == State::Closed) return;

            if (ec == asio::error::eof || ec == asio::error::connection_reset) {
                util::log(util::Level::Info, tag(), "peer disconnected");
            } else if (ec == beast::error::timeout) {
                util::log(util::Level::Warn, tag(), "timed out");
            } else if (ec != asio::error::operation_aborted) {
                util::log(util::Level::Warn, tag(), "io: " + ec.message());
            }
            shutdown();
        }

        void shutdown() {
            if (state_ == State::Closed) return;
            state_ = State::Closing;

            leave_registry();
            queue_.close();
            queue_.clear();

            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
            stream_.close();

            state_ = State::Closed;
            server_.remove_connection(id_);
            util::log(util::Level::Debug, tag(), "closed");
        }

        Impl& server_;
        chat::ClientId id_;
        std::string endpoint_;

        beast::tcp_stream stream_;
        beast::flat_buffer buffer_;

        chat::OutboundQueue queue_;
        chat::Frame writing_;
        std::atomic<bool> write_scheduled_{false};

        State state_ = State::Connecting;
        std::string name_;
        bool joined_ = false;
        bool close_after_flush_ = false;
    };

    void do_accept() {
        acceptor_.async_accept(
            asio::make_strand(ioc_),
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    util::log(util::Level::Warn, "accept", ec.message());
                    return do_accept();
                }

                auto id = next_client_id_++;
                auto connection = std::make_shared<Connection>(*this, std::move(socket), id);

                bool full = false;
                {
                    std::lock_guard<std::mutex> lk(mu_);
                    if (stopped_) return;
                    full = connections_.size() >= config_.max_clients;
                    connections_[id] = connection;
                }
                if (full) util::log(util::Level::Warn, "accept", "connection limit reached, refusing");

                connection->start(full);
                do_accept();
            });
    }

    void remove_connection(chat::ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        connections_.erase(id);
    }

private:
    asio::io_context& ioc_;
    app::ServerConfig config_;
    tcp::acceptor acceptor_;
    tcp::endpoint local_endpoint_;

    chat::SessionRegistry registry_;
    chat::Broadcaster broadcaster_;

    std::atomic<chat::ClientId> next_client_id_{1};

    mutable std::mutex mu_;
    bool stopped_ = false;
    std::unordered_map<chat::ClientId, std::shared_ptr<Connection>> connections_;
};

// ---- ChatServer wrapper ----

ChatServer::ChatServer(asio::io_context& ioc, const app::ServerConfig& config)
    : impl_(new Impl(ioc, config)) {}

void ChatServer::start() { impl_->start(); }
void ChatServer::stop() { impl_->stop(); }

tcp::endpoint ChatServer::local_endpoint() const { return impl_->local_endpoint(); }

chat::SessionRegistry& ChatServer::registry() { return impl_->registry(); }
chat::Broadcaster& ChatServer::broadcaster() { return impl_->broadcaster(); }

std::size_t ChatServer::connection_count() const { return impl_->connection_count(); }

ChatServer::~ChatServer() = default;

} // namespace lanchat::networking
