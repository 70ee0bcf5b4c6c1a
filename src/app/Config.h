#pragma once

#include "chat/OutboundQueue.h"
#include "util/Log.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace lanchat::app {

static constexpr unsigned short kDefaultChatPort = 32500;
static constexpr unsigned short kDefaultDiscoveryPort = 32501;

struct ServerConfig {
    std::string host = "0.0.0.0";
    unsigned short chat_port = kDefaultChatPort;
    unsigned short discovery_port = kDefaultDiscoveryPort;
    bool discovery_enabled = true;
    std::string advertise_host;  // empty: address of the interface facing the requester
    std::size_t threads = 1;
    std::size_t max_clients = 100;  // open connections, joined or not
    std::size_t outbound_capacity = 256;
    chat::OverflowPolicy overflow_policy = chat::OverflowPolicy::DropOldest;
    std::chrono::milliseconds join_timeout{10000};
    std::chrono::milliseconds write_timeout{10000};
    util::Level log_level = util::Level::Info;
    bool show_help = false;
};

struct ClientConfig {
    std::string name;
    std::string server_host;  // explicit address, used when discovery is off or fails
    unsigned short chat_port = kDefaultChatPort;
    unsigned short discovery_port = kDefaultDiscoveryPort;
    bool discovery_enabled = true;
    std::chrono::milliseconds discovery_timeout{3000};
    bool color = true;
    util::Level log_level = util::Level::Warn;
    bool show_help = false;
};

// Both throw std::invalid_argument with a message fit for the user.
ServerConfig parse_server_args(int argc, const char* const argv[]);
ClientConfig parse_client_args(int argc, const char* const argv[]);

std::string server_usage(const std::string& program);
std::string client_usage(const std::string& program);

} // namespace lanchat::app
