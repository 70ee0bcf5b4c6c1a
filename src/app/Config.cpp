#include "app/Config.h"

#include <algorithm>
#include <stdexcept>
#include <string_view>
#include <thread>

namespace lanchat::app {

namespace {

// Walks argv in "--flag value" form.
class ArgCursor {
public:
    ArgCursor(int argc, const char* const argv[]) : argc_(argc), argv_(argv) {}

    bool next(std::string_view& flag) {
        if (++i_ >= argc_) return false;
        flag = argv_[i_];
        return true;
    }

    std::string value(std::string_view flag) {
        if (i_ + 1 >= argc_) {
            throw std::invalid_argument("missing value for " + std::string(flag));
        }
        return argv_[++i_];
    }

private:
    int argc_;
    const char* const* argv_;
    int i_ = 0;
};

unsigned long to_number(const std::string& text, std::string_view flag,
                        unsigned long min, unsigned long max) {
    unsigned long n = 0;
    std::size_t pos = 0;
    try {
        n = std::stoul(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid number for " + std::string(flag) + ": " + text);
    }
    if (pos != text.size() || n < min || n > max) {
        throw std::invalid_argument("invalid number for " + std::string(flag) + ": " + text);
    }
    return n;
}

unsigned short to_port(const std::string& text, std::string_view flag) {
    return static_cast<unsigned short>(to_number(text, flag, 0, 65535));
}

std::chrono::milliseconds to_millis(const std::string& text, std::string_view flag) {
    return std::chrono::milliseconds(to_number(text, flag, 1, 24ul * 3600 * 1000));
}

util::Level to_level(const std::string& text) {
    util::Level lvl = util::Level::Info;
    if (!util::parse_level(text, lvl)) {
        throw std::invalid_argument("unknown log level: " + text);
    }
    return lvl;
}

} // namespace

ServerConfig parse_server_args(int argc, const char* const argv[]) {
    ServerConfig cfg;
    cfg.threads = std::max(1u, std::thread::hardware_concurrency());
    cfg.log_level = util::level();

    ArgCursor args(argc, argv);
    std::string_view flag;
    while (args.next(flag)) {
        if (flag == "-h" || flag == "--help") {
            cfg.show_help = true;
        } else if (flag == "--host") {
            cfg.host = args.value(flag);
        } else if (flag == "-p" || flag == "--port") {
            cfg.chat_port = to_port(args.value(flag), flag);
        } else if (flag == "--discovery-port") {
            cfg.discovery_port = to_port(args.value(flag), flag);
        } else if (flag == "--no-discovery") {
            cfg.discovery_enabled = false;
        } else if (flag == "--advertise") {
            cfg.advertise_host = args.value(flag);
        } else if (flag == "--threads") {
            cfg.threads = to_number(args.value(flag), flag, 1, 256);
        } else if (flag == "--max-clients") {
            cfg.max_clients = to_number(args.value(flag), flag, 1, 65535);
        } else if (flag == "--outbound-capacity") {
            cfg.outbound_capacity = to_number(args.value(flag), flag, 1, 1u << 20);
        } else if (flag == "--overflow") {
            const std::string v = args.value(flag);
            if (!chat::parse_overflow_policy(v, cfg.overflow_policy)) {
                throw std::invalid_argument("unknown overflow policy: " + v);
            }
        } else if (flag == "--join-timeout-ms") {
            cfg.join_timeout = to_millis(args.value(flag), flag);
        } else if (flag == "--write-timeout-ms") {
            cfg.write_timeout = to_millis(args.value(flag), flag);
        } else if (flag == "--log-level") {
            cfg.log_level = to_level(args.value(flag));
        } else {
            throw std::invalid_argument("unknown option: " + std::string(flag));
        }
    }

    if (cfg.discovery_enabled && cfg.discovery_port != 0 && cfg.discovery_port == cfg.chat_port) {
        throw std::invalid_argument("discovery port must differ from chat port");
    }
    return cfg;
}

ClientConfig parse_client_args(int argc, const char* const argv[]) {
    ClientConfig cfg;
    cfg.log_level = util::Level::Warn;

    ArgCursor args(argc, argv);
    std::string_view flag;
    while (args.next(flag)) {
        if (flag == "-h" || flag == "--help") {
            cfg.show_help = true;
        } else if (flag == "-n" || flag == "--name") {
            cfg.name = args.value(flag);
        } else if (flag == "-H" || flag == "--host") {
            cfg.server_host = args.value(flag);
        } else if (flag == "-p" || flag == "--port") {
            cfg.chat_port = to_port(args.value(flag), flag);
        } else if (flag == "--discovery-port") {
            cfg.discovery_port = to_port(args.value(flag), flag);
        } else if (flag == "--no-discovery") {
            cfg.discovery_enabled = false;
        } else if (flag == "--discovery-timeout-ms") {
            cfg.discovery_timeout = to_millis(args.value(flag), flag);
        } else if (flag == "--no-color") {
            cfg.color = false;
        } else if (flag == "--log-level") {
            cfg.log_level = to_level(args.value(flag));
        } else {
            throw std::invalid_argument("unknown option: " + std::string(flag));
        }
    }

    if (!cfg.show_help && cfg.name.empty()) {
        throw std::invalid_argument("a display name is required (--name)");
    }
    if (!cfg.discovery_enabled && cfg.server_host.empty()) {
        cfg.server_host = "127.0.0.1";
    }
    return cfg;
}

std::string server_usage(const std::string& program) {
    return "usage: " + program + " [options]\n"
           "  --host ADDR               listen address (0.0.0.0)\n"
           "  -p, --port N              chat port (32500)\n"
           "  --discovery-port N        discovery port (32501)\n"
           "  --no-discovery            do not answer discovery requests\n"
           "  --advertise ADDR          address to advertise in discovery responses\n"
           "  --threads N               worker threads (hardware concurrency)\n"
           "  --max-clients N           open connections allowed at once (100)\n"
           "  --outbound-capacity N     frames buffered per client (256)\n"
           "  --overflow POLICY         drop-oldest | disconnect (drop-oldest)\n"
           "  --join-timeout-ms N       time allowed for the join handshake (10000)\n"
           "  --write-timeout-ms N      time allowed for one socket write (10000)\n"
           "  --log-level LEVEL         debug | info | warn | error (info)\n";
}

std::string client_usage(const std::string& program) {
    return "usage: " + program + " --name NAME [options]\n"
           "  -n, --name NAME           display name\n"
           "  -H, --host ADDR           server address, used if discovery is off or fails\n"
           "  -p, --port N              chat port (32500)\n"
           "  --discovery-port N        discovery port (32501)\n"
           "  --no-discovery            connect to --host directly (127.0.0.1)\n"
           "  --discovery-timeout-ms N  how long to wait for a server (3000)\n"
           "  --no-color                plain output\n"
           "  --log-level LEVEL         debug | info | warn | error (warn)\n";
}

} // namespace lanchat::app
