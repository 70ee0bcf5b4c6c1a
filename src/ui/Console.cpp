#include "ui/Console.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace lanchat::ui {

namespace {

constexpr const char* kGreen = "\033[92m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan = "\033[36m";
constexpr const char* kRed = "\033[31m";
constexpr const char* kReset = "\033[39m";

std::string clock_of(std::int64_t unix_seconds) {
    const auto t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

std::string join(const std::vector<std::string>& users, std::size_t more) {
    std::string out;
    for (const auto& u : users) {
        if (!out.empty()) out += ", ";
        out += u;
    }
    if (more != 0) out += " (+" + std::to_string(more) + " more)";
    return out;
}

} // namespace

Console::Console(std::ostream& out, bool color) : out_(out), color_(color) {}

std::string Console::paint(const char* color, const std::string& text) const {
    if (!color_) return text;
    return color + text + kReset;
}

std::string Console::render(const chat::ClientEvent& event) const {
    using Kind = chat::ClientEvent::Kind;
    switch (event.kind) {
        case Kind::Joined:
            return paint(kCyan, "joined as " + event.text + " (online: " + join(event.users, event.more) + ")");
        case Kind::Message:
            return paint(kGreen, "[" + clock_of(event.message.timestamp) + "] " +
                                     event.message.sender + ": " + event.message.text);
        case Kind::Notice:
            return paint(kYellow, "* " + event.text);
        case Kind::Roster:
            return paint(kCyan, "online: " + join(event.users, event.more));
        case Kind::Error:
            return paint(kRed, "error: " + (event.text.empty() ? event.error.message() : event.text));
        case Kind::Closed:
            return "disconnected";
    }
    return {};
}

void Console::print(const chat::ClientEvent& event) {
    out_ << render(event) << std::endl;
}

void Console::print_error(const std::string& text) {
    out_ << paint(kRed, text) << std::endl;
}

void Console::drain(chat::EventStream& events) {
    chat::ClientEvent event;
    while (events.next(event)) print(event);
}

} // namespace lanchat::ui
