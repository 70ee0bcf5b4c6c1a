#include "util/Log.h"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace lanchat::util {

namespace {

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "INFO";
}

Level initial_level() {
    Level lvl = Level::Info;
    if (const char* env = std::getenv("LANCHAT_LOG_LEVEL")) {
        parse_level(env, lvl);
    }
    return lvl;
}

std::atomic<Level>& current() {
    static std::atomic<Level> lvl{initial_level()};
    return lvl;
}

std::mutex& sink_mutex() {
    static std::mutex mu;
    return mu;
}

} // namespace

bool parse_level(std::string_view text, Level& out) noexcept {
    if (text == "debug") { out = Level::Debug; return true; }
    if (text == "info")  { out = Level::Info;  return true; }
    if (text == "warn")  { out = Level::Warn;  return true; }
    if (text == "error") { out = Level::Error; return true; }
    return false;
}

void set_level(Level level) noexcept { current().store(level); }

Level level() noexcept { return current().load(); }

void log(Level lvl, std::string_view tag, std::string_view msg) {
    if (lvl < level()) return;

    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%F %T") << " [" << level_name(lvl) << "] [" << tag << "] " << msg << "\n";

    std::lock_guard<std::mutex> lk(sink_mutex());
    std::cerr << oss.str();
}

} // namespace lanchat::util
