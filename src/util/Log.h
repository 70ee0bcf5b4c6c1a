#pragma once

#include <string_view>

namespace lanchat::util {

enum class Level { Debug, Info, Warn, Error };

bool parse_level(std::string_view text, Level& out) noexcept;

// Initial level comes from LANCHAT_LOG_LEVEL (debug, info, warn, error), default info.
void set_level(Level level) noexcept;
Level level() noexcept;

// Writes "<date time> [LEVEL] [tag] msg" to stderr. Safe to call from any thread.
void log(Level level, std::string_view tag, std::string_view msg);

} // namespace lanchat::util
