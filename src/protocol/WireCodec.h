#pragma once

#include "protocol/Packet.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace lanchat::protocol {

// Frame layout: 4-byte big-endian body length, then a JSON object body.
static constexpr std::size_t kHeaderSize = 4;
static constexpr std::size_t kMaxBodySize = 64 * 1024;
static constexpr std::size_t kMaxTextLen = 4096;

enum class DecodeStatus {
    Complete,    // `out` holds a packet, `consumed` bytes belong to it
    Incomplete,  // need more bytes, nothing consumed
    Malformed,   // stream is corrupt, caller should drop the connection
};

// Welcome and roster lists that would not fit are cut short, with the number
// of names left out in `more`. Throws std::length_error if any other body
// would exceed kMaxBodySize.
std::string encode(const Packet& packet);

// Decodes the first frame found at the front of `bytes`.
DecodeStatus decode(std::string_view bytes, Packet& out, std::size_t& consumed);

} // namespace lanchat::protocol
