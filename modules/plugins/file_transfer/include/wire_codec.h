#pragma once

#include "message_types.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace wire {

inline constexpr size_t kHeaderSize = 5;

// Largest frame a channel accepts; a chunk plus generous room for control text.
inline constexpr uint32_t kMaxMessageSize = 4u * 1024u * 1024u;

// [type: 1 byte][length: 4 bytes big-endian][payload: length bytes]
std::string encode_message(MessageType type, std::string_view payload);

// Parses only the 5-byte header. Returns false on unknown type or oversize length.
bool decode_header(std::string_view header, MessageType& type, uint32_t& length);

// Decodes a complete frame into type and payload. Returns false if malformed or too large.
bool decode_message(std::string_view data, MessageType& type, std::string_view& payload);

} // namespace wire
