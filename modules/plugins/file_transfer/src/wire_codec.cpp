#include "wire_codec.h"

namespace {

bool known_frame_type(uint8_t raw) {
    switch (static_cast<MessageType>(raw)) {
        case MessageType::CHANNEL_HELLO:
        case MessageType::CHANNEL_TEXT:
        case MessageType::CHANNEL_BINARY:
        case MessageType::CHANNEL_CLOSE:
            return true;
    }
    return false;
}

void put_be32(std::string& out, uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>((value >> shift) & 0xFF));
    }
}

uint32_t get_be32(std::string_view in) {
    uint32_t value = 0;
    for (size_t i = 0; i < 4; ++i) {
        value = (value << 8) | static_cast<uint8_t>(in[i]);
    }
    return value;
}

} // namespace

namespace wire {

std::string encode_message(MessageType type, std::string_view payload) {
    std::string frame;
    frame.reserve(kHeaderSize + payload.size());
    frame.push_back(static_cast<char>(type));
    put_be32(frame, static_cast<uint32_t>(payload.size()));
    frame.append(payload.data(), payload.size());
    return frame;
}

bool decode_header(std::string_view header, MessageType& type, uint32_t& length) {
    if (header.size() < kHeaderSize) return false;

    const uint8_t raw = static_cast<uint8_t>(header[0]);
    const uint32_t declared = get_be32(header.substr(1, 4));
    if (!known_frame_type(raw) || declared > kMaxMessageSize) return false;

    type = static_cast<MessageType>(raw);
    length = declared;
    return true;
}

bool decode_message(std::string_view data, MessageType& type, std::string_view& payload) {
    uint32_t length = 0;
    if (!decode_header(data, type, length) || data.size() - kHeaderSize < length) {
        return false;
    }
    payload = data.substr(kHeaderSize, length);
    return true;
}

} // namespace wire
