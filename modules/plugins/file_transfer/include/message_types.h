#pragma once

#include <cstdint>

// Frames carried on a direct TCP data channel.
enum class MessageType : uint8_t {
    CHANNEL_HELLO        = 0x01,   // connector -> acceptor, payload is the negotiation token
    CHANNEL_TEXT         = 0x02,   // control message (metadata / complete)
    CHANNEL_BINARY       = 0x03,   // file chunk
    CHANNEL_CLOSE        = 0x04
};
