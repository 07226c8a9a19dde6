#ifndef CHANNEL_MESSAGES_H
#define CHANNEL_MESSAGES_H

#include <cstdint>
#include <string>

// Text control messages exchanged on a data channel around the binary chunks.
namespace channel_msg {

constexpr const char* kDefaultMimeType = "application/octet-stream";

struct ControlMessage {
    enum class Kind { METADATA, COMPLETE };

    Kind kind = Kind::METADATA;
    std::string name;
    uint64_t size = 0;
    std::string mime_type;
};

// {"type":"metadata","name":...,"size":...,"mimeType":...}
std::string encode_metadata(const std::string& name, uint64_t size, const std::string& mime_type);

// {"type":"complete"}
std::string encode_complete();

bool decode_control(const std::string& text, ControlMessage* out, std::string* error = nullptr);

} // namespace channel_msg

#endif // CHANNEL_MESSAGES_H
