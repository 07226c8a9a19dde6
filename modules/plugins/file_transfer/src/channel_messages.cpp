#include "channel_messages.h"

#include <nlohmann/json.hpp>

namespace channel_msg {

using json = nlohmann::json;

namespace {
std::string string_or_empty(const json& obj, const char* key) {
    auto it = obj.find(key);
    return (it != obj.end() && it->is_string()) ? it->get<std::string>() : std::string();
}
} // namespace

std::string encode_metadata(const std::string& name, uint64_t size, const std::string& mime_type) {
    json j;
    j["type"] = "metadata";
    j["name"] = name;
    j["size"] = size;
    j["mimeType"] = mime_type;
    return j.dump();
}

std::string encode_complete() {
    return json{{"type", "complete"}}.dump();
}

bool decode_control(const std::string& text, ControlMessage* out, std::string* error) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        if (error) *error = "control message is not a JSON object";
        return false;
    }
    const auto type = j.find("type");
    if (type == j.end() || !type->is_string()) {
        if (error) *error = "control message without type";
        return false;
    }

    ControlMessage msg;
    const std::string kind = type->get<std::string>();
    if (kind == "complete") {
        msg.kind = ControlMessage::Kind::COMPLETE;
    } else if (kind == "metadata") {
        msg.kind = ControlMessage::Kind::METADATA;
        msg.name = string_or_empty(j, "name");
        const auto size = j.find("size");
        // Integers only: a float or negative size never reaches get<uint64_t>().
        if (size == j.end() || !size->is_number_integer() ||
            (!size->is_number_unsigned() && size->get<int64_t>() < 0)) {
            if (error) *error = "metadata without a valid size";
            return false;
        }
        msg.size = size->get<uint64_t>();
        msg.mime_type = string_or_empty(j, "mimeType");
    } else {
        if (error) *error = "unknown control type '" + kind + "'";
        return false;
    }
    if (out) *out = std::move(msg);
    return true;
}

} // namespace channel_msg
