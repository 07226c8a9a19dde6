#include "signal_codec.h"

namespace signal_codec {

const char* kind_to_string(SignalKind kind) {
    switch (kind) {
        case SignalKind::OFFER: return "offer";
        case SignalKind::ANSWER: return "answer";
        case SignalKind::ICE_CANDIDATE: return "ice-candidate";
        case SignalKind::FILE_REQUEST: return "file-request";
    }
    return "unknown";
}

bool kind_from_string(const std::string& text, SignalKind* out) {
    SignalKind kind;
    if (text == "offer") kind = SignalKind::OFFER;
    else if (text == "answer") kind = SignalKind::ANSWER;
    else if (text == "ice-candidate") kind = SignalKind::ICE_CANDIDATE;
    else if (text == "file-request") kind = SignalKind::FILE_REQUEST;
    else return false;
    if (out) *out = kind;
    return true;
}

json payload_to_json(const OpaquePayload& payload) {
    return payload;
}

OpaquePayload payload_from_json(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return std::string();
    }
    // Structured data from a client that does not stringify its payloads.
    return value.dump();
}

std::string string_field(const json& object, const char* key) {
    if (!object.is_object()) return std::string();
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}

json signal_to_json(const Signal& signal) {
    json j;
    j["fromId"] = signal.from_id;
    if (!signal.to_id.empty()) {
        j["toId"] = signal.to_id;
    }
    j["type"] = kind_to_string(signal.kind);
    j["data"] = payload_to_json(signal.payload);
    j["fileId"] = signal.file_id;
    j["timestamp"] = signal.timestamp_ms;
    return j;
}

bool signal_from_json(const json& value, Signal* out, std::string* error) {
    if (!value.is_object()) {
        if (error) *error = "signal must be an object";
        return false;
    }
    Signal signal;
    if (!kind_from_string(string_field(value, "type"), &signal.kind)) {
        if (error) *error = "unknown signal type '" + string_field(value, "type") + "'";
        return false;
    }
    signal.from_id = string_field(value, "fromId");
    signal.to_id = string_field(value, "toId");
    signal.file_id = string_field(value, "fileId");
    auto data = value.find("data");
    if (data != value.end()) {
        signal.payload = payload_from_json(*data);
    }
    auto ts = value.find("timestamp");
    if (ts != value.end() && ts->is_number_integer()) {
        signal.timestamp_ms = ts->get<int64_t>();
    }
    if (out) *out = std::move(signal);
    return true;
}

json file_to_json(const FileDescriptor& file) {
    return json{{"id", file.id}, {"name", file.name}, {"size", file.size}, {"type", file.mime_type}};
}

bool file_from_json(const json& value, FileDescriptor* out, std::string* error) {
    if (!value.is_object()) {
        if (error) *error = "file entry must be an object";
        return false;
    }
    FileDescriptor file;
    file.id = string_field(value, "id");
    if (file.id.empty()) {
        if (error) *error = "file entry without id";
        return false;
    }
    file.name = string_field(value, "name");
    file.mime_type = string_field(value, "type");
    auto size = value.find("size");
    if (size != value.end() && !size->is_null()) {
        if (!size->is_number_integer() || (!size->is_number_unsigned() && size->get<int64_t>() < 0)) {
            if (error) *error = "invalid size for file " + file.id;
            return false;
        }
        file.size = size->get<uint64_t>();
    }
    if (out) *out = std::move(file);
    return true;
}

json files_to_json(const std::vector<FileDescriptor>& files) {
    json arr = json::array();
    for (const auto& f : files) {
        arr.push_back(file_to_json(f));
    }
    return arr;
}

bool files_from_json(const json& value, std::vector<FileDescriptor>* out, std::string* error) {
    if (!value.is_array()) {
        if (error) *error = "files must be an array";
        return false;
    }
    std::vector<FileDescriptor> files;
    files.reserve(value.size());
    for (const auto& entry : value) {
        FileDescriptor file;
        if (!file_from_json(entry, &file, error)) {
            return false;
        }
        files.push_back(std::move(file));
    }
    if (out) *out = std::move(files);
    return true;
}

json counts_to_json(const DownloadCounts& counts) {
    json obj = json::object();
    for (const auto& kv : counts) {
        obj[kv.first] = kv.second;
    }
    return obj;
}

DownloadCounts counts_from_json(const json& value) {
    DownloadCounts counts;
    if (!value.is_object()) return counts;
    for (auto it = value.begin(); it != value.end(); ++it) {
        const json& count = it.value();
        if (count.is_number_unsigned() || (count.is_number_integer() && count.get<int64_t>() >= 0)) {
            counts[it.key()] = count.get<size_t>();
        }
    }
    return counts;
}

} // namespace signal_codec
