#ifndef SIGNAL_CODEC_H
#define SIGNAL_CODEC_H

#include "room_types.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

// JSON shapes shared by the poll and push transports.
namespace signal_codec {

using json = nlohmann::json;

const char* kind_to_string(SignalKind kind);
bool kind_from_string(const std::string& text, SignalKind* out);

// Opaque payloads travel as a JSON string holding the exact bytes the sender
// gave; they are never parsed. A non-string value received from a client is
// re-serialized.
json payload_to_json(const OpaquePayload& payload);
OpaquePayload payload_from_json(const json& value);

// {fromId, toId, type, data, fileId, timestamp}
json signal_to_json(const Signal& signal);
bool signal_from_json(const json& value, Signal* out, std::string* error = nullptr);

// {id, name, size, type}
json file_to_json(const FileDescriptor& file);
bool file_from_json(const json& value, FileDescriptor* out, std::string* error = nullptr);
json files_to_json(const std::vector<FileDescriptor>& files);
bool files_from_json(const json& value, std::vector<FileDescriptor>* out, std::string* error = nullptr);

json counts_to_json(const DownloadCounts& counts);
DownloadCounts counts_from_json(const json& value);

// Returns the string member or "" when absent or of another type.
std::string string_field(const json& object, const char* key);

} // namespace signal_codec

#endif // SIGNAL_CODEC_H
