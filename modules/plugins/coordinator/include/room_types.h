#ifndef ROOM_TYPES_H
#define ROOM_TYPES_H

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <set>
#include <string>
#include <vector>

// Negotiation payloads are carried as serialized text and never parsed by the relay.
using OpaquePayload = std::string;

enum class SignalKind {
    OFFER,
    ANSWER,
    ICE_CANDIDATE,
    FILE_REQUEST
};

struct Signal {
    std::string from_id;
    std::string to_id;          // peer identity, or HOST_TARGET
    SignalKind kind = SignalKind::OFFER;
    OpaquePayload payload;
    std::string file_id;
    int64_t timestamp_ms = 0;   // wall clock, stamped by the coordinator on relay
};

struct FileDescriptor {
    std::string id;             // unique within the room
    std::string name;
    uint64_t size = 0;
    std::string mime_type;

    bool operator==(const FileDescriptor& other) const {
        return id == other.id && name == other.name && size == other.size &&
               mime_type == other.mime_type;
    }
};

struct ClientSession {
    std::string client_id;
    std::chrono::steady_clock::time_point last_seen;
    std::deque<Signal> mailbox;
};

// fileId -> number of clients actively downloading it
using DownloadCounts = std::map<std::string, size_t>;

struct Room {
    std::string room_id;
    std::string host_id;
    std::chrono::steady_clock::time_point last_seen_host;

    std::vector<FileDescriptor> files;
    uint64_t files_version = 0;
    int64_t files_updated_at_ms = 0;

    std::map<std::string, ClientSession> clients;
    std::deque<Signal> host_mailbox;

    // Derived index; kept in step with join/leave/timeout.
    std::map<std::string, std::set<std::string>> active_downloads;
};

#endif // ROOM_TYPES_H
