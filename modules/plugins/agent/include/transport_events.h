#ifndef TRANSPORT_EVENTS_H
#define TRANSPORT_EVENTS_H

#include "room_types.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

// --- The room's file list changed (or a poll reported its current stamp) ---
struct FilesUpdatedEvent {
    std::vector<FileDescriptor> files;
    uint64_t files_version = 0;
    int64_t files_updated_at_ms = 0;    // 0 when the transport does not report it
};

// --- Host: a client asked for a file ---
struct FileRequestedEvent {
    std::string client_id;
    std::string file_id;
};

// --- offer / answer / ice-candidate from another peer ---
struct NegotiationSignalEvent {
    std::string sender_id;
    SignalKind kind = SignalKind::OFFER;
    OpaquePayload payload;
    std::string file_id;
};

// --- Host: per-file count of active downloads ---
struct PeerCountsEvent {
    DownloadCounts counts;
};

// --- Host: number of clients in the room ---
struct ClientCountEvent {
    size_t count = 0;
};

// --- Host: full client list, reported by every host poll ---
struct ClientListEvent {
    std::vector<std::string> clients;
};

// --- Host: a client left or was evicted ---
struct ClientLeftEvent {
    std::string client_id;
};

// --- The host went away or the room no longer exists (an evicted host hears this too) ---
struct HostDisconnectedEvent {
    std::string room_id;
    bool room_missing = false;
};

// --- The coordinator refused an operation ---
struct RoomErrorEvent {
    std::string message;
};

using TransportEvent = std::variant<
    FilesUpdatedEvent,
    FileRequestedEvent,
    NegotiationSignalEvent,
    PeerCountsEvent,
    ClientCountEvent,
    ClientListEvent,
    ClientLeftEvent,
    HostDisconnectedEvent,
    RoomErrorEvent
>;

// Maps a relayed signal to the event a receiver acts on.
inline TransportEvent event_from_signal(const Signal& signal) {
    if (signal.kind == SignalKind::FILE_REQUEST) {
        return FileRequestedEvent{signal.from_id, signal.file_id};
    }
    return NegotiationSignalEvent{signal.from_id, signal.kind, signal.payload, signal.file_id};
}

#endif // TRANSPORT_EVENTS_H
