#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <cstddef>

// Coordinator
constexpr int DEFAULT_COORDINATOR_PORT = 3001;
constexpr int STALE_TIMEOUT_MS = 30000;        // peer liveness window
constexpr int SWEEP_INTERVAL_MS = 10000;       // staleness sweep cadence
constexpr size_t ROOM_ID_LENGTH = 8;

// Sentinel target naming "whoever currently hosts the room"
constexpr const char* HOST_TARGET = "host";

// Signaling
constexpr int POLL_INTERVAL_MS = 2000;
constexpr int REQUEST_POLL_DELAY_MS = 500;     // early poll after a file request

// Transfer
constexpr size_t CHUNK_SIZE = 64 * 1024;
constexpr size_t MAX_BUFFER_BYTES = 2 * 1024 * 1024;
constexpr int CHUNKS_PER_TICK = 16;
constexpr int SCHEDULER_TICK_MS = 1;
constexpr size_t COMPLETION_DRAIN_THRESHOLD = 1000;
constexpr int COMPLETION_BACKOFF_MS = 10;

// Data channel
constexpr size_t SEND_QUEUE_LIMIT_BYTES = 16 * 1024 * 1024;
constexpr int CHANNEL_CONNECT_TIMEOUT_MS = 5000;

#endif // CONSTANTS_H
