#ifndef TRANSFER_TYPES_H
#define TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <string>
#include <tuple>

/**
 * TRANSFER TYPES AND COMMON DEFINITIONS
 *
 * Shared by the scheduler (sender side), the receiver and the session agent.
 */

// ============================================================================
// KEYS
// ============================================================================

/**
 * One transfer per (remote peer, file). A peer may fetch several files at
 * once, so the peer id alone never identifies a transfer.
 */
struct TransferKey {
    std::string peer_id;
    std::string file_id;

    bool operator<(const TransferKey& other) const {
        return std::tie(peer_id, file_id) < std::tie(other.peer_id, other.file_id);
    }
    bool operator==(const TransferKey& other) const {
        return peer_id == other.peer_id && file_id == other.file_id;
    }

    std::string toString() const { return peer_id + "-" + file_id; }
};

// ============================================================================
// ENUMS
// ============================================================================

enum class TransferState {
    PENDING,        // Registered, waiting for an open channel
    SENDING,        // Metadata sent, chunks flowing
    FINALIZING,     // All bytes queued, waiting to send the completion marker
    COMPLETED,
    FAILED
};

enum class TransferError {
    CHANNEL_FAILURE,    // Channel closed or failed mid-transfer
    TRUNCATED,          // Completion marker before the declared size arrived
    MISSING_METADATA,   // Completion marker without a preceding metadata message
    PROTOCOL,           // Undecodable control message
    CANCELLED,          // Peer left, or transfer removed locally
    SOURCE_UNREADABLE,  // Sender could not read its byte source
    SINK_FAILURE        // Receiver could not hand the artifact off
};

inline const char* transfer_error_to_string(TransferError error) {
    switch (error) {
        case TransferError::CHANNEL_FAILURE: return "CHANNEL_FAILURE";
        case TransferError::TRUNCATED: return "TRUNCATED";
        case TransferError::MISSING_METADATA: return "MISSING_METADATA";
        case TransferError::PROTOCOL: return "PROTOCOL";
        case TransferError::CANCELLED: return "CANCELLED";
        case TransferError::SOURCE_UNREADABLE: return "SOURCE_UNREADABLE";
        case TransferError::SINK_FAILURE: return "SINK_FAILURE";
    }
    return "UNKNOWN";
}

// ============================================================================
// STRUCTURES
// ============================================================================

struct TransferStats {
    uint64_t bytes = 0;
    uint64_t chunks = 0;
    std::chrono::milliseconds elapsed{0};

    double megabytesPerSecond() const {
        const double secs = static_cast<double>(elapsed.count()) / 1000.0;
        if (secs <= 0.0) return 0.0;
        return (static_cast<double>(bytes) / (1024.0 * 1024.0)) / secs;
    }
};

#endif // TRANSFER_TYPES_H
