#ifndef COORDINATOR_STATUS_H
#define COORDINATOR_STATUS_H

enum class CoordinatorStatus {
    OK,
    ROOM_NOT_FOUND,   // room absent, closed or evicted
    HOST_OFFLINE      // room exists but host liveness lapsed
};

inline const char* status_to_string(CoordinatorStatus status) {
    switch (status) {
        case CoordinatorStatus::OK: return "OK";
        case CoordinatorStatus::ROOM_NOT_FOUND: return "ROOM_NOT_FOUND";
        case CoordinatorStatus::HOST_OFFLINE: return "HOST_OFFLINE";
    }
    return "UNKNOWN";
}

#endif // COORDINATOR_STATUS_H
