#ifndef COORDINATOR_OBSERVER_H
#define COORDINATOR_OBSERVER_H

#include "room_types.h"

#include <string>
#include <vector>

// Notified by a gateway after it mutated the shared coordinator, so the other
// transport can push the change to peers connected through it.
class ICoordinatorObserver {
public:
    virtual ~ICoordinatorObserver() = default;

    virtual void onMailboxChanged(const std::string& roomId, const std::string& identity) = 0;
    virtual void onFilesChanged(const std::string& roomId) = 0;
    virtual void onMembershipChanged(const std::string& roomId, const std::string& clientId, bool joined) = 0;
    virtual void onDownloadsChanged(const std::string& roomId, const std::string& hostId,
                                    const DownloadCounts& counts) = 0;
    virtual void onRoomClosed(const std::string& roomId, const std::string& hostId,
                              const std::vector<std::string>& clients) = 0;
};

#endif // COORDINATOR_OBSERVER_H
