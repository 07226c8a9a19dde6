#ifndef CHANNEL_NEGOTIATOR_H
#define CHANNEL_NEGOTIATOR_H

#include "data_channel.h"
#include "room_types.h"
#include "transfer_types.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct ChannelConfig {
    // First entry goes into the offer, the rest out as ice-candidate signals.
    std::vector<std::string> advertise_hosts{"127.0.0.1"};
    std::chrono::milliseconds connect_timeout{5000};
    size_t send_queue_limit = 16 * 1024 * 1024;

    static ChannelConfig fromConfigManager();
};

/**
 * Turns relayed offer / answer / ice-candidate signals into an open
 * DataChannel. Negotiation state is keyed by (remote peer, file); the same
 * two peers may negotiate one channel per file concurrently.
 *
 * Callbacks may run on the negotiator's own thread.
 */
class ChannelNegotiator {
public:
    using EmitSignal = std::function<void(SignalKind kind, const OpaquePayload& payload)>;
    using ChannelOpened = std::function<void(const std::shared_ptr<DataChannel>& channel)>;
    using NegotiationFailed = std::function<void(const std::string& reason)>;

    struct Callbacks {
        EmitSignal emit;
        ChannelOpened on_open;
        NegotiationFailed on_failed;
    };

    virtual ~ChannelNegotiator() = default;

    // Host side: produce an offer for the requesting peer.
    virtual void initiate(const TransferKey& key, Callbacks callbacks) = 0;

    // Both sides: a negotiation signal arrived from key.peer_id. Callbacks are
    // taken from the first signal that opens a negotiation.
    virtual void handleSignal(const TransferKey& key, SignalKind kind, const OpaquePayload& payload,
                              Callbacks callbacks) = 0;

    virtual void close(const TransferKey& key) = 0;
    virtual void closeAll() = 0;
};

#endif // CHANNEL_NEGOTIATOR_H
