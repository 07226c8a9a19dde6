#include "poll_gateway.h"
#include "constants.h"
#include "logger.h"
#include "signal_codec.h"

#include <sstream>

namespace {

std::vector<std::string> split_path(const std::string& target) {
    std::string path = target.substr(0, target.find('?'));
    std::vector<std::string> parts;
    std::istringstream in(path);
    std::string part;
    while (std::getline(in, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

nlohmann::json signals_to_json(const std::vector<Signal>& signals) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& s : signals) {
        arr.push_back(signal_codec::signal_to_json(s));
    }
    return arr;
}

} // namespace

PollGateway::PollGateway(ISessionCoordinator& coordinator)
    : m_coordinator(coordinator) {}

GatewayResponse PollGateway::error(int status, const std::string& message) {
    GatewayResponse response;
    response.status = status;
    response.body = json{{"error", message}};
    return response;
}

GatewayResponse PollGateway::success() {
    GatewayResponse response;
    response.body = json{{"success", true}};
    return response;
}

GatewayResponse PollGateway::handle(const std::string& method, const std::string& target, const std::string& body) {
    json parsed = json::object();
    if (!body.empty()) {
        parsed = json::parse(body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            LOG_WARN("GW: Rejecting malformed body for " + method + " " + target);
            return error(400, "Malformed JSON body");
        }
    }

    const std::vector<std::string> parts = split_path(target);

    if (method == "GET" && parts.size() == 1 && parts[0] == "health") {
        GatewayResponse response;
        response.body = json{{"status", "ok"}, {"rooms", m_coordinator.roomCount()}};
        return response;
    }

    if (parts.size() < 2 || parts[0] != "api" || parts[1] != "rooms") {
        return error(404, "Not found");
    }

    if (parts.size() == 2) {
        if (method != "POST") return error(405, "Method not allowed");
        GatewayResponse response;
        response.body = json{{"roomId", m_coordinator.createRoomId()}};
        return response;
    }

    return routeRoom(method, parts, parsed);
}

GatewayResponse PollGateway::routeRoom(const std::string& method, const std::vector<std::string>& parts,
                                       const json& body) {
    const std::string& roomId = parts[2];

    if (parts.size() == 3) {
        if (method != "GET") return error(405, "Method not allowed");
        const RoomStatus status = m_coordinator.roomStatus(roomId);
        GatewayResponse response;
        if (status.exists && status.has_host) {
            response.body = json{{"exists", true}, {"hasHost", true}, {"fileCount", status.file_count}};
        } else {
            response.body = json{{"exists", false}, {"hasHost", false}};
        }
        return response;
    }

    const std::string& action = parts[3];

    if (method == "GET") {
        if (parts.size() == 5 && action == "host" && parts[4] == "poll") {
            return hostPoll(roomId);
        }
        if (parts.size() == 6 && action == "client" && parts[5] == "poll") {
            return clientPoll(roomId, parts[4]);
        }
        return error(404, "Not found");
    }

    if (method != "POST" || parts.size() != 4) {
        return error(404, "Not found");
    }

    if (action == "host") return registerHost(roomId, body);
    if (action == "files") return setFiles(roomId, body);
    if (action == "join") return join(roomId, body);
    if (action == "signal") return signal(roomId, body);
    if (action == "request-file") return requestFile(roomId, body);
    if (action == "download-complete") return downloadComplete(roomId, body);
    if (action == "leave") return leave(roomId, body);
    if (action == "close") return close(roomId);
    return error(404, "Not found");
}

GatewayResponse PollGateway::registerHost(const std::string& roomId, const json& body) {
    const std::string hostId = signal_codec::string_field(body, "hostId");
    if (hostId.empty()) {
        return error(400, "hostId required");
    }
    m_coordinator.registerHost(roomId, hostId);
    GatewayResponse response;
    response.body = json{{"success", true}, {"roomId", roomId}};
    return response;
}

GatewayResponse PollGateway::hostPoll(const std::string& roomId) {
    HostPollResult result = m_coordinator.hostPoll(roomId);
    if (result.status != CoordinatorStatus::OK) {
        return error(404, "Room not found");
    }
    GatewayResponse response;
    response.body = json{
        {"signals", signals_to_json(result.signals)},
        {"clientCount", result.client_count},
        {"peerCounts", signal_codec::counts_to_json(result.peer_counts)},
        {"clients", result.clients}
    };
    return response;
}

GatewayResponse PollGateway::setFiles(const std::string& roomId, const json& body) {
    std::vector<FileDescriptor> files;
    std::string parse_error;
    auto it = body.find("files");
    if (it == body.end() || !signal_codec::files_from_json(*it, &files, &parse_error)) {
        return error(400, parse_error.empty() ? "files required" : parse_error);
    }
    if (m_coordinator.setFiles(roomId, files) != CoordinatorStatus::OK) {
        return error(404, "Room not found");
    }
    if (m_observer) m_observer->onFilesChanged(roomId);
    return success();
}

GatewayResponse PollGateway::join(const std::string& roomId, const json& body) {
    const std::string clientId = signal_codec::string_field(body, "clientId");
    if (clientId.empty()) {
        return error(400, "clientId required");
    }
    JoinResult result = m_coordinator.joinClient(roomId, clientId);
    if (result.status != CoordinatorStatus::OK) {
        return error(404, "Room not found or host offline");
    }
    if (m_observer) m_observer->onMembershipChanged(roomId, clientId, true);

    GatewayResponse response;
    response.body = json{
        {"success", true},
        {"files", signal_codec::files_to_json(result.files)},
        {"filesVersion", result.files_version},
        {"hostId", result.host_id},
        {"hostOnline", true}
    };
    return response;
}

GatewayResponse PollGateway::clientPoll(const std::string& roomId, const std::string& clientId) {
    ClientPollResult result = m_coordinator.clientPoll(roomId, clientId);
    if (result.status == CoordinatorStatus::ROOM_NOT_FOUND) {
        GatewayResponse response = error(404, "Room not found");
        response.body["hostOnline"] = false;
        return response;
    }
    GatewayResponse response;
    response.body = json{
        {"signals", signals_to_json(result.signals)},
        {"files", signal_codec::files_to_json(result.files)},
        {"filesVersion", result.files_version},
        {"filesUpdatedAt", result.files_updated_at_ms},
        {"hostOnline", result.host_online},
        {"hostId", result.host_id}
    };
    return response;
}

GatewayResponse PollGateway::signal(const std::string& roomId, const json& body) {
    Signal sig;
    std::string parse_error;
    if (!signal_codec::signal_from_json(body, &sig, &parse_error)) {
        return error(400, parse_error);
    }
    if (sig.from_id.empty() || sig.to_id.empty()) {
        return error(400, "fromId and toId required");
    }
    RelayResult result = m_coordinator.relaySignal(roomId, std::move(sig));
    if (result.status != CoordinatorStatus::OK) {
        return error(404, "Room not found");
    }
    if (result.queued && m_observer) {
        m_observer->onMailboxChanged(roomId, result.target_id);
    }
    return success();
}

GatewayResponse PollGateway::requestFile(const std::string& roomId, const json& body) {
    const std::string clientId = signal_codec::string_field(body, "clientId");
    const std::string fileId = signal_codec::string_field(body, "fileId");
    if (clientId.empty() || fileId.empty()) {
        return error(400, "clientId and fileId required");
    }
    DownloadUpdate update = m_coordinator.requestFile(roomId, clientId, fileId);
    if (update.status != CoordinatorStatus::OK) {
        return error(404, "Room not found");
    }
    if (m_observer) {
        m_observer->onMailboxChanged(roomId, update.host_id);
        m_observer->onDownloadsChanged(roomId, update.host_id, update.counts);
    }
    return success();
}

GatewayResponse PollGateway::downloadComplete(const std::string& roomId, const json& body) {
    const std::string clientId = signal_codec::string_field(body, "clientId");
    const std::string fileId = signal_codec::string_field(body, "fileId");
    DownloadUpdate update = m_coordinator.recordDownloadComplete(roomId, fileId, clientId);
    if (update.status != CoordinatorStatus::OK) {
        return error(404, "Room not found");
    }
    if (m_observer) m_observer->onDownloadsChanged(roomId, update.host_id, update.counts);
    return success();
}

GatewayResponse PollGateway::leave(const std::string& roomId, const json& body) {
    const std::string clientId = signal_codec::string_field(body, "clientId");
    LeaveResult result = m_coordinator.leaveClient(roomId, clientId);
    if (result.removed && m_observer) {
        m_observer->onMembershipChanged(roomId, clientId, false);
        m_observer->onDownloadsChanged(roomId, result.host_id, result.counts);
    }
    // Leaving an unknown room is not an error for the caller.
    return success();
}

GatewayResponse PollGateway::close(const std::string& roomId) {
    CloseResult result = m_coordinator.closeRoom(roomId);
    if (result.existed && m_observer) {
        m_observer->onRoomClosed(roomId, result.host_id, result.clients);
    }
    return success();
}
