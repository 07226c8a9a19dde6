#ifndef POLL_GATEWAY_H
#define POLL_GATEWAY_H

#include "coordinator_observer.h"
#include "session_coordinator.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

struct GatewayResponse {
    int status = 200;
    nlohmann::json body;
};

/**
 * @brief Request/response adapter over the coordinator.
 *
 * Maps the REST routes of the poll transport onto coordinator calls. It knows
 * nothing about sockets: CoordinatorServer feeds it the method, target and body
 * of each HTTP request.
 */
class PollGateway {
public:
    explicit PollGateway(ISessionCoordinator& coordinator);

    // Optional; set before serving. Not owned.
    void setObserver(ICoordinatorObserver* observer) { m_observer = observer; }

    GatewayResponse handle(const std::string& method, const std::string& target, const std::string& body);

private:
    using json = nlohmann::json;

    GatewayResponse routeRoom(const std::string& method, const std::vector<std::string>& parts, const json& body);

    GatewayResponse registerHost(const std::string& roomId, const json& body);
    GatewayResponse hostPoll(const std::string& roomId);
    GatewayResponse setFiles(const std::string& roomId, const json& body);
    GatewayResponse join(const std::string& roomId, const json& body);
    GatewayResponse clientPoll(const std::string& roomId, const std::string& clientId);
    GatewayResponse signal(const std::string& roomId, const json& body);
    GatewayResponse requestFile(const std::string& roomId, const json& body);
    GatewayResponse downloadComplete(const std::string& roomId, const json& body);
    GatewayResponse leave(const std::string& roomId, const json& body);
    GatewayResponse close(const std::string& roomId);

    static GatewayResponse error(int status, const std::string& message);
    static GatewayResponse success();

    ISessionCoordinator& m_coordinator;
    ICoordinatorObserver* m_observer = nullptr;
};

#endif // POLL_GATEWAY_H
