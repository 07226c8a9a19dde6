#ifndef SERVER_ENDPOINT_H
#define SERVER_ENDPOINT_H

#include <string>

struct ServerEndpoint {
    std::string host;
    std::string port = "3001";
};

// Accepts "http://host:port", "ws://host:port", "host:port" or "host".
// Any path after the authority is ignored.
bool parse_server_url(const std::string& url, ServerEndpoint* out, std::string* error = nullptr);

#endif // SERVER_ENDPOINT_H
