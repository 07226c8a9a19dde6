#include "server_endpoint.h"

#include <cctype>

bool parse_server_url(const std::string& url, ServerEndpoint* out, std::string* error) {
    std::string rest = url;
    const auto scheme = rest.find("://");
    if (scheme != std::string::npos) {
        const std::string name = rest.substr(0, scheme);
        if (name != "http" && name != "ws") {
            if (error) *error = "unsupported scheme '" + name + "'";
            return false;
        }
        rest = rest.substr(scheme + 3);
    }
    const auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    ServerEndpoint endpoint;
    const auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        endpoint.host = rest.substr(0, colon);
        endpoint.port = rest.substr(colon + 1);
        if (endpoint.port.empty()) {
            if (error) *error = "empty port in '" + url + "'";
            return false;
        }
        for (char c : endpoint.port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                if (error) *error = "invalid port in '" + url + "'";
                return false;
            }
        }
    } else {
        endpoint.host = rest;
    }
    if (endpoint.host.empty()) {
        if (error) *error = "no host in '" + url + "'";
        return false;
    }
    if (out) *out = std::move(endpoint);
    return true;
}
