#include "infrastructure/HttpEndpoint.hpp"

namespace tidyfile::infrastructure {

std::optional<HttpEndpoint> HttpEndpoint::Parse(const std::string& baseUrl) {
    std::string scheme;
    if (baseUrl.rfind("http://", 0) == 0) {
        scheme = "http://";
    } else if (baseUrl.rfind("https://", 0) == 0) {
        scheme = "https://";
    } else {
        return std::nullopt;
    }

    std::string rest = baseUrl.substr(scheme.size());
    auto slash = rest.find('/');
    std::string host = rest.substr(0, slash);
    if (host.empty()) {
        return std::nullopt;
    }

    HttpEndpoint endpoint;
    endpoint.origin = scheme + host;
    if (slash != std::string::npos) {
        endpoint.pathPrefix = rest.substr(slash);
        while (!endpoint.pathPrefix.empty() && endpoint.pathPrefix.back() == '/') {
            endpoint.pathPrefix.pop_back();
        }
    }
    return endpoint;
}

} // namespace tidyfile::infrastructure
