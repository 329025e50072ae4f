/**
 * @file HttpEndpoint.hpp
 * @brief Splits a configured base URL into an httplib origin and a path prefix.
 */

#pragma once
#include <optional>
#include <string>

namespace tidyfile::infrastructure {

struct HttpEndpoint {
    std::string origin;      ///< "scheme://host[:port]", accepted by httplib::Client.
    std::string pathPrefix;  ///< "" or "/v1" style prefix without trailing slash.

    /** @return nullopt if the URL has no http/https scheme or no host. */
    static std::optional<HttpEndpoint> Parse(const std::string& baseUrl);

    std::string path(const std::string& suffix) const { return pathPrefix + suffix; }
};

} // namespace tidyfile::infrastructure
