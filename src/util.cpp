#include "util.hpp"

#include <stdexcept>

namespace combined_api {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find('/', hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
        if (parts.port.empty()) {
            throw std::invalid_argument("Invalid URL (empty port): " + url);
        }
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string joinPath(const std::string& base, const std::string& path) {
    auto baseEnd = base.find_last_not_of('/');
    std::string left = (baseEnd == std::string::npos)
                           ? std::string()
                           : base.substr(0, baseEnd + 1);

    auto pathStart = path.find_first_not_of('/');
    std::string right = (pathStart == std::string::npos)
                            ? std::string()
                            : path.substr(pathStart);

    return left + "/" + right;
}

} // namespace combined_api
