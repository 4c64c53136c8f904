#pragma once

#include <string>

namespace combined_api {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "4000", etc.
    std::string target;   // path component (e.g. "/todos")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Join a base path and a relative path with exactly one '/' between them.
std::string joinPath(const std::string& base, const std::string& path);

} // namespace combined_api
