#pragma once

#include "combined_handler.hpp"
#include "http_message.hpp"

#include <optional>
#include <string>

namespace combined_api {

/// Maps inbound requests onto the combined handler.
///
/// Routes:
///   GET /combined/{id}
///   GET /api/asyncdemo/combined/{id}   (matched case-insensitively)
class Router {
public:
    explicit Router(const CombinedHandler& handler, bool verbose = false);

    /// Handler failures become 502 (upstream) or 500 (anything else).
    HttpResponse route(const HttpRequest& req) const;

    HttpResponse operator()(const HttpRequest& req) const { return route(req); }

    /// Strict positive-int parse of a path segment; std::nullopt otherwise.
    static std::optional<int> parseId(const std::string& segment);

private:
    const CombinedHandler& mHandler;
    bool                   mVerbose;
};

} // namespace combined_api
