#include "router.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/verb.hpp>

#include <cctype>
#include <charconv>
#include <iostream>

namespace beast = boost::beast;
namespace http  = beast::http;

namespace combined_api {

namespace {

constexpr const char* kShortPrefix      = "/combined";
constexpr const char* kControllerPrefix = "/api/asyncdemo/combined";

// If @p path is "<prefix>" or "<prefix>/<rest>", store <rest> and return true.
bool matchPrefix(const std::string& path,
                 const std::string& prefix,
                 bool ignoreCase,
                 std::string& rest) {
    if (path.size() < prefix.size()) {
        return false;
    }
    const std::string head = path.substr(0, prefix.size());
    if (ignoreCase ? !beast::iequals(head, prefix) : head != prefix) {
        return false;
    }
    if (path.size() == prefix.size()) {
        rest.clear();
        return true;
    }
    if (path[prefix.size()] != '/') {
        return false;
    }
    rest = path.substr(prefix.size() + 1);
    return true;
}

} // namespace

Router::Router(const CombinedHandler& handler, bool verbose)
    : mHandler(handler)
    , mVerbose(verbose) {}

std::optional<int> Router::parseId(const std::string& segment) {
    if (segment.empty()) {
        return std::nullopt;
    }
    for (char c : segment) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    int value = 0;
    const char* first = segment.data();
    const char* last  = segment.data() + segment.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value <= 0) {
        return std::nullopt;
    }
    return value;
}

HttpResponse Router::route(const HttpRequest& req) const {
    std::string path(req.target());
    auto query = path.find('?');
    if (query != std::string::npos) {
        path.erase(query);
    }

    std::string rest;
    const bool matched =
        matchPrefix(path, kShortPrefix, /*ignoreCase=*/false, rest) ||
        matchPrefix(path, kControllerPrefix, /*ignoreCase=*/true, rest);

    if (!matched || rest.find('/') != std::string::npos) {
        return makeJsonResponse(req, 404, errorBody("Not found").dump());
    }

    if (req.method() != http::verb::get) {
        auto res = makeJsonResponse(req, 405,
                                    errorBody("Method not allowed").dump());
        res.set(http::field::allow, "GET");
        return res;
    }

    auto id = parseId(rest);
    if (!id) {
        return makeJsonResponse(
            req, 400,
            errorBody(rest.empty() ? "Missing id"
                                   : "Id must be a positive integer").dump());
    }

    try {
        const auto result = mHandler.handle(*id);
        if (mVerbose) {
            std::cerr << "[Router] GET " << path << " -> 200\n";
        }
        return makeJsonResponse(req, 200, toJson(result).dump());
    } catch (const UpstreamError& e) {
        std::cerr << "[Router] GET " << path << " -> 502: " << e.what() << "\n";
        return makeJsonResponse(req, 502,
                                errorBody("Upstream request failed").dump());
    } catch (const std::exception& e) {
        std::cerr << "[Router] GET " << path << " -> 500: " << e.what() << "\n";
        return makeJsonResponse(req, 500,
                                errorBody("Internal server error").dump());
    }
}

} // namespace combined_api
