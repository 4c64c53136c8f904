#pragma once

#include <stdexcept>
#include <string>

namespace combined_api {

/// The outbound call failed: network, timeout, non-2xx status or a body
/// that does not deserialize into a Todo.
class RemoteFetchError : public std::runtime_error {
public:
    explicit RemoteFetchError(const std::string& what)
        : std::runtime_error(what) {}
};

/// One of the concurrent branches of a combined request failed.
class UpstreamError : public std::runtime_error {
public:
    explicit UpstreamError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace combined_api
