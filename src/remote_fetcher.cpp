#include "remote_fetcher.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace combined_api {

RemoteFetcher::RemoteFetcher(std::shared_ptr<const HttpClient> client,
                             bool verbose)
    : mClient(std::move(client))
    , mVerbose(verbose)
{
    if (!mClient) {
        throw std::invalid_argument("RemoteFetcher requires an HttpClient");
    }
}

Todo RemoteFetcher::fetchRemoteItem(int id) const {
    const std::string path = "todos/" + std::to_string(id);

    HttpClient::Response resp;
    try {
        resp = mClient->get(path);
    } catch (const std::exception& e) {
        std::cerr << "[RemoteFetcher] GET " << path << " failed: "
                  << e.what() << "\n";
        throw RemoteFetchError(std::string("Request for ") + path +
                               " failed: " + e.what());
    }

    if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
        std::cerr << "[RemoteFetcher] GET " << path << " returned HTTP "
                  << resp.httpStatus << "\n";
        throw RemoteFetchError("Request for " + path + " returned HTTP " +
                               std::to_string(resp.httpStatus));
    }

    try {
        Todo todo = parseTodo(nlohmann::json::parse(resp.body));
        if (mVerbose) {
            std::cerr << "[RemoteFetcher] Got todo " << todo.id
                      << " (userId=" << todo.ownerId << ")\n";
        }
        return todo;
    } catch (const nlohmann::json::exception& e) {
        throw RemoteFetchError(std::string("Failed to parse JSON response: ") +
                               e.what());
    } catch (const std::runtime_error& e) {
        throw RemoteFetchError(std::string("Unexpected todo shape: ") +
                               e.what());
    }
}

} // namespace combined_api
