#pragma once

#include "http_client.hpp"
#include "models.hpp"

#include <memory>

namespace combined_api {

/// Loads a Todo from {base}/todos/{id} through the shared HttpClient.
class RemoteFetcher {
public:
    RemoteFetcher(std::shared_ptr<const HttpClient> client,
                  bool verbose = false);

    /// One GET per call; no caching, no retry.
    /// @throws RemoteFetchError on network failure, non-2xx status or a body
    ///         that is not a well-formed todo object.
    Todo fetchRemoteItem(int id) const;

private:
    std::shared_ptr<const HttpClient> mClient;
    bool                              mVerbose;
};

} // namespace combined_api
