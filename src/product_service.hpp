#pragma once

#include "data_provider.hpp"
#include "models.hpp"
#include "remote_fetcher.hpp"

namespace combined_api {

/// The two latency-bound lookups the combined endpoint fans out to.
/// Implementations must be safe to call from several threads at once.
class ProductService {
public:
    virtual ~ProductService() = default;

    virtual Product fetchProduct(int id) = 0;

    /// @throws RemoteFetchError when the remote lookup fails.
    virtual Todo fetchTodo(int id) = 0;
};

/// Production service: simulated store plus the remote todo API.
class DefaultProductService : public ProductService {
public:
    DefaultProductService(DataProvider dataProvider,
                          RemoteFetcher remoteFetcher);

    Product fetchProduct(int id) override;
    Todo    fetchTodo(int id) override;

private:
    DataProvider  mDataProvider;
    RemoteFetcher mRemoteFetcher;
};

} // namespace combined_api
