#include "product_service.hpp"

#include <utility>

namespace combined_api {

DefaultProductService::DefaultProductService(DataProvider dataProvider,
                                             RemoteFetcher remoteFetcher)
    : mDataProvider(std::move(dataProvider))
    , mRemoteFetcher(std::move(remoteFetcher)) {}

Product DefaultProductService::fetchProduct(int id) {
    return mDataProvider.fetchProduct(id);
}

Todo DefaultProductService::fetchTodo(int id) {
    return mRemoteFetcher.fetchRemoteItem(id);
}

} // namespace combined_api
