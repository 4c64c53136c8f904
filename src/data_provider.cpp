#include "data_provider.hpp"

#include <stdexcept>
#include <string>
#include <thread>

namespace combined_api {

DataProvider::DataProvider(std::chrono::milliseconds latency)
    : mLatency(latency)
{
    if (latency.count() < 0) {
        throw std::invalid_argument("Simulated latency must not be negative");
    }
}

Product DataProvider::fetchProduct(int id) const {
    std::this_thread::sleep_for(mLatency);

    Product p;
    p.id    = id;
    p.name  = "Product " + std::to_string(id);
    p.price = kProductPrice;
    return p;
}

} // namespace combined_api
