#pragma once

#include "models.hpp"

#include <chrono>

namespace combined_api {

/// Stand-in for a product store: every lookup blocks for a fixed latency,
/// then returns a record derived from the id alone.
class DataProvider {
public:
    static constexpr double kProductPrice = 49.99;

    explicit DataProvider(
        std::chrono::milliseconds latency = std::chrono::milliseconds(500));

    /// Never fails; any id is accepted.
    Product fetchProduct(int id) const;

    std::chrono::milliseconds latency() const { return mLatency; }

private:
    std::chrono::milliseconds mLatency;
};

} // namespace combined_api
