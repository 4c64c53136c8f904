#pragma once

#include "models.hpp"
#include "product_service.hpp"

#include <string>

namespace combined_api {

/// Fans a combined request out to the product lookup and the remote todo
/// lookup, then joins both.
class CombinedHandler {
public:
    static const std::string kMessage;

    explicit CombinedHandler(ProductService& service, bool verbose = false);

    /// Starts both lookups before waiting on either, so the call takes about
    /// as long as the slower one. Both always run to completion; failures are
    /// inspected only after the join.
    /// @throws UpstreamError if either lookup failed. No partial result.
    CombinedResult handle(int id) const;

private:
    ProductService& mService;
    bool            mVerbose;
};

} // namespace combined_api
