#include "combined_handler.hpp"
#include "errors.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <iostream>

namespace combined_api {

namespace {

// Re-raise whatever the branch threw as an UpstreamError.
template <class T>
T takeResult(std::future<T>& branch, const char* name) {
    try {
        return branch.get();
    } catch (const std::exception& e) {
        throw UpstreamError(std::string(name) + " lookup failed: " + e.what());
    }
}

} // namespace

const std::string CombinedHandler::kMessage =
    "This is an example of async/await that keeps the server responsive.";

CombinedHandler::CombinedHandler(ProductService& service, bool verbose)
    : mService(service)
    , mVerbose(verbose) {}

CombinedResult CombinedHandler::handle(int id) const {
    const auto start = std::chrono::steady_clock::now();

    // --- fan out ---
    auto productBranch = std::async(std::launch::async, [this, id] {
        return mService.fetchProduct(id);
    });
    auto todoBranch = std::async(std::launch::async, [this, id] {
        return mService.fetchTodo(id);
    });

    // --- join: both, before looking at either outcome ---
    productBranch.wait();
    todoBranch.wait();

    if (mVerbose) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        std::cerr << "[Handler] id=" << id << " joined after "
                  << elapsed.count() << " ms\n";
    }

    CombinedResult result;
    result.product = takeResult(productBranch, "Product");
    result.todo    = takeResult(todoBranch, "Todo");
    result.message = kMessage;
    return result;
}

} // namespace combined_api
