#pragma once

#include <string>

namespace combined_api {

/// Record served by the (simulated) product store.
struct Product {
    int         id    = 0;
    std::string name;
    double      price = 0.0;
};

/// Mirrors the remote /todos/{id} resource.
struct Todo {
    int         id        = 0;
    int         ownerId   = 0;   // "userId" on the wire
    std::string title;
    bool        completed = false;
};

/// Joined payload returned by the combined endpoint.
struct CombinedResult {
    Product     product;
    Todo        todo;
    std::string message;
};

} // namespace combined_api
