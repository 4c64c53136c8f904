#include "mapping.hpp"

#include <limits>
#include <stdexcept>

namespace combined_api {

namespace {

const nlohmann::json& requireField(const nlohmann::json& node,
                                   const char* name) {
    auto it = node.find(name);
    if (it == node.end()) {
        throw std::runtime_error(std::string("Todo missing '") + name +
                                 "' field");
    }
    return *it;
}

int requireInt(const nlohmann::json& node, const char* name) {
    const auto& value = requireField(node, name);
    if (!value.is_number_integer()) {
        throw std::runtime_error(std::string("Todo field '") + name +
                                 "' is not an integer");
    }
    // Unsigned values above LLONG_MAX would wrap if read as long long.
    if (value.is_number_unsigned() &&
        value.get<unsigned long long>() >
            static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string("Todo field '") + name +
                                 "' is out of range");
    }
    auto raw = value.get<long long>();
    if (raw < std::numeric_limits<int>::min() ||
        raw > std::numeric_limits<int>::max()) {
        throw std::runtime_error(std::string("Todo field '") + name +
                                 "' is out of range");
    }
    return static_cast<int>(raw);
}

} // namespace

Todo parseTodo(const nlohmann::json& node) {
    if (!node.is_object()) {
        throw std::runtime_error("Todo response is not a JSON object");
    }

    Todo t;
    t.id      = requireInt(node, "id");
    t.ownerId = requireInt(node, "userId");

    const auto& title = requireField(node, "title");
    if (!title.is_string()) {
        throw std::runtime_error("Todo field 'title' is not a string");
    }
    t.title = title.get<std::string>();

    const auto& completed = requireField(node, "completed");
    if (!completed.is_boolean()) {
        throw std::runtime_error("Todo field 'completed' is not a boolean");
    }
    t.completed = completed.get<bool>();

    return t;
}

nlohmann::json toJson(const Product& product) {
    return {
        {"id", product.id},
        {"name", product.name},
        {"price", product.price}
    };
}

nlohmann::json toJson(const Todo& todo) {
    return {
        {"id", todo.id},
        {"userId", todo.ownerId},
        {"title", todo.title},
        {"completed", todo.completed}
    };
}

nlohmann::json toJson(const CombinedResult& result) {
    return {
        {"product", toJson(result.product)},
        {"todo", toJson(result.todo)},
        {"message", result.message}
    };
}

nlohmann::json errorBody(const std::string& message) {
    return {{"error", message}};
}

} // namespace combined_api
