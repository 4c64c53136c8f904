#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace combined_api {

/// Map a /todos/{id} JSON object into a Todo.
/// Throws std::runtime_error if a field is missing or has the wrong type.
Todo parseTodo(const nlohmann::json& node);

nlohmann::json toJson(const Product& product);
nlohmann::json toJson(const Todo& todo);

/// Serialize the combined payload as {"product", "todo", "message"}.
nlohmann::json toJson(const CombinedResult& result);

/// Build the {"error": message} body used by every non-200 response.
nlohmann::json errorBody(const std::string& message);

} // namespace combined_api
