#pragma once

#include "tickback/core/error.hpp"
#include "tickback/task/task.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace tickback {

// Includes the derived "task_id" field.
void to_json(nlohmann::json& j, const Task& task);

[[nodiscard]] auto encode_task(const Task& task) -> std::string;

// CorruptRecord when the document is not a well-formed task.
[[nodiscard]] auto decode_task(std::string_view document) -> Result<Task>;

// ParseError for malformed JSON or fields of the wrong type.
[[nodiscard]] auto parse_create_request(std::string_view body)
    -> Result<CreateTaskRequest>;

}  // namespace tickback
