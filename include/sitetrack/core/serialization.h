#pragma once

#include <string>
#include <vector>

#include "sitetrack/core/entities.h"
#include "sitetrack/util/json.h"

namespace sitetrack {

// Task documents use the persisted camelCase keys (planStartDate, parentTaskId, ...).
// The top level may be a bare array or an object with a "tasks" array.
//
// Lenient on the value side: numeric ids are read as strings, progress/cost may
// be numbers or numeric strings, and null dates read as unset.
// Throws std::runtime_error on malformed JSON or a task without an id.
std::vector<Task> deserialize_tasks_from_json(const std::string& json_text);

Task task_from_json(const json::Value& v);
json::Value task_to_json(const Task& t);

// Unset dates are omitted. Output is {"tasks": [...]}.
std::string serialize_tasks_to_json(const std::vector<Task>& tasks);

// [{"taskId": "...", "fields": {...}}, ...] with only the engaged fields.
std::string serialize_update_batch_to_json(const UpdateBatch& batch);
UpdateBatch deserialize_update_batch_from_json(const std::string& json_text);

} // namespace sitetrack
