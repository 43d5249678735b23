#include "sitetrack/core/serialization.h"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

#include "sitetrack/core/enum_strings.h"
#include "sitetrack/util/log.h"
#include "sitetrack/util/strings.h"

namespace sitetrack {
namespace {

using json::Array;
using json::Object;
using json::Value;

std::string id_from_json(const Value& v) {
  if (const auto* s = v.as_string()) return *s;
  if (const auto* n = v.as_number()) {
    if (std::floor(*n) == *n && std::fabs(*n) < 9.0e15) return std::to_string(static_cast<long long>(*n));
    return format_fixed(*n, 6);
  }
  return {};
}

// Number or numeric string; anything else reads as `def`.
double lenient_number(const Value* v, double def) {
  if (!v) return def;
  if (const auto* n = v->as_number()) return *n;
  if (const auto* s = v->as_string()) {
    const std::string t = trim_copy(*s);
    if (t.empty()) return def;
    char* end = nullptr;
    const double d = std::strtod(t.c_str(), &end);
    if (end && *end == '\0' && std::isfinite(d)) return d;
  }
  return def;
}

// Saturates instead of overflowing; sort keys outside int range are still
// ordered relative to each other at the extremes.
int lenient_int(const Value* v, int def) {
  const double d = lenient_number(v, static_cast<double>(def));
  if (d >= static_cast<double>(std::numeric_limits<int>::max())) return std::numeric_limits<int>::max();
  if (d <= static_cast<double>(std::numeric_limits<int>::min())) return std::numeric_limits<int>::min();
  return static_cast<int>(d);
}

std::string optional_string(const Object& o, const char* key) {
  auto it = o.find(key);
  if (it == o.end()) return {};
  return id_from_json(it->second);
}

void put_date(Object& o, const char* key, const std::string& raw) {
  if (!raw.empty()) o[key] = raw;
}

} // namespace

Task task_from_json(const Value& v) {
  const auto& o = v.object();
  Task t;

  auto id_it = o.find("id");
  if (id_it != o.end()) t.id = id_from_json(id_it->second);
  if (t.id.empty()) throw std::runtime_error("task without an id");

  t.project_id = optional_string(o, "projectId");
  t.name = optional_string(o, "name");
  t.category = optional_string(o, "category");
  t.type = task_type_from_string(optional_string(o, "type"));
  t.parent_task_id = optional_string(o, "parentTaskId");

  t.plan_start_date = optional_string(o, "planStartDate");
  t.plan_end_date = optional_string(o, "planEndDate");
  t.actual_start_date = optional_string(o, "actualStartDate");
  t.actual_end_date = optional_string(o, "actualEndDate");

  auto pick = [&](const char* key) -> const Value* {
    auto it = o.find(key);
    return it == o.end() ? nullptr : &it->second;
  };
  t.progress = lenient_number(pick("progress"), 0.0);
  t.cost = lenient_number(pick("cost"), 0.0);
  t.order = lenient_int(pick("order"), 0);
  t.status = task_status_from_string(optional_string(o, "status"));

  if (const Value* preds = pick("predecessors")) {
    if (const auto* arr = preds->as_array()) {
      for (const auto& p : *arr) {
        std::string pid = id_from_json(p);
        if (!pid.empty()) t.predecessors.push_back(std::move(pid));
      }
    } else if (!preds->is_null()) {
      log::warn("task '" + t.id + "': predecessors is not an array, ignored");
    }
  }

  return t;
}

std::vector<Task> deserialize_tasks_from_json(const std::string& json_text) {
  const Value root = json::parse(json_text);

  const Array* arr = root.as_array();
  if (!arr) {
    const Value* tasks = root.find("tasks");
    if (tasks) arr = tasks->as_array();
  }
  if (!arr) throw std::runtime_error("task document must be an array or an object with a \"tasks\" array");

  std::vector<Task> out;
  out.reserve(arr->size());
  for (std::size_t i = 0; i < arr->size(); ++i) {
    if (!(*arr)[i].is_object()) throw std::runtime_error("task #" + std::to_string(i) + " is not an object");
    try {
      out.push_back(task_from_json((*arr)[i]));
    } catch (const std::exception& e) {
      throw std::runtime_error("task #" + std::to_string(i) + ": " + e.what());
    }
  }
  log::debug("loaded " + std::to_string(out.size()) + " task(s)");
  return out;
}

Value task_to_json(const Task& t) {
  Object o;
  o["id"] = t.id;
  if (!t.project_id.empty()) o["projectId"] = t.project_id;
  o["name"] = t.name;
  o["category"] = t.category;
  o["type"] = task_type_to_string(t.type);
  if (t.has_parent()) o["parentTaskId"] = t.parent_task_id;
  put_date(o, "planStartDate", t.plan_start_date);
  put_date(o, "planEndDate", t.plan_end_date);
  put_date(o, "actualStartDate", t.actual_start_date);
  put_date(o, "actualEndDate", t.actual_end_date);
  o["progress"] = t.progress;
  o["status"] = task_status_to_string(t.status);
  o["cost"] = t.cost;
  o["order"] = static_cast<double>(t.order);

  Array preds;
  preds.reserve(t.predecessors.size());
  for (const auto& p : t.predecessors) preds.push_back(p);
  o["predecessors"] = std::move(preds);
  return o;
}

std::string serialize_tasks_to_json(const std::vector<Task>& tasks) {
  Array arr;
  arr.reserve(tasks.size());
  for (const auto& t : tasks) arr.push_back(task_to_json(t));
  Object root;
  root["tasks"] = std::move(arr);
  return json::stringify(root, 2);
}

std::string serialize_update_batch_to_json(const UpdateBatch& batch) {
  Array arr;
  arr.reserve(batch.size());
  for (const auto& u : batch) {
    Object fields;
    if (u.plan_start_date) fields["planStartDate"] = *u.plan_start_date;
    if (u.plan_end_date) fields["planEndDate"] = *u.plan_end_date;
    if (u.actual_start_date) fields["actualStartDate"] = *u.actual_start_date;
    if (u.actual_end_date) fields["actualEndDate"] = *u.actual_end_date;
    if (u.progress) fields["progress"] = *u.progress;

    Object item;
    item["taskId"] = u.task_id;
    item["fields"] = std::move(fields);
    arr.push_back(std::move(item));
  }
  return json::stringify(arr, 2);
}

UpdateBatch deserialize_update_batch_from_json(const std::string& json_text) {
  const Value root = json::parse(json_text);
  UpdateBatch out;
  for (const auto& item : root.array()) {
    TaskUpdate u;
    u.task_id = id_from_json(item.at("taskId"));
    if (u.task_id.empty()) throw std::runtime_error("update without a taskId");
    const Value* fields = item.find("fields");
    if (fields && fields->is_object()) {
      const auto& f = fields->object();
      auto str = [&](const char* key) -> std::optional<std::string> {
        auto it = f.find(key);
        if (it == f.end()) return std::nullopt;
        return it->second.string_value();
      };
      u.plan_start_date = str("planStartDate");
      u.plan_end_date = str("planEndDate");
      u.actual_start_date = str("actualStartDate");
      u.actual_end_date = str("actualEndDate");
      auto p = f.find("progress");
      if (p != f.end()) u.progress = lenient_number(&p->second, 0.0);
    }
    out.push_back(std::move(u));
  }
  return out;
}

} // namespace sitetrack
