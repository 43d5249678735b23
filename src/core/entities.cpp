#include "sitetrack/core/entities.h"

namespace sitetrack {

void apply_task_update(Task& t, const TaskUpdate& u) {
  if (u.plan_start_date) t.plan_start_date = *u.plan_start_date;
  if (u.plan_end_date) t.plan_end_date = *u.plan_end_date;
  if (u.actual_start_date) t.actual_start_date = *u.actual_start_date;
  if (u.actual_end_date) t.actual_end_date = *u.actual_end_date;
  if (u.progress) t.progress = *u.progress;
}

const Task* find_task(const std::vector<Task>& tasks, const std::string& id) {
  for (const auto& t : tasks) {
    if (t.id == id) return &t;
  }
  return nullptr;
}

Task* find_task(std::vector<Task>& tasks, const std::string& id) {
  for (auto& t : tasks) {
    if (t.id == id) return &t;
  }
  return nullptr;
}

} // namespace sitetrack
