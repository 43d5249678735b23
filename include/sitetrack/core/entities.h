#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sitetrack/core/date.h"

namespace sitetrack {

enum class TaskType { Task, Group };

enum class TaskStatus { NotStarted, InProgress, Completed, Delayed };

// Timeline display unit. Controls the date-to-pixel scale.
enum class Granularity { Day, Week, Month };

// How a task's share of the project is measured on the S-curve.
enum class ProgressMode {
  Physical,  // plan duration in days
  Financial, // cost
};

enum class BarType { Plan, Actual };

enum class DragType { Move, ResizeLeft, ResizeRight };

// A schedule item as stored by the persistence layer.
//
// Date fields hold raw strings exactly as persisted (canonical YYYY-MM-DD when
// written by this engine, but legacy rows may use dd/MM/yyyy). Empty means unset.
struct Task {
  std::string id;
  std::string project_id;
  std::string name;
  std::string category;
  TaskType type{TaskType::Task};

  // Empty for a root task. The parent chain forms a forest; a cycle is a data
  // error that traversals tolerate but never resolve.
  std::string parent_task_id;

  std::string plan_start_date;
  std::string plan_end_date;
  std::string actual_start_date;
  std::string actual_end_date;

  // Percent complete, 0..100.
  double progress{0.0};
  TaskStatus status{TaskStatus::NotStarted};

  // Monetary weight. 0 when absent.
  double cost{0.0};

  // Ids of tasks this one must follow. Edges point predecessor -> successor.
  std::vector<std::string> predecessors;

  int order{0};

  bool is_group() const { return type == TaskType::Group; }
  bool has_parent() const { return !parent_task_id.empty(); }
};

// Inclusive date pair for a bar or an interval of work.
struct DateSpan {
  Date start;
  Date end;

  std::int64_t days() const { return duration_days(start, end); }
  DateSpan shifted(std::int64_t delta) const { return DateSpan{start.add_days(delta), end.add_days(delta)}; }

  friend bool operator==(const DateSpan& a, const DateSpan& b) { return a.start == b.start && a.end == b.end; }
  friend bool operator!=(const DateSpan& a, const DateSpan& b) { return !(a == b); }
};

// The visible/computed window. Supplied by the caller; never owned by the
// geometry or curve components.
struct TimeRange {
  Date start;
  Date end;

  // Inclusive day count, at least 1.
  std::int64_t days() const { return std::max<std::int64_t>(1, start.days_until(end) + 1); }
  bool contains(const Date& d) const { return d >= start && d <= end; }
};

// A partial write for one task. Only engaged fields are changed.
struct TaskUpdate {
  std::string task_id;
  std::optional<std::string> plan_start_date;
  std::optional<std::string> plan_end_date;
  std::optional<std::string> actual_start_date;
  std::optional<std::string> actual_end_date;
  std::optional<double> progress;

  bool empty() const {
    return !plan_start_date && !plan_end_date && !actual_start_date && !actual_end_date && !progress;
  }
};

using UpdateBatch = std::vector<TaskUpdate>;

// Applies the engaged fields of `u` to `t`. The id is not checked.
void apply_task_update(Task& t, const TaskUpdate& u);

// Index of the task with the given id, or nullptr.
const Task* find_task(const std::vector<Task>& tasks, const std::string& id);
Task* find_task(std::vector<Task>& tasks, const std::string& id);

} // namespace sitetrack
