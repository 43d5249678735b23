#include "sitetrack/core/enum_strings.h"

namespace sitetrack {

std::string task_type_to_string(TaskType t) {
  switch (t) {
    case TaskType::Task: return "task";
    case TaskType::Group: return "group";
  }
  return "task";
}

TaskType task_type_from_string(const std::string& s) {
  if (s == "group") return TaskType::Group;
  return TaskType::Task;
}

std::string task_status_to_string(TaskStatus s) {
  switch (s) {
    case TaskStatus::NotStarted: return "not-started";
    case TaskStatus::InProgress: return "in-progress";
    case TaskStatus::Completed: return "completed";
    case TaskStatus::Delayed: return "delayed";
  }
  return "not-started";
}

TaskStatus task_status_from_string(const std::string& s) {
  if (s == "in-progress") return TaskStatus::InProgress;
  if (s == "completed") return TaskStatus::Completed;
  if (s == "delayed") return TaskStatus::Delayed;
  return TaskStatus::NotStarted;
}

std::string granularity_to_string(Granularity g) {
  switch (g) {
    case Granularity::Day: return "day";
    case Granularity::Week: return "week";
    case Granularity::Month: return "month";
  }
  return "day";
}

std::optional<Granularity> try_granularity_from_string(const std::string& s) {
  if (s == "day") return Granularity::Day;
  if (s == "week") return Granularity::Week;
  if (s == "month") return Granularity::Month;
  return std::nullopt;
}

Granularity granularity_from_string(const std::string& s) {
  return try_granularity_from_string(s).value_or(Granularity::Day);
}

std::string progress_mode_to_string(ProgressMode m) {
  switch (m) {
    case ProgressMode::Physical: return "physical";
    case ProgressMode::Financial: return "financial";
  }
  return "physical";
}

std::optional<ProgressMode> try_progress_mode_from_string(const std::string& s) {
  if (s == "physical") return ProgressMode::Physical;
  if (s == "financial") return ProgressMode::Financial;
  return std::nullopt;
}

ProgressMode progress_mode_from_string(const std::string& s) {
  return try_progress_mode_from_string(s).value_or(ProgressMode::Physical);
}

std::string bar_type_to_string(BarType b) {
  switch (b) {
    case BarType::Plan: return "plan";
    case BarType::Actual: return "actual";
  }
  return "plan";
}

std::optional<BarType> try_bar_type_from_string(const std::string& s) {
  if (s == "plan") return BarType::Plan;
  if (s == "actual") return BarType::Actual;
  return std::nullopt;
}

BarType bar_type_from_string(const std::string& s) {
  return try_bar_type_from_string(s).value_or(BarType::Plan);
}

std::string drag_type_to_string(DragType t) {
  switch (t) {
    case DragType::Move: return "move";
    case DragType::ResizeLeft: return "resize-left";
    case DragType::ResizeRight: return "resize-right";
  }
  return "move";
}

std::optional<DragType> try_drag_type_from_string(const std::string& s) {
  if (s == "move") return DragType::Move;
  if (s == "resize-left") return DragType::ResizeLeft;
  if (s == "resize-right") return DragType::ResizeRight;
  return std::nullopt;
}

DragType drag_type_from_string(const std::string& s) {
  return try_drag_type_from_string(s).value_or(DragType::Move);
}

} // namespace sitetrack
