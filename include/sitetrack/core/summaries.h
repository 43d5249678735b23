#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sitetrack/core/entities.h"
#include "sitetrack/core/task_graph.h"

namespace sitetrack {

// Rollup of a group's leaf descendants.
struct GroupSummary {
  int count{0};

  std::optional<Date> min_plan_start;
  std::optional<Date> max_plan_end;
  std::optional<Date> min_actual_start;

  // Latest actual end, where a leaf without an explicit end contributes the
  // end implied by its progress (or its start when progress is 0).
  std::optional<Date> max_actual_end;

  // Cost-weighted progress (weight = cost, or 1 when a leaf has no cost),
  // rounded to a whole percent.
  double progress{0.0};
  double total_cost{0.0};
  double total_weight{0.0};
};

GroupSummary summarize_group(const TaskGraph& graph, const std::string& group_id);

// Rollup of the rows shown under one category header.
struct CategorySummary {
  int count{0};
  double total_cost{0.0};

  // Sum of S-curve scope weights for the given mode.
  double total_weight{0.0};

  // Plain average of task progress.
  double avg_progress{0.0};

  // Plan span over non-group tasks. nullopt when none has usable dates.
  std::optional<DateSpan> date_range;
};

CategorySummary summarize_category(const std::vector<const Task*>& tasks, ProgressMode mode);

// Distinct categories in first-seen order, each with its tasks.
struct CategoryGroup {
  std::string category;
  std::vector<const Task*> tasks;
};
std::vector<CategoryGroup> group_by_category(const std::vector<Task>& tasks);

// Returns a copy of `tasks` where every group task's plan dates, actual dates
// and progress are recomputed from its leaf descendants. Groups without leaves
// keep their stored values. Non-group tasks are untouched.
std::vector<Task> derive_group_fields(const std::vector<Task>& tasks);

} // namespace sitetrack
