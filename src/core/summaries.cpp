#include "sitetrack/core/summaries.h"

#include <cmath>
#include <unordered_map>

#include "sitetrack/core/geometry.h"
#include "sitetrack/core/scurve.h"

namespace sitetrack {
namespace {

void take_min(std::optional<Date>& cur, const Date& d) {
  if (!cur || d < *cur) cur = d;
}

void take_max(std::optional<Date>& cur, const Date& d) {
  if (!cur || d > *cur) cur = d;
}

} // namespace

GroupSummary summarize_group(const TaskGraph& graph, const std::string& group_id) {
  GroupSummary s;
  double weighted_progress = 0.0;

  for (const Task* t : graph.leaf_descendants_of(group_id)) {
    if (t->is_group()) continue;
    ++s.count;

    if (const auto d = Date::parse(t->plan_start_date)) take_min(s.min_plan_start, *d);
    if (const auto d = Date::parse(t->plan_end_date)) take_max(s.max_plan_end, *d);

    if (const auto a_start = Date::parse(t->actual_start_date)) {
      take_min(s.min_actual_start, *a_start);

      Date effective_end = *a_start;
      if (const auto a_end = Date::parse(t->actual_end_date)) {
        effective_end = *a_end;
      } else if (t->progress > 0.0) {
        if (const auto plan = plan_span(*t)) {
          effective_end = progress_end_date(*a_start, plan->start.days_until(plan->end) + 1, t->progress);
        }
      }
      take_max(s.max_actual_end, effective_end);
    }

    s.total_cost += t->cost;
    const double w = t->cost > 0.0 ? t->cost : 1.0;
    weighted_progress += t->progress * w;
    s.total_weight += w;
  }

  if (s.total_weight > 0.0) s.progress = std::floor(weighted_progress / s.total_weight + 0.5);
  return s;
}

CategorySummary summarize_category(const std::vector<const Task*>& tasks, ProgressMode mode) {
  CategorySummary s;
  s.count = static_cast<int>(tasks.size());

  double progress_sum = 0.0;
  std::optional<Date> lo;
  std::optional<Date> hi;
  for (const Task* t : tasks) {
    s.total_cost += t->cost;
    s.total_weight += task_scope(*t, mode);
    progress_sum += t->progress;

    if (t->is_group()) continue;
    const auto span = plan_span(*t);
    if (!span) continue;
    take_min(lo, span->start);
    take_max(hi, span->end);
  }

  if (!tasks.empty()) s.avg_progress = progress_sum / static_cast<double>(tasks.size());
  if (lo && hi) s.date_range = DateSpan{*lo, *hi};
  return s;
}

std::vector<CategoryGroup> group_by_category(const std::vector<Task>& tasks) {
  std::vector<CategoryGroup> out;
  std::unordered_map<std::string, std::size_t> index;
  for (const auto& t : tasks) {
    auto it = index.find(t.category);
    if (it == index.end()) {
      it = index.emplace(t.category, out.size()).first;
      out.push_back(CategoryGroup{t.category, {}});
    }
    out[it->second].tasks.push_back(&t);
  }
  return out;
}

std::vector<Task> derive_group_fields(const std::vector<Task>& tasks) {
  std::vector<Task> out = tasks;
  const TaskGraph graph(tasks);

  for (auto& t : out) {
    if (!t.is_group()) continue;
    const GroupSummary s = summarize_group(graph, t.id);
    if (s.count == 0) continue;

    if (s.min_plan_start) t.plan_start_date = s.min_plan_start->to_string();
    if (s.max_plan_end) t.plan_end_date = s.max_plan_end->to_string();
    t.actual_start_date = s.min_actual_start ? s.min_actual_start->to_string() : std::string();
    t.actual_end_date = s.max_actual_end ? s.max_actual_end->to_string() : std::string();
    t.progress = s.progress;
    t.cost = s.total_cost;
  }
  return out;
}

} // namespace sitetrack
