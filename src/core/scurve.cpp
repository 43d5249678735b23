#include "sitetrack/core/scurve.h"

#include <algorithm>
#include <cmath>
#include <string>

#include "sitetrack/core/task_graph.h"
#include "sitetrack/util/log.h"

namespace sitetrack {
namespace {

// Adds `amount` per day across `days` days starting at window offset
// `start_idx`. Days past the end are dropped; days before the start are either
// dropped or folded into day 0.
void spread(std::vector<double>& daily, std::int64_t start_idx, std::int64_t days, double amount,
            bool fold_early_days) {
  const std::int64_t n = static_cast<std::int64_t>(daily.size());
  for (std::int64_t i = 0; i < days; ++i) {
    const std::int64_t idx = start_idx + i;
    if (idx >= n) break;
    if (idx >= 0) {
      daily[static_cast<std::size_t>(idx)] += amount;
    } else if (fold_early_days && n > 0) {
      daily[0] += amount;
    }
  }
}

} // namespace

double task_scope(const Task& t, ProgressMode mode) {
  if (mode == ProgressMode::Financial) return std::max(0.0, t.cost);
  return static_cast<double>(duration_days(t.plan_start_date, t.plan_end_date));
}

double total_scope(const std::vector<const Task*>& tasks, ProgressMode mode) {
  double sum = 0.0;
  for (const Task* t : tasks) sum += task_scope(*t, mode);
  return sum;
}

double task_weight_percent(const Task& t, ProgressMode mode, double total) {
  if (total <= 0.0) return 0.0;
  return task_scope(t, mode) / total * 100.0;
}

SCurveResult compute_scurve(const std::vector<Task>& tasks, const TimeRange& window, ProgressMode mode,
                            const Date& today) {
  SCurveResult out;

  const std::int64_t total_days = window.days();
  std::vector<double> plan_daily(static_cast<std::size_t>(total_days), 0.0);
  std::vector<double> actual_daily(static_cast<std::size_t>(total_days), 0.0);

  const TaskGraph graph(tasks);
  const std::vector<const Task*> leaves = graph.leaf_tasks();
  out.total_scope = total_scope(leaves, mode);

  if (out.total_scope > 0.0) {
    for (const Task* t : leaves) {
      const double weight = task_scope(*t, mode);
      if (weight <= 0.0) continue;
      const double weight_percent = weight / out.total_scope * 100.0;

      const auto p_start = Date::parse(t->plan_start_date);
      const auto p_end = Date::parse(t->plan_end_date);
      if (p_start && p_end && *p_start <= *p_end) {
        const std::int64_t p_days = duration_days(*p_start, *p_end);
        spread(plan_daily, window.start.days_until(*p_start), p_days,
               weight_percent / static_cast<double>(std::max<std::int64_t>(1, p_days)), false);
      } else {
        log::debug("scurve: task '" + t->id + "' has no usable plan range; skipped from plan curve");
      }

      if (t->progress <= 0.0) continue;

      std::optional<Date> a_start;
      if (!t->actual_start_date.empty()) a_start = Date::parse(t->actual_start_date);
      if (!a_start) a_start = p_start;
      if (!a_start) {
        log::debug("scurve: task '" + t->id + "' has progress but no start date; skipped from actual curve");
        continue;
      }

      std::optional<Date> a_end;
      if (!t->actual_end_date.empty()) a_end = Date::parse(t->actual_end_date);
      Date end = a_end ? *a_end : today;
      if (end < *a_start) end = *a_start;

      const double actual_weight = weight_percent * (t->progress / 100.0);
      const std::int64_t a_days = duration_days(*a_start, end);
      spread(actual_daily, window.start.days_until(*a_start), a_days,
             actual_weight / static_cast<double>(std::max<std::int64_t>(1, a_days)), true);
    }
  }

  Date max_actual = Date::from_days_since_epoch(0);
  bool any_in_progress = false;
  for (const Task* t : leaves) {
    if (t->status == TaskStatus::InProgress) any_in_progress = true;
    std::optional<Date> d;
    if (!t->actual_end_date.empty()) {
      d = Date::parse(t->actual_end_date);
    } else if (t->status == TaskStatus::Completed && !t->actual_start_date.empty()) {
      d = Date::parse(t->actual_start_date);
    }
    if (d && *d > max_actual) max_actual = *d;
  }
  max_actual = max_actual.add_days(1);
  if (any_in_progress && today > max_actual) max_actual = today;
  out.max_actual_date = max_actual;

  out.points.reserve(static_cast<std::size_t>(total_days) + 1);
  out.points.push_back(SCurvePoint{window.start, 0.0, 0.0});
  double cum_plan = 0.0;
  double cum_actual = 0.0;
  for (std::int64_t i = 0; i < total_days; ++i) {
    cum_plan += plan_daily[static_cast<std::size_t>(i)];
    cum_actual += actual_daily[static_cast<std::size_t>(i)];
    out.points.push_back(SCurvePoint{window.start.add_days(i + 1), std::min(100.0, cum_plan),
                                     std::min(100.0, cum_actual)});
  }

  return out;
}

SCurveKpis compute_scurve_kpis(const SCurveResult& result, const std::vector<Task>& tasks,
                               const std::optional<Date>& custom_date, const Date& today) {
  SCurveKpis k;
  const auto& points = result.points;

  Date ref = today;
  if (custom_date) {
    ref = *custom_date;
  } else if (result.max_actual_date.to_ymd().year > 2000) {
    ref = result.max_actual_date;
  }

  const SCurvePoint* latest_actual = nullptr;
  for (auto it = points.rbegin(); it != points.rend(); ++it) {
    if (it->actual > 0.0) {
      latest_actual = &*it;
      break;
    }
  }

  if (!points.empty()) {
    if (ref < points.front().date) ref = latest_actual ? latest_actual->date : points.front().date;
    if (points.back().date < ref) ref = points.back().date;
  }
  k.reference_date = ref;

  const SCurvePoint* hit = nullptr;
  for (const auto& p : points) {
    if (p.date <= ref) {
      hit = &p;
    } else {
      break;
    }
  }
  if (!hit) hit = latest_actual;
  if (!hit && !points.empty()) hit = &points.back();

  if (hit) {
    k.progress = hit->actual;
    k.plan_to_date = hit->plan;
  }
  k.gap = k.progress - k.plan_to_date;

  const TaskGraph graph(tasks);
  std::optional<Date> span_start;
  std::optional<Date> span_end;
  for (const Task* t : graph.leaf_tasks()) {
    const auto s = Date::parse(t->plan_start_date);
    const auto e = Date::parse(t->plan_end_date);
    if (!s || !e) continue;
    if (!span_start || *s < *span_start) span_start = *s;
    if (!span_end || *e > *span_end) span_end = *e;
  }
  if (span_start && span_end) {
    const std::int64_t span_days = std::max<std::int64_t>(1, span_start->days_until(*span_end) + 1);
    k.variance_days = static_cast<std::int64_t>(std::floor(k.gap / 100.0 * static_cast<double>(span_days) + 0.5));
  }
  return k;
}

} // namespace sitetrack
