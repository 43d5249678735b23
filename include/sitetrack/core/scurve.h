#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "sitetrack/core/entities.h"

namespace sitetrack {

// One sample of the cumulative progress curves. Values are percentages in [0, 100].
struct SCurvePoint {
  Date date;
  double plan{0.0};
  double actual{0.0};
};

struct SCurveResult {
  // Synthetic origin {window.start, 0, 0} followed by one point per window day.
  // Point i (i >= 1) holds the cumulative totals through day i-1 and is dated
  // window.start + i.
  std::vector<SCurvePoint> points;

  // Where the actual series stops being meaningful: one day past the latest
  // recorded actual end (or completed start), pushed to `today` when any leaf
  // is still in progress. 1970-01-02 when no leaf carries actual dates.
  Date max_actual_date;

  // Sum of leaf scope weights for the chosen mode.
  double total_scope{0.0};
};

// Scope weight of one task: cost in financial mode, inclusive plan days in
// physical mode. Never negative; unparseable dates weigh 0.
double task_scope(const Task& t, ProgressMode mode);

double total_scope(const std::vector<const Task*>& tasks, ProgressMode mode);

// Share of the project carried by `t`, in percent. 0 when total_scope <= 0.
double task_weight_percent(const Task& t, ProgressMode mode, double total_scope);

// Planned vs. actual cumulative progress over `window`.
//
// Only leaf tasks (no children in the collection) contribute. Each leaf's
// weight is spread evenly over its inclusive plan days; plan days outside the
// window are dropped. Actual work (weight * progress / 100) is spread over the
// actual range, whose end defaults to `today`; actual days before the window
// are folded into the first day so backfilled progress still registers.
//
// Pure and reentrant: scratch buffers are local to the call.
SCurveResult compute_scurve(const std::vector<Task>& tasks, const TimeRange& window, ProgressMode mode,
                            const Date& today);

// Headline numbers shown next to the chart.
struct SCurveKpis {
  Date reference_date;
  double progress{0.0};     // actual % at the reference point
  double plan_to_date{0.0}; // plan % at the reference point
  double gap{0.0};          // progress - plan_to_date

  // Gap converted to days against the overall leaf plan span. nullopt when no
  // leaf has a usable plan range.
  std::optional<std::int64_t> variance_days;
};

// Reference date: `custom_date` when set, else the result's max actual date
// when it is a real date (year > 2000), else `today`; then clamped into the
// sampled window. The reference point is the last point dated on or before it.
SCurveKpis compute_scurve_kpis(const SCurveResult& result, const std::vector<Task>& tasks,
                               const std::optional<Date>& custom_date, const Date& today);

} // namespace sitetrack
