#pragma once

#include <string>
#include <vector>

#include "sitetrack/core/entities.h"
#include "sitetrack/core/scurve.h"
#include "sitetrack/core/summaries.h"

namespace sitetrack {

// Format an S-curve as CSV.
//
// Header "date,plan,actual", one row per point, values with 2 decimals.
// Output ends with a trailing newline.
std::string scurve_to_csv(const SCurveResult& result);

// Format an S-curve as JSON:
//   { "points": [{"date", "plan", "actual"}, ...], "maxActualDate", "totalScope" }
// Percentages are rounded to 2 decimals for display. Output ends with a newline.
std::string scurve_to_json(const SCurveResult& result);

// { "referenceDate", "progress", "planToDate", "gap", "varianceDays" (null when unknown) }
std::string scurve_kpis_to_json(const SCurveKpis& kpis);

// Bar layout for every task in collection order:
//   [{"id", "name", "type", "plan": {"left", "width"} | null, "actual": {...} | null}, ...]
// A null bar is hidden (no usable dates, or entirely outside the window).
std::string timeline_bars_to_json(const std::vector<Task>& tasks, const TimeRange& window, Granularity g,
                                  double cell_width);

// Per-category rollups plus one entry per group task.
std::string summaries_to_json(const std::vector<Task>& tasks, ProgressMode mode);

// Rounds to `decimals` places, halves away from -inf.
double round_display(double v, int decimals = 2);

} // namespace sitetrack
