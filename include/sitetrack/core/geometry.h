#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sitetrack/core/config.h"
#include "sitetrack/core/entities.h"

namespace sitetrack {

// Fixed average month length used by the month view. Calendar months vary, but
// the timeline deliberately scales by this constant so bars line up with the
// header at every zoom level.
constexpr double kAverageDaysPerMonth = 30.44;

// Days represented by one cell: 1 (day), 7 (week) or 30.44 (month).
double days_per_cell(Granularity g);

// Horizontal pixel position of `date` relative to `window_start`.
// Negative for dates before the window.
double coordinate_x(const Date& date, const Date& window_start, double cell_width, Granularity g);

// Full pixel width of the window (inclusive day count through the same scale).
double window_width_px(const TimeRange& window, Granularity g, double cell_width);

// Converts a pointer delta to whole days, rounding half up (the same scale as
// coordinate_x, inverted).
std::int64_t pixel_delta_to_days(double delta_px, double cell_width, Granularity g);

struct BarRect {
  double left_px{0.0};
  double width_px{0.0};
};

// Geometry of an inclusive date range clamped to the window.
//
// Returns nullopt ("hidden") when no part of the range lies inside the window.
// A visible bar is at least 1px wide so very short ranges stay clickable.
std::optional<BarRect> bar_geometry(const DateSpan& range, Granularity g, double cell_width, const TimeRange& window);

// Plan range of a task. nullopt when either date fails to parse.
std::optional<DateSpan> plan_span(const Task& t);

// Actual range of a task as the timeline shows it:
// - start: actual start, else plan start;
// - end: actual end, else start + round(plan_days * progress / 100) - 1 when
//   progress > 0, else the start itself.
// nullopt when the task has neither an actual start nor any progress, or when
// the dates it needs do not parse.
std::optional<DateSpan> actual_span(const Task& t);

// End date implied by progress alone: start + max(0, round(plan_days * p / 100) - 1).
Date progress_end_date(const Date& start, std::int64_t plan_days, double progress);

struct TimelineColumn {
  Date start;
  Date end;
  std::string label;
};

// Header columns for the window: one per day, per Monday-based week, or per
// calendar month touching the window.
std::vector<TimelineColumn> timeline_columns(const TimeRange& window, Granularity g);

// Widens `base_cell_width` so `column_count` cells fill `container_width`
// (minus a 2px border) when they would otherwise leave a gap. Never narrows.
double fit_cell_width(std::size_t column_count, double base_cell_width, double container_width);

// Effective cell width for a view, honoring GeometryConfig::auto_fit.
double effective_cell_width(const GeometryConfig& cfg, const TimeRange& window, Granularity g,
                            double container_width);

// Window from explicit project bounds. An unparseable start falls back to the
// first of today's month; an unparseable end to the end of the month
// `default_span_months` after today.
TimeRange default_time_range(const std::string& start_raw, const std::string& end_raw, const Date& today,
                             const TimelineConfig& cfg = {});

// Window spanning every parseable plan/actual date in `tasks`, padded by
// cfg.padding_days on both sides. nullopt when no task has a usable date.
std::optional<TimeRange> time_range_from_tasks(const std::vector<Task>& tasks, const TimelineConfig& cfg = {});

// ISO-8601 week number (weeks start Monday; week 1 contains the first Thursday).
int iso_week_number(const Date& d);

} // namespace sitetrack
