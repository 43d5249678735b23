#include "sitetrack/core/geometry.h"

#include <algorithm>
#include <cmath>

namespace sitetrack {
namespace {

const char* const kMonthAbbrev[12] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                      "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Monday = 0 ... Sunday = 6.
int monday_index(const Date& d) { return (d.weekday() + 6) % 7; }

} // namespace

double days_per_cell(Granularity g) {
  switch (g) {
    case Granularity::Day: return 1.0;
    case Granularity::Week: return 7.0;
    case Granularity::Month: return kAverageDaysPerMonth;
  }
  return 1.0;
}

double coordinate_x(const Date& date, const Date& window_start, double cell_width, Granularity g) {
  const double diff = static_cast<double>(window_start.days_until(date));
  return (diff / days_per_cell(g)) * cell_width;
}

double window_width_px(const TimeRange& window, Granularity g, double cell_width) {
  return (static_cast<double>(window.days()) / days_per_cell(g)) * cell_width;
}

std::int64_t pixel_delta_to_days(double delta_px, double cell_width, Granularity g) {
  if (cell_width <= 0.0) return 0;
  const double days = (delta_px / cell_width) * days_per_cell(g);
  return static_cast<std::int64_t>(std::floor(days + 0.5));
}

std::optional<BarRect> bar_geometry(const DateSpan& range, Granularity g, double cell_width, const TimeRange& window) {
  const double left = coordinate_x(range.start, window.start, cell_width, g);
  const double width = (static_cast<double>(range.days()) / days_per_cell(g)) * cell_width;
  const double chart_width = window_width_px(window, g, cell_width);

  const double clamped_left = std::max(0.0, left);
  const double clamped_end = std::min(chart_width, left + width);
  const double clamped_width = clamped_end - clamped_left;
  if (clamped_width <= 0.0) return std::nullopt;

  return BarRect{clamped_left, std::max(1.0, clamped_width)};
}

std::optional<DateSpan> plan_span(const Task& t) {
  const auto s = Date::parse(t.plan_start_date);
  const auto e = Date::parse(t.plan_end_date);
  if (!s || !e) return std::nullopt;
  return DateSpan{*s, *e};
}

Date progress_end_date(const Date& start, std::int64_t plan_days, double progress) {
  const double raw = static_cast<double>(plan_days) * (progress / 100.0);
  const std::int64_t progress_days = static_cast<std::int64_t>(std::floor(raw + 0.5));
  return start.add_days(std::max<std::int64_t>(0, progress_days - 1));
}

std::optional<DateSpan> actual_span(const Task& t) {
  const bool has_actual_start = !t.actual_start_date.empty();
  const bool has_actual_end = !t.actual_end_date.empty();
  const bool has_progress = t.progress > 0.0;
  if (!has_actual_start && !has_progress) return std::nullopt;

  const auto start = Date::parse(has_actual_start ? t.actual_start_date : t.plan_start_date);
  if (!start) return std::nullopt;

  if (has_actual_end) {
    const auto end = Date::parse(t.actual_end_date);
    if (!end) return std::nullopt;
    return DateSpan{*start, *end};
  }
  if (has_progress) {
    const auto plan = plan_span(t);
    if (!plan) return std::nullopt;
    return DateSpan{*start, progress_end_date(*start, plan->days(), t.progress)};
  }
  return DateSpan{*start, *start};
}

int iso_week_number(const Date& d) {
  const Date thursday = d.add_days(3 - monday_index(d));
  const Date jan1 = Date::from_ymd(thursday.to_ymd().year, 1, 1);
  return static_cast<int>(jan1.days_until(thursday) / 7) + 1;
}

std::vector<TimelineColumn> timeline_columns(const TimeRange& window, Granularity g) {
  std::vector<TimelineColumn> out;
  if (window.end < window.start) return out;

  switch (g) {
    case Granularity::Day: {
      out.reserve(static_cast<std::size_t>(window.days()));
      for (Date d = window.start; d <= window.end; d = d.add_days(1)) {
        out.push_back(TimelineColumn{d, d, std::to_string(d.to_ymd().day)});
      }
      break;
    }
    case Granularity::Week: {
      for (Date d = window.start.add_days(-monday_index(window.start)); d <= window.end; d = d.add_days(7)) {
        out.push_back(TimelineColumn{d, d.add_days(6), "W" + std::to_string(iso_week_number(d))});
      }
      break;
    }
    case Granularity::Month: {
      for (Date d = window.start.start_of_month(); d <= window.end; d = d.add_months(1)) {
        out.push_back(TimelineColumn{d, d.end_of_month(), kMonthAbbrev[d.to_ymd().month - 1]});
      }
      break;
    }
  }
  return out;
}

double fit_cell_width(std::size_t column_count, double base_cell_width, double container_width) {
  if (container_width <= 0.0 || column_count == 0) return base_cell_width;
  const double required = static_cast<double>(column_count) * base_cell_width;
  if (required >= container_width) return base_cell_width;
  const double fit = (container_width - 2.0) / static_cast<double>(column_count);
  return std::max(base_cell_width, fit);
}

double effective_cell_width(const GeometryConfig& cfg, const TimeRange& window, Granularity g,
                            double container_width) {
  const double base = cfg.base_cell_width(g);
  if (!cfg.auto_fit) return base;
  return fit_cell_width(timeline_columns(window, g).size(), base, container_width);
}

TimeRange default_time_range(const std::string& start_raw, const std::string& end_raw, const Date& today,
                             const TimelineConfig& cfg) {
  TimeRange r;
  const auto s = Date::parse(start_raw);
  const auto e = Date::parse(end_raw);
  r.start = s ? *s : today.start_of_month();
  r.end = e ? *e : today.add_months(cfg.default_span_months).end_of_month();
  return r;
}

std::optional<TimeRange> time_range_from_tasks(const std::vector<Task>& tasks, const TimelineConfig& cfg) {
  std::optional<Date> lo;
  std::optional<Date> hi;
  auto take = [&](const std::string& raw) {
    const auto d = Date::parse(raw);
    if (!d) return;
    if (!lo || *d < *lo) lo = *d;
    if (!hi || *d > *hi) hi = *d;
  };
  for (const auto& t : tasks) {
    take(t.plan_start_date);
    take(t.plan_end_date);
    take(t.actual_start_date);
    take(t.actual_end_date);
  }
  if (!lo || !hi) return std::nullopt;
  return TimeRange{lo->add_days(-cfg.padding_days), hi->add_days(cfg.padding_days)};
}

} // namespace sitetrack
