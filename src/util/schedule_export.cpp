#include "sitetrack/util/schedule_export.h"

#include <cmath>

#include "sitetrack/core/enum_strings.h"
#include "sitetrack/core/geometry.h"
#include "sitetrack/core/task_graph.h"
#include "sitetrack/util/json.h"
#include "sitetrack/util/strings.h"

namespace sitetrack {
namespace {

using json::Array;
using json::Object;
using json::Value;

Value optional_date_json(const std::optional<Date>& d) {
  if (!d) return nullptr;
  return d->to_string();
}

Value bar_json(const std::optional<BarRect>& r) {
  if (!r) return nullptr;
  Object o;
  o["left"] = round_display(r->left_px);
  o["width"] = round_display(r->width_px);
  return o;
}

} // namespace

double round_display(double v, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::floor(v * scale + 0.5) / scale;
}

std::string scurve_to_csv(const SCurveResult& result) {
  std::string out = "date,plan,actual\n";
  for (const auto& p : result.points) {
    out += p.date.to_string();
    out += ",";
    out += format_fixed(round_display(p.plan), 2);
    out += ",";
    out += format_fixed(round_display(p.actual), 2);
    out += "\n";
  }
  return out;
}

std::string scurve_to_json(const SCurveResult& result) {
  Array points;
  points.reserve(result.points.size());
  for (const auto& p : result.points) {
    Object o;
    o["date"] = p.date.to_string();
    o["plan"] = round_display(p.plan);
    o["actual"] = round_display(p.actual);
    points.push_back(std::move(o));
  }
  Object root;
  root["points"] = std::move(points);
  root["maxActualDate"] = result.max_actual_date.to_string();
  root["totalScope"] = round_display(result.total_scope);
  return json::stringify(root, 2) + "\n";
}

std::string scurve_kpis_to_json(const SCurveKpis& kpis) {
  Object o;
  o["referenceDate"] = kpis.reference_date.to_string();
  o["progress"] = round_display(kpis.progress);
  o["planToDate"] = round_display(kpis.plan_to_date);
  o["gap"] = round_display(kpis.gap);
  if (kpis.variance_days) {
    o["varianceDays"] = static_cast<double>(*kpis.variance_days);
  } else {
    o["varianceDays"] = nullptr;
  }
  return json::stringify(o, 2) + "\n";
}

std::string timeline_bars_to_json(const std::vector<Task>& tasks, const TimeRange& window, Granularity g,
                                  double cell_width) {
  Array rows;
  rows.reserve(tasks.size());
  for (const auto& t : tasks) {
    std::optional<BarRect> plan;
    std::optional<BarRect> actual;
    if (auto span = plan_span(t)) plan = bar_geometry(*span, g, cell_width, window);
    if (auto span = actual_span(t)) actual = bar_geometry(*span, g, cell_width, window);

    Object o;
    o["id"] = t.id;
    o["name"] = t.name;
    o["type"] = task_type_to_string(t.type);
    o["plan"] = bar_json(plan);
    o["actual"] = bar_json(actual);
    rows.push_back(std::move(o));
  }
  Object root;
  root["granularity"] = granularity_to_string(g);
  root["cellWidth"] = round_display(cell_width);
  root["windowStart"] = window.start.to_string();
  root["windowEnd"] = window.end.to_string();
  root["widthPx"] = round_display(window_width_px(window, g, cell_width));
  root["bars"] = std::move(rows);
  return json::stringify(root, 2) + "\n";
}

std::string summaries_to_json(const std::vector<Task>& tasks, ProgressMode mode) {
  Array categories;
  for (const auto& group : group_by_category(tasks)) {
    const CategorySummary s = summarize_category(group.tasks, mode);
    Object o;
    o["category"] = group.category;
    o["count"] = static_cast<double>(s.count);
    o["totalCost"] = round_display(s.total_cost);
    o["totalWeight"] = round_display(s.total_weight);
    o["avgProgress"] = round_display(s.avg_progress);
    if (s.date_range) {
      o["start"] = s.date_range->start.to_string();
      o["end"] = s.date_range->end.to_string();
    } else {
      o["start"] = nullptr;
      o["end"] = nullptr;
    }
    categories.push_back(std::move(o));
  }

  const TaskGraph graph(tasks);
  Array groups;
  for (const auto& t : tasks) {
    if (!t.is_group()) continue;
    const GroupSummary s = summarize_group(graph, t.id);
    Object o;
    o["id"] = t.id;
    o["name"] = t.name;
    o["count"] = static_cast<double>(s.count);
    o["progress"] = round_display(s.progress);
    o["totalCost"] = round_display(s.total_cost);
    o["planStart"] = optional_date_json(s.min_plan_start);
    o["planEnd"] = optional_date_json(s.max_plan_end);
    o["actualStart"] = optional_date_json(s.min_actual_start);
    o["actualEnd"] = optional_date_json(s.max_actual_end);
    groups.push_back(std::move(o));
  }

  Object root;
  root["mode"] = progress_mode_to_string(mode);
  root["categories"] = std::move(categories);
  root["groups"] = std::move(groups);
  return json::stringify(root, 2) + "\n";
}

} // namespace sitetrack
