#include <cmath>
#include <iostream>
#include <vector>

#include "sitetrack/core/geometry.h"
#include "test.h"

#define ST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near(double a, double b) { return std::fabs(a - b) < 1e-6; }

sitetrack::Date ymd(int y, int m, int d) { return sitetrack::Date::from_ymd(y, m, d); }

} // namespace

int test_geometry() {
  using sitetrack::DateSpan;
  using sitetrack::Granularity;
  using sitetrack::TimeRange;
  using sitetrack::testing::make_task;

  ST_ASSERT(near(sitetrack::days_per_cell(Granularity::Day), 1.0));
  ST_ASSERT(near(sitetrack::days_per_cell(Granularity::Week), 7.0));
  ST_ASSERT(near(sitetrack::days_per_cell(Granularity::Month), 30.44));

  ST_ASSERT(near(sitetrack::coordinate_x(ymd(2024, 1, 11), ymd(2024, 1, 1), 30.0, Granularity::Day), 300.0));
  ST_ASSERT(near(sitetrack::coordinate_x(ymd(2024, 1, 15), ymd(2024, 1, 1), 40.0, Granularity::Week), 80.0));
  ST_ASSERT(near(sitetrack::coordinate_x(ymd(2023, 12, 31), ymd(2024, 1, 1), 30.0, Granularity::Day), -30.0));

  // Half a cell rounds up; negative halves round toward +inf.
  ST_ASSERT(sitetrack::pixel_delta_to_days(45.0, 30.0, Granularity::Day) == 2);
  ST_ASSERT(sitetrack::pixel_delta_to_days(-45.0, 30.0, Granularity::Day) == -1);
  ST_ASSERT(sitetrack::pixel_delta_to_days(14.0, 30.0, Granularity::Day) == 0);
  ST_ASSERT(sitetrack::pixel_delta_to_days(20.0, 40.0, Granularity::Week) == 4);
  ST_ASSERT(sitetrack::pixel_delta_to_days(100.0, 100.0, Granularity::Month) == 30);
  ST_ASSERT(sitetrack::pixel_delta_to_days(10.0, 0.0, Granularity::Day) == 0);

  const TimeRange jan{ymd(2024, 1, 1), ymd(2024, 1, 31)};
  ST_ASSERT(jan.days() == 31);
  ST_ASSERT(near(sitetrack::window_width_px(jan, Granularity::Day, 30.0), 930.0));

  {
    const auto r = sitetrack::bar_geometry(DateSpan{ymd(2024, 1, 5), ymd(2024, 1, 7)}, Granularity::Day, 30.0, jan);
    ST_ASSERT(r.has_value());
    ST_ASSERT(near(r->left_px, 120.0));
    ST_ASSERT(near(r->width_px, 90.0));
  }
  {
    // Starts before the window: clipped on the left.
    const auto r = sitetrack::bar_geometry(DateSpan{ymd(2023, 12, 25), ymd(2024, 1, 2)}, Granularity::Day, 30.0, jan);
    ST_ASSERT(r.has_value());
    ST_ASSERT(near(r->left_px, 0.0));
    ST_ASSERT(near(r->width_px, 60.0));
  }
  {
    // Runs past the window: clipped on the right.
    const auto r = sitetrack::bar_geometry(DateSpan{ymd(2024, 1, 30), ymd(2024, 2, 10)}, Granularity::Day, 30.0, jan);
    ST_ASSERT(r.has_value());
    ST_ASSERT(near(r->left_px, 870.0));
    ST_ASSERT(near(r->width_px, 60.0));
  }
  ST_ASSERT(!sitetrack::bar_geometry(DateSpan{ymd(2024, 2, 5), ymd(2024, 2, 6)}, Granularity::Day, 30.0, jan));
  ST_ASSERT(!sitetrack::bar_geometry(DateSpan{ymd(2023, 12, 1), ymd(2023, 12, 5)}, Granularity::Day, 30.0, jan));
  {
    // One day in a narrow month view still gets a clickable pixel.
    const auto r = sitetrack::bar_geometry(DateSpan{ymd(2024, 1, 1), ymd(2024, 1, 1)}, Granularity::Month, 10.0, jan);
    ST_ASSERT(r.has_value());
    ST_ASSERT(near(r->width_px, 1.0));
  }

  // Plan and actual ranges.
  auto t = make_task("T", "2024-01-01", "2024-01-10");
  ST_ASSERT(sitetrack::plan_span(t)->days() == 10);
  ST_ASSERT(!sitetrack::actual_span(t));

  t.progress = 50.0;
  {
    const auto a = sitetrack::actual_span(t);
    ST_ASSERT(a.has_value());
    ST_ASSERT(a->start == ymd(2024, 1, 1));
    ST_ASSERT(a->end == ymd(2024, 1, 5));
  }
  t.actual_start_date = "2024-01-03";
  t.progress = 0.0;
  {
    const auto a = sitetrack::actual_span(t);
    ST_ASSERT(a.has_value());
    ST_ASSERT(a->start == ymd(2024, 1, 3));
    ST_ASSERT(a->end == ymd(2024, 1, 3));
  }
  t.actual_end_date = "2024-01-12";
  ST_ASSERT(sitetrack::actual_span(t)->end == ymd(2024, 1, 12));

  auto broken = make_task("B", "2024-01-01", "later");
  ST_ASSERT(!sitetrack::plan_span(broken));

  ST_ASSERT(sitetrack::progress_end_date(ymd(2024, 1, 1), 10, 50.0) == ymd(2024, 1, 5));
  ST_ASSERT(sitetrack::progress_end_date(ymd(2024, 1, 1), 10, 1.0) == ymd(2024, 1, 1));
  ST_ASSERT(sitetrack::progress_end_date(ymd(2024, 1, 1), 10, 100.0) == ymd(2024, 1, 10));

  // Header columns.
  {
    const auto cols = sitetrack::timeline_columns(TimeRange{ymd(2024, 1, 1), ymd(2024, 1, 3)}, Granularity::Day);
    ST_ASSERT(cols.size() == 3);
    ST_ASSERT(cols[0].label == "1");
    ST_ASSERT(cols[2].label == "3");
  }
  {
    const auto cols = sitetrack::timeline_columns(TimeRange{ymd(2024, 1, 3), ymd(2024, 1, 16)}, Granularity::Week);
    ST_ASSERT(cols.size() == 3);
    ST_ASSERT(cols[0].start == ymd(2024, 1, 1));
    ST_ASSERT(cols[0].end == ymd(2024, 1, 7));
    ST_ASSERT(cols[0].label == "W1");
    ST_ASSERT(cols[2].label == "W3");
  }
  {
    const auto cols = sitetrack::timeline_columns(TimeRange{ymd(2024, 1, 15), ymd(2024, 3, 2)}, Granularity::Month);
    ST_ASSERT(cols.size() == 3);
    ST_ASSERT(cols[0].label == "Jan");
    ST_ASSERT(cols[1].end == ymd(2024, 2, 29));
    ST_ASSERT(cols[2].label == "Mar");
  }
  ST_ASSERT(sitetrack::iso_week_number(ymd(2021, 1, 1)) == 53);
  ST_ASSERT(sitetrack::iso_week_number(ymd(2024, 12, 30)) == 1);

  // Auto-fit.
  ST_ASSERT(near(sitetrack::fit_cell_width(10, 30.0, 500.0), 49.8));
  ST_ASSERT(near(sitetrack::fit_cell_width(10, 30.0, 200.0), 30.0));
  ST_ASSERT(near(sitetrack::fit_cell_width(10, 30.0, 0.0), 30.0));
  {
    sitetrack::GeometryConfig cfg;
    const TimeRange ten{ymd(2024, 1, 1), ymd(2024, 1, 10)};
    ST_ASSERT(near(sitetrack::effective_cell_width(cfg, ten, Granularity::Day, 500.0), 49.8));
    cfg.auto_fit = false;
    ST_ASSERT(near(sitetrack::effective_cell_width(cfg, ten, Granularity::Day, 500.0), 30.0));
  }

  // Windows.
  {
    const auto r = sitetrack::default_time_range("", "", ymd(2024, 5, 17));
    ST_ASSERT(r.start == ymd(2024, 5, 1));
    ST_ASSERT(r.end == ymd(2025, 5, 31));
    const auto r2 = sitetrack::default_time_range("2024-02-01", "bogus", ymd(2024, 5, 17));
    ST_ASSERT(r2.start == ymd(2024, 2, 1));
    ST_ASSERT(r2.end == ymd(2025, 5, 31));
  }
  {
    std::vector<sitetrack::Task> tasks{make_task("A", "2024-01-10", "2024-01-15"),
                                       make_task("B", "2024-01-12", "2024-01-20")};
    const auto r = sitetrack::time_range_from_tasks(tasks);
    ST_ASSERT(r.has_value());
    ST_ASSERT(r->start == ymd(2024, 1, 3));
    ST_ASSERT(r->end == ymd(2024, 1, 27));
    ST_ASSERT(!sitetrack::time_range_from_tasks({}));
  }

  return 0;
}
