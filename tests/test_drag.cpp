#include <iostream>
#include <vector>

#include "sitetrack/core/drag.h"
#include "test.h"

#define ST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

sitetrack::Date ymd(int y, int m, int d) { return sitetrack::Date::from_ymd(y, m, d); }

constexpr double kCell = 30.0;

} // namespace

int test_drag() {
  using sitetrack::BarType;
  using sitetrack::DragController;
  using sitetrack::DragPhase;
  using sitetrack::DragType;
  using sitetrack::Granularity;
  using sitetrack::Task;
  using sitetrack::TaskGraph;
  using sitetrack::testing::find_update;
  using sitetrack::testing::make_group;
  using sitetrack::testing::make_task;

  // Moving a group carries its descendants.
  {
    std::vector<Task> tasks;
    tasks.push_back(make_group("G"));
    tasks.back().plan_start_date = "2024-01-01";
    tasks.back().plan_end_date = "2024-01-05";
    tasks.push_back(make_task("A", "2024-01-01", "2024-01-05", "G"));
    const TaskGraph graph(tasks);

    DragController drag;
    ST_ASSERT(drag.begin(graph, "G", DragType::Move, BarType::Plan, 100.0, Granularity::Day, kCell));
    ST_ASSERT(drag.phase() == DragPhase::Dragging);
    ST_ASSERT(drag.state()->affected_task_ids.size() == 1);

    ST_ASSERT(drag.move(100.0 + 3 * kCell));
    ST_ASSERT(!drag.move(100.0 + 3 * kCell + 10.0));

    // Descendants preview with the parent.
    const auto preview = drag.preview_span(tasks[1], BarType::Plan);
    ST_ASSERT(preview.has_value());
    ST_ASSERT(preview->start == ymd(2024, 1, 4));
    ST_ASSERT(!drag.preview_span(tasks[1], BarType::Actual));

    const auto c = drag.end(graph);
    ST_ASSERT(drag.phase() == DragPhase::Committing);
    ST_ASSERT(c.hierarchy_cascade);
    ST_ASSERT(!c.dependency_cascade);
    ST_ASSERT(c.hierarchy_shift_days == 3);
    ST_ASSERT(c.pause_hint_ms == 0);
    ST_ASSERT(c.updates.size() == 2);
    ST_ASSERT(c.updates[0].task_id == "G");
    ST_ASSERT(*c.updates[0].plan_start_date == "2024-01-04");
    const auto* a = find_update(c.updates, "A");
    ST_ASSERT(a != nullptr);
    ST_ASSERT(*a->plan_start_date == "2024-01-04");
    ST_ASSERT(*a->plan_end_date == "2024-01-08");
    ST_ASSERT(!a->progress);

    // Busy until the caller finishes the commit.
    ST_ASSERT(!drag.begin(graph, "A", DragType::Move, BarType::Plan, 0.0, Granularity::Day, kCell));
    ST_ASSERT(!drag.preview_span(tasks[0], BarType::Plan));
    drag.complete();
    ST_ASSERT(drag.phase() == DragPhase::Idle);
    ST_ASSERT(drag.state() == nullptr);
  }

  // Successors shift by the same delta along the whole chain.
  {
    std::vector<Task> tasks{make_task("A", "2024-01-01", "2024-01-03"), make_task("B", "2024-01-04", "2024-01-06"),
                            make_task("C", "2024-01-07", "2024-01-09")};
    tasks[1].predecessors = {"A"};
    tasks[2].predecessors = {"B"};
    const TaskGraph graph(tasks);

    DragController drag;
    ST_ASSERT(drag.begin(graph, "A", DragType::Move, BarType::Plan, 0.0, Granularity::Day, kCell));
    drag.queue_move(2 * kCell);
    ST_ASSERT(drag.process_pending());
    ST_ASSERT(!drag.process_pending());
    const auto c = drag.end(graph);
    ST_ASSERT(c.dependency_cascade);
    ST_ASSERT(c.dependency_shift_days == 2);
    ST_ASSERT(c.pause_hint_ms == 600);
    ST_ASSERT(c.updates.size() == 3);
    ST_ASSERT(*find_update(c.updates, "B")->plan_start_date == "2024-01-06");
    ST_ASSERT(*find_update(c.updates, "C")->plan_start_date == "2024-01-09");
    ST_ASSERT(*find_update(c.updates, "C")->plan_end_date == "2024-01-11");
    drag.complete();

    // Resize-right shifts successors by the end delta.
    ST_ASSERT(drag.begin(graph, "A", DragType::ResizeRight, BarType::Plan, 0.0, Granularity::Day, kCell));
    drag.move(kCell);
    const auto r = drag.end(graph);
    ST_ASSERT(*r.updates[0].plan_start_date == "2024-01-01");
    ST_ASSERT(*r.updates[0].plan_end_date == "2024-01-04");
    ST_ASSERT(r.dependency_shift_days == 1);
    ST_ASSERT(*find_update(r.updates, "B")->plan_start_date == "2024-01-05");
    drag.complete();

    // Resize-left never moves successors.
    ST_ASSERT(drag.begin(graph, "A", DragType::ResizeLeft, BarType::Plan, 0.0, Granularity::Day, kCell));
    drag.move(-2 * kCell);
    const auto l = drag.end(graph);
    ST_ASSERT(l.updates.size() == 1);
    ST_ASSERT(*l.updates[0].plan_start_date == "2023-12-30");
    ST_ASSERT(!l.dependency_cascade);
    drag.complete();
  }

  // Releasing at the original range writes nothing.
  {
    std::vector<Task> tasks{make_task("A", "2024-01-01", "2024-01-03")};
    const TaskGraph graph(tasks);
    DragController drag;
    ST_ASSERT(drag.begin(graph, "A", DragType::Move, BarType::Plan, 50.0, Granularity::Day, kCell));
    drag.move(60.0);
    const auto c = drag.end(graph);
    ST_ASSERT(c.empty());
    ST_ASSERT(c.updates.empty());
    ST_ASSERT(drag.phase() == DragPhase::Idle);

    // Refused starts leave the controller idle.
    ST_ASSERT(!drag.begin(graph, "missing", DragType::Move, BarType::Plan, 0.0, Granularity::Day, kCell));
    ST_ASSERT(!drag.begin(graph, "A", DragType::Move, BarType::Plan, 0.0, Granularity::Day, 0.0));
    ST_ASSERT(!drag.active());

    // end() without begin() is harmless.
    ST_ASSERT(drag.end(graph).empty());
  }

  // Resizing clamps at the fixed edge instead of inverting the bar.
  {
    std::vector<Task> tasks{make_task("A", "2024-01-01", "2024-01-03")};
    const TaskGraph graph(tasks);
    DragController drag;
    ST_ASSERT(drag.begin(graph, "A", DragType::ResizeLeft, BarType::Plan, 0.0, Granularity::Day, kCell));
    drag.move(10 * kCell);
    ST_ASSERT(drag.state()->current.start == ymd(2024, 1, 3));
    ST_ASSERT(drag.state()->current.end == ymd(2024, 1, 3));
    drag.cancel();

    ST_ASSERT(drag.begin(graph, "A", DragType::ResizeRight, BarType::Plan, 0.0, Granularity::Day, kCell));
    drag.move(-10 * kCell);
    ST_ASSERT(drag.state()->current.end == ymd(2024, 1, 1));
    drag.cancel();
    ST_ASSERT(!drag.active());
  }

  // Actual bar edits recompute progress.
  {
    std::vector<Task> tasks{make_task("A", "2024-01-01", "2024-01-10")};
    tasks[0].progress = 50.0;
    const TaskGraph graph(tasks);
    DragController drag;
    ST_ASSERT(drag.begin(graph, "A", DragType::ResizeRight, BarType::Actual, 0.0, Granularity::Day, kCell));
    ST_ASSERT(drag.state()->original.start == ymd(2024, 1, 1));
    ST_ASSERT(drag.state()->original.end == ymd(2024, 1, 5));

    drag.move(5 * kCell);
    const auto c = drag.end(graph);
    ST_ASSERT(c.updates.size() == 1);
    ST_ASSERT(*c.updates[0].actual_start_date == "2024-01-01");
    ST_ASSERT(*c.updates[0].actual_end_date == "2024-01-10");
    ST_ASSERT(!c.updates[0].plan_start_date);
    ST_ASSERT(c.progress.has_value());
    ST_ASSERT(*c.progress == 100.0);
    ST_ASSERT(*c.updates[0].progress == 100.0);
    drag.complete();

    ST_ASSERT(*sitetrack::progress_from_actual(sitetrack::DateSpan{ymd(2024, 1, 1), ymd(2024, 1, 3)},
                                               sitetrack::DateSpan{ymd(2024, 1, 1), ymd(2024, 1, 10)}) == 30.0);
    ST_ASSERT(*sitetrack::progress_from_actual(sitetrack::DateSpan{ymd(2024, 1, 1), ymd(2024, 1, 30)},
                                               sitetrack::DateSpan{ymd(2024, 1, 1), ymd(2024, 1, 10)}) == 100.0);
    ST_ASSERT(!sitetrack::progress_from_actual(sitetrack::DateSpan{ymd(2024, 1, 1), ymd(2024, 1, 3)},
                                               sitetrack::DateSpan{ymd(2024, 1, 10), ymd(2024, 1, 1)}));
  }

  // A predecessor loop cannot push the dragged task twice.
  {
    std::vector<Task> tasks{make_task("A", "2024-01-01", "2024-01-02"), make_task("B", "2024-01-03", "2024-01-04")};
    tasks[0].predecessors = {"B"};
    tasks[1].predecessors = {"A"};
    const TaskGraph graph(tasks);
    DragController drag;
    ST_ASSERT(drag.begin(graph, "A", DragType::Move, BarType::Plan, 0.0, Granularity::Day, kCell));
    drag.move(kCell);
    const auto c = drag.end(graph);
    ST_ASSERT(c.updates.size() == 2);
    ST_ASSERT(*c.updates[0].plan_start_date == "2024-01-02");
    ST_ASSERT(*find_update(c.updates, "B")->plan_start_date == "2024-01-04");
    drag.complete();
  }

  // A child that also follows its parent is reported as an overlap.
  {
    std::vector<Task> tasks;
    tasks.push_back(make_group("G"));
    tasks.back().plan_start_date = "2024-01-01";
    tasks.back().plan_end_date = "2024-01-05";
    tasks.push_back(make_task("A", "2024-01-02", "2024-01-03", "G"));
    tasks.back().predecessors = {"G"};
    const TaskGraph graph(tasks);
    DragController drag;
    ST_ASSERT(drag.begin(graph, "G", DragType::Move, BarType::Plan, 0.0, Granularity::Day, kCell));
    drag.move(kCell);
    const auto c = drag.end(graph);
    ST_ASSERT(c.updates.size() == 2);
    ST_ASSERT(c.overlapping_task_ids.size() == 1);
    ST_ASSERT(c.overlapping_task_ids[0] == "A");
    ST_ASSERT(*find_update(c.updates, "A")->plan_start_date == "2024-01-03");
    drag.complete();
  }

  // The guard returns an abandoned interaction to idle.
  {
    std::vector<Task> tasks{make_task("A", "2024-01-01", "2024-01-03")};
    const TaskGraph graph(tasks);
    DragController drag;
    {
      sitetrack::DragSessionGuard guard(drag);
      ST_ASSERT(drag.begin(graph, "A", DragType::Move, BarType::Plan, 0.0, Granularity::Week, 40.0));
      drag.move(40.0);
      ST_ASSERT(drag.state()->current.start == ymd(2024, 1, 8));
    }
    ST_ASSERT(!drag.active());
  }

  return 0;
}
