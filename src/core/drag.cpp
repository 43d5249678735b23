#include "sitetrack/core/drag.h"

#include <algorithm>
#include <cmath>
#include <deque>
#include <unordered_map>
#include <utility>

#include "sitetrack/core/enum_strings.h"
#include "sitetrack/core/geometry.h"
#include "sitetrack/util/log.h"

namespace sitetrack {
namespace {

// Accumulates one merged update per task id, keeping first-seen order.
class BatchBuilder {
 public:
  TaskUpdate& upsert(const std::string& task_id) {
    auto it = index_.find(task_id);
    if (it != index_.end()) return batch_[it->second];
    index_.emplace(task_id, batch_.size());
    TaskUpdate u;
    u.task_id = task_id;
    batch_.push_back(std::move(u));
    return batch_.back();
  }

  void set_plan(const std::string& task_id, const DateSpan& span) {
    TaskUpdate& u = upsert(task_id);
    u.plan_start_date = span.start.to_string();
    u.plan_end_date = span.end.to_string();
  }

  UpdateBatch take() { return std::move(batch_); }

 private:
  UpdateBatch batch_;
  std::unordered_map<std::string, std::size_t> index_;
};

std::optional<DateSpan> resolve_actual_origin(const Task& t) {
  const auto start = Date::parse(!t.actual_start_date.empty() ? t.actual_start_date : t.plan_start_date);
  if (!start) return std::nullopt;

  if (t.progress <= 0.0) return DateSpan{*start, *start};

  if (!t.actual_end_date.empty()) {
    if (const auto end = Date::parse(t.actual_end_date)) return DateSpan{*start, *end};
  }
  const auto plan = plan_span(t);
  if (!plan) return DateSpan{*start, *start};
  return DateSpan{*start, progress_end_date(*start, plan->start.days_until(plan->end) + 1, t.progress)};
}

} // namespace

std::optional<double> progress_from_actual(const DateSpan& actual, const DateSpan& plan) {
  const std::int64_t plan_days = plan.start.days_until(plan.end) + 1;
  if (plan_days <= 0) return std::nullopt;
  const double actual_days = static_cast<double>(actual.start.days_until(actual.end) + 1);
  const double pct = std::floor(actual_days / static_cast<double>(plan_days) * 100.0 + 0.5);
  return std::clamp(pct, 0.0, 100.0);
}

DragController::DragController(DragConfig cfg) : cfg_(cfg) {}

bool DragController::begin(const TaskGraph& graph, const std::string& task_id, DragType type, BarType bar,
                           double pointer_x, Granularity granularity, double cell_width) {
  if (active()) {
    log::warn("drag: begin('" + task_id + "') ignored; '" + state_->task_id + "' is still active");
    return false;
  }
  if (cell_width <= 0.0) {
    log::warn("drag: begin('" + task_id + "') ignored; cell width must be positive");
    return false;
  }
  const Task* t = graph.find(task_id);
  if (!t) {
    log::warn("drag: unknown task '" + task_id + "'");
    return false;
  }

  const std::optional<DateSpan> origin = bar == BarType::Plan ? plan_span(*t) : resolve_actual_origin(*t);
  if (!origin) {
    log::warn("drag: task '" + task_id + "' has no usable " + bar_type_to_string(bar) + " dates");
    return false;
  }

  DragState s;
  s.task_id = task_id;
  s.type = type;
  s.bar = bar;
  s.granularity = granularity;
  s.cell_width = cell_width;
  s.origin_x = pointer_x;
  s.original = *origin;
  s.current = *origin;

  // Precomputed once; ticks only look the ids up.
  if (type == DragType::Move && bar == BarType::Plan) {
    s.affected_task_ids = graph.all_descendant_ids(task_id);
    s.affected_lookup.insert(s.affected_task_ids.begin(), s.affected_task_ids.end());
  }

  log::debug("drag: begin " + drag_type_to_string(type) + " of " + bar_type_to_string(bar) + " bar '" + task_id +
             "' (" + std::to_string(s.affected_task_ids.size()) + " descendants)");

  state_ = std::move(s);
  pending_x_.reset();
  phase_ = DragPhase::Dragging;
  return true;
}

void DragController::queue_move(double pointer_x) {
  if (phase_ != DragPhase::Dragging) return;
  pending_x_ = pointer_x;
}

bool DragController::process_pending() {
  if (!pending_x_) return false;
  const double x = *pending_x_;
  pending_x_.reset();
  move(x);
  return true;
}

bool DragController::move(double pointer_x) {
  if (phase_ != DragPhase::Dragging || !state_) return false;
  DragState& s = *state_;

  const std::int64_t delta = pixel_delta_to_days(pointer_x - s.origin_x, s.cell_width, s.granularity);

  DateSpan next = s.original;
  switch (s.type) {
    case DragType::Move:
      next = s.original.shifted(delta);
      break;
    case DragType::ResizeLeft:
      next.start = s.original.start.add_days(delta);
      // Pin to the fixed end instead of swapping.
      if (next.start > next.end) next.start = next.end;
      break;
    case DragType::ResizeRight:
      next.end = s.original.end.add_days(delta);
      if (next.end < next.start) next.end = next.start;
      break;
  }

  if (next == s.current) return false;
  s.current = next;
  return true;
}

DragCommit DragController::end(const TaskGraph& graph) {
  if (phase_ != DragPhase::Dragging || !state_) {
    log::warn("drag: end() called without an active drag");
    return DragCommit{};
  }
  process_pending();

  const DragState& s = *state_;
  if (s.current == s.original) {
    log::debug("drag: '" + s.task_id + "' released at its original range; nothing to write");
    DragCommit noop;
    noop.task_id = s.task_id;
    noop.type = s.type;
    noop.bar = s.bar;
    noop.original = s.original;
    noop.committed = s.current;
    cancel();
    return noop;
  }

  DragCommit c = s.bar == BarType::Actual ? build_actual_commit(graph) : build_plan_commit(graph);
  if (c.empty()) {
    cancel();
    return c;
  }

  log::info("drag: commit '" + c.task_id + "' " + bar_type_to_string(c.bar) + " " + c.committed.start.to_string() +
            ".." + c.committed.end.to_string() + " (" + std::to_string(c.updates.size()) + " updates)");
  for (const auto& id : c.overlapping_task_ids) {
    log::warn("drag: task '" + id + "' was shifted by both the hierarchy and the dependency cascade");
  }

  phase_ = DragPhase::Committing;
  return c;
}

void DragController::complete() {
  if (phase_ != DragPhase::Committing) return;
  cancel();
}

void DragController::cancel() {
  state_.reset();
  pending_x_.reset();
  phase_ = DragPhase::Idle;
}

std::optional<DateSpan> DragController::preview_span(const Task& t, BarType bar) const {
  if (phase_ != DragPhase::Dragging || !state_) return std::nullopt;
  const DragState& s = *state_;
  if (bar != s.bar) return std::nullopt;
  if (t.id == s.task_id) return s.current;

  if (s.type == DragType::Move && s.affected_lookup.count(t.id) > 0) {
    const auto span = plan_span(t);
    if (!span) return std::nullopt;
    return span->shifted(s.original.start.days_until(s.current.start));
  }
  return std::nullopt;
}

DragCommit DragController::build_actual_commit(const TaskGraph& graph) const {
  const DragState& s = *state_;
  DragCommit c;
  c.task_id = s.task_id;
  c.type = s.type;
  c.bar = s.bar;
  c.original = s.original;
  c.committed = s.current;

  if (const Task* t = graph.find(s.task_id)) {
    if (const auto plan = plan_span(*t)) c.progress = progress_from_actual(s.current, *plan);
  }

  TaskUpdate u;
  u.task_id = s.task_id;
  u.actual_start_date = s.current.start.to_string();
  u.actual_end_date = s.current.end.to_string();
  u.progress = c.progress;
  c.updates.push_back(std::move(u));
  return c;
}

DragCommit DragController::build_plan_commit(const TaskGraph& graph) const {
  const DragState& s = *state_;
  DragCommit c;
  c.task_id = s.task_id;
  c.type = s.type;
  c.bar = s.bar;
  c.original = s.original;
  c.committed = s.current;

  BatchBuilder batch;
  batch.set_plan(s.task_id, s.current);

  // 1. Hierarchy: descendants travel with a moved parent.
  std::unordered_set<std::string> hierarchy_ids;
  if (s.type == DragType::Move) {
    const std::int64_t delta = s.original.start.days_until(s.current.start);
    if (delta != 0) {
      c.hierarchy_shift_days = delta;
      for (const auto& id : s.affected_task_ids) {
        const Task* t = graph.find(id);
        if (!t) continue;
        const auto span = plan_span(*t);
        if (!span) {
          log::warn("drag: descendant '" + id + "' has unparseable plan dates; not shifted");
          continue;
        }
        batch.set_plan(id, span->shifted(delta));
        hierarchy_ids.insert(id);
        c.hierarchy_cascade = true;
      }
    }
  }

  // 2. Dependencies: every transitive successor moves by the originating delta.
  std::int64_t shift = 0;
  if (s.type == DragType::Move) {
    shift = s.original.start.days_until(s.current.start);
  } else if (s.type == DragType::ResizeRight) {
    shift = s.original.end.days_until(s.current.end);
  }

  if (shift != 0) {
    c.dependency_shift_days = shift;
    std::deque<std::string> queue{s.task_id};
    std::unordered_set<std::string> processed;

    while (!queue.empty()) {
      const std::string cur = std::move(queue.front());
      queue.pop_front();
      if (!processed.insert(cur).second) continue;

      for (const Task* succ : graph.successors_of(cur)) {
        if (succ->id == s.task_id) {
          log::warn("drag: dependency loop leads back to '" + s.task_id + "'; loop edge ignored");
          continue;
        }
        const auto span = plan_span(*succ);
        if (!span) {
          log::warn("drag: successor '" + succ->id + "' has unparseable plan dates; not shifted");
          continue;
        }
        batch.set_plan(succ->id, span->shifted(shift));
        c.dependency_cascade = true;
        if (hierarchy_ids.count(succ->id) > 0 &&
            std::find(c.overlapping_task_ids.begin(), c.overlapping_task_ids.end(), succ->id) ==
                c.overlapping_task_ids.end()) {
          c.overlapping_task_ids.push_back(succ->id);
        }
        queue.push_back(succ->id);
      }
    }
  }

  if (c.dependency_cascade) c.pause_hint_ms = cfg_.dependency_pause_ms;
  c.updates = batch.take();
  return c;
}

} // namespace sitetrack
