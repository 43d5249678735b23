#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include "sitetrack/core/config.h"
#include "sitetrack/core/entities.h"
#include "sitetrack/core/task_graph.h"

namespace sitetrack {

enum class DragPhase { Idle, Dragging, Committing };

// Transient state of one bar interaction.
struct DragState {
  std::string task_id;
  DragType type{DragType::Move};
  BarType bar{BarType::Plan};

  Granularity granularity{Granularity::Day};
  double cell_width{1.0};

  // Pointer x at begin().
  double origin_x{0.0};

  DateSpan original;
  DateSpan current;

  // Every descendant of the dragged task, pre-order. Filled once at begin()
  // for a plan-bar move and empty otherwise.
  std::vector<std::string> affected_task_ids;
  std::unordered_set<std::string> affected_lookup;
};

// Everything a finished drag wants written.
struct DragCommit {
  std::string task_id;
  DragType type{DragType::Move};
  BarType bar{BarType::Plan};
  DateSpan original;
  DateSpan committed;

  // One merged update per task id. When non-empty the dragged task comes first.
  // Empty when the committed range equals the original one.
  UpdateBatch updates;

  // Delta applied to descendants (plan move only).
  std::int64_t hierarchy_shift_days{0};
  // Delta applied to every transitive successor.
  std::int64_t dependency_shift_days{0};

  bool hierarchy_cascade{false};
  bool dependency_cascade{false};

  // Suggested pause before applying, so the user can see successors move.
  int pause_hint_ms{0};

  // Tasks reached by both the hierarchy and the dependency cascade. The
  // dependency value was kept (it is computed last); callers may want to
  // surface these for review.
  std::vector<std::string> overlapping_task_ids;

  // Recomputed progress for an actual-bar edit.
  std::optional<double> progress;

  bool empty() const { return updates.empty(); }
};

// State machine for interactive bar edits: Idle -> Dragging -> Committing -> Idle.
//
// Only one interaction runs at a time; begin() refuses while another is active.
// Pointer moves may arrive faster than the display refreshes: queue_move()
// keeps only the latest position and process_pending() applies it, so a frame
// loop can call it once per refresh. move() processes immediately.
class DragController {
 public:
  explicit DragController(DragConfig cfg = {});

  DragPhase phase() const { return phase_; }
  bool active() const { return phase_ != DragPhase::Idle; }

  // nullptr when idle.
  const DragState* state() const { return state_ ? &*state_ : nullptr; }

  // Starts dragging `task_id`. Resolves the original range (see actual_span()
  // for the actual bar) and, for a plan-bar move, the descendant set.
  // Returns false (and stays idle) when another interaction is active, the task
  // is unknown, its dates do not parse or cell_width is not positive.
  bool begin(const TaskGraph& graph, const std::string& task_id, DragType type, BarType bar, double pointer_x,
             Granularity granularity, double cell_width);

  void queue_move(double pointer_x);

  // Applies the latest queued move, if any. Returns true when one was applied.
  bool process_pending();

  // Applies a pointer position now. Returns true when the current range changed.
  bool move(double pointer_x);

  // Finishes the drag and computes the writes. A pending move is applied first.
  // Enters Committing when there is something to write; returns to Idle for a
  // no-op. Call complete() once the caller has applied the commit.
  DragCommit end(const TaskGraph& graph);

  void complete();

  // Abandons the interaction from any phase without producing writes.
  void cancel();

  // Range a bar should display right now: the live range for the dragged bar,
  // the hierarchy-shifted plan range for a descendant of a moving task, or
  // nullopt when the drag does not affect this bar.
  std::optional<DateSpan> preview_span(const Task& t, BarType bar) const;

 private:
  DragCommit build_actual_commit(const TaskGraph& graph) const;
  DragCommit build_plan_commit(const TaskGraph& graph) const;

  DragConfig cfg_;
  DragPhase phase_{DragPhase::Idle};
  std::optional<DragState> state_;
  std::optional<double> pending_x_;
};

// Returns the controller to Idle when it leaves scope, whatever path the
// interaction took (pointer left the window, an exception unwound the frame).
class DragSessionGuard {
 public:
  explicit DragSessionGuard(DragController& controller) : controller_(controller) {}
  ~DragSessionGuard() {
    if (controller_.active()) controller_.cancel();
  }

  DragSessionGuard(const DragSessionGuard&) = delete;
  DragSessionGuard& operator=(const DragSessionGuard&) = delete;

 private:
  DragController& controller_;
};

// Progress implied by an actual range: round(100 * actual_days / plan_days),
// clamped to [0, 100]. nullopt when the plan range is not positive.
std::optional<double> progress_from_actual(const DateSpan& actual, const DateSpan& plan);

} // namespace sitetrack
