#pragma once

#include <string>

#include "sitetrack/core/entities.h"

namespace sitetrack {

// What to do with the optimistic in-memory mirror when the persistence sink
// rejects part of a committed batch.
enum class RollbackPolicy {
  Keep,    // leave the optimistic values in place; the caller reconciles
  Restore, // put the pre-commit values back for every failed item
};

struct GeometryConfig {
  // Base cell widths in pixels per granularity.
  double day_cell_width{30.0};
  double week_cell_width{40.0};
  double month_cell_width{100.0};

  // Stretch cells when the whole timeline is narrower than the container.
  bool auto_fit{true};

  double base_cell_width(Granularity g) const;
};

struct DragConfig {
  // Presentation hint attached to commits that shifted successors. The engine
  // never sleeps; the caller decides whether to pause before applying.
  int dependency_pause_ms{600};

  RollbackPolicy rollback{RollbackPolicy::Keep};
};

struct TimelineConfig {
  // Days added on both sides when a window is derived from task dates.
  int padding_days{7};

  // Length of the fallback window when no dates are available.
  int default_span_months{12};
};

struct EngineConfig {
  GeometryConfig geometry;
  DragConfig drag;
  TimelineConfig timeline;
};

// Overlays a JSON object onto `base`:
//
//   {
//     "geometry": {"day_cell_width": 30, "week_cell_width": 40, "month_cell_width": 100, "auto_fit": true},
//     "drag": {"dependency_pause_ms": 600, "rollback": "keep" | "restore"},
//     "timeline": {"padding_days": 7, "default_span_months": 12}
//   }
//
// Missing keys keep their base values; unknown keys are logged and ignored.
// Throws std::runtime_error on malformed JSON or a value of the wrong type.
EngineConfig load_engine_config(const std::string& json_text, const EngineConfig& base = {});

std::string engine_config_to_json(const EngineConfig& cfg);

std::string rollback_policy_to_string(RollbackPolicy p);

} // namespace sitetrack
