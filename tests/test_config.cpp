#include <iostream>
#include <stdexcept>
#include <string>

#include "sitetrack/core/config.h"

#define ST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool rejects(const std::string& text) {
  try {
    (void)sitetrack::load_engine_config(text);
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

} // namespace

int test_config() {
  using sitetrack::EngineConfig;
  using sitetrack::Granularity;
  using sitetrack::RollbackPolicy;

  const EngineConfig defaults;
  ST_ASSERT(defaults.geometry.base_cell_width(Granularity::Day) == 30.0);
  ST_ASSERT(defaults.geometry.base_cell_width(Granularity::Week) == 40.0);
  ST_ASSERT(defaults.geometry.base_cell_width(Granularity::Month) == 100.0);
  ST_ASSERT(defaults.geometry.auto_fit);
  ST_ASSERT(defaults.drag.dependency_pause_ms == 600);
  ST_ASSERT(defaults.drag.rollback == RollbackPolicy::Keep);
  ST_ASSERT(defaults.timeline.padding_days == 7);
  ST_ASSERT(defaults.timeline.default_span_months == 12);

  // Overlay keeps unspecified values.
  const auto cfg = sitetrack::load_engine_config(R"({
    "geometry": {"week_cell_width": 55, "auto_fit": false},
    "drag": {"rollback": "restore", "dependency_pause_ms": 0},
    "extra": {"ignored": true}
  })");
  ST_ASSERT(cfg.geometry.week_cell_width == 55.0);
  ST_ASSERT(cfg.geometry.day_cell_width == 30.0);
  ST_ASSERT(!cfg.geometry.auto_fit);
  ST_ASSERT(cfg.drag.rollback == RollbackPolicy::Restore);
  ST_ASSERT(cfg.drag.dependency_pause_ms == 0);
  ST_ASSERT(cfg.timeline.padding_days == 7);

  // Layering on a non-default base.
  const auto layered = sitetrack::load_engine_config(R"({"timeline": {"padding_days": 3}})", cfg);
  ST_ASSERT(layered.timeline.padding_days == 3);
  ST_ASSERT(layered.drag.rollback == RollbackPolicy::Restore);

  // What we print we can read back.
  const auto echoed = sitetrack::load_engine_config(sitetrack::engine_config_to_json(layered));
  ST_ASSERT(echoed.geometry.week_cell_width == 55.0);
  ST_ASSERT(echoed.timeline.padding_days == 3);
  ST_ASSERT(echoed.drag.rollback == RollbackPolicy::Restore);
  ST_ASSERT(sitetrack::rollback_policy_to_string(RollbackPolicy::Keep) == "keep");

  ST_ASSERT(rejects("[]"));
  ST_ASSERT(rejects("{\"geometry\": 5}"));
  ST_ASSERT(rejects("{\"geometry\": {\"day_cell_width\": \"wide\"}}"));
  ST_ASSERT(rejects("{\"geometry\": {\"day_cell_width\": 0}}"));
  ST_ASSERT(rejects("{\"drag\": {\"rollback\": \"maybe\"}}"));
  ST_ASSERT(rejects("{\"timeline\": {\"padding_days\": -1}}"));
  ST_ASSERT(rejects("{\"timeline\": {\"padding_days\": 1e12}}"));
  ST_ASSERT(rejects("{\"drag\": {\"dependency_pause_ms\": 3000000000}}"));
  ST_ASSERT(rejects("{"));
  ST_ASSERT(!rejects("{}"));

  return 0;
}
