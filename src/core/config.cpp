#include "sitetrack/core/config.h"

#include <limits>
#include <stdexcept>

#include "sitetrack/util/json.h"
#include "sitetrack/util/log.h"

namespace sitetrack {
namespace {

double require_number(const json::Value& v, const std::string& key) {
  const double* d = v.as_number();
  if (!d) throw std::runtime_error("config: '" + key + "' must be a number");
  return *d;
}

double require_positive(const json::Value& v, const std::string& key) {
  const double d = require_number(v, key);
  if (d <= 0.0) throw std::runtime_error("config: '" + key + "' must be positive");
  return d;
}

int require_non_negative_int(const json::Value& v, const std::string& key) {
  const double d = require_number(v, key);
  if (d < 0.0) throw std::runtime_error("config: '" + key + "' must not be negative");
  if (d > static_cast<double>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("config: '" + key + "' is out of range");
  }
  return static_cast<int>(d);
}

bool require_bool(const json::Value& v, const std::string& key) {
  const bool* b = v.as_bool();
  if (!b) throw std::runtime_error("config: '" + key + "' must be true or false");
  return *b;
}

RollbackPolicy require_policy(const json::Value& v) {
  const std::string* s = v.as_string();
  if (s && *s == "keep") return RollbackPolicy::Keep;
  if (s && *s == "restore") return RollbackPolicy::Restore;
  throw std::runtime_error("config: 'drag.rollback' must be \"keep\" or \"restore\"");
}

const json::Object* section(const json::Value& root, const std::string& name) {
  const json::Value* v = root.find(name);
  if (!v) return nullptr;
  if (!v->is_object()) throw std::runtime_error("config: '" + name + "' must be an object");
  return v->as_object();
}

} // namespace

double GeometryConfig::base_cell_width(Granularity g) const {
  switch (g) {
    case Granularity::Day: return day_cell_width;
    case Granularity::Week: return week_cell_width;
    case Granularity::Month: return month_cell_width;
  }
  return week_cell_width;
}

std::string rollback_policy_to_string(RollbackPolicy p) {
  return p == RollbackPolicy::Restore ? "restore" : "keep";
}

EngineConfig load_engine_config(const std::string& json_text, const EngineConfig& base) {
  const json::Value root = json::parse(json_text);
  if (!root.is_object()) throw std::runtime_error("config: top-level value must be an object");

  EngineConfig cfg = base;

  for (const auto& [key, _] : root.object()) {
    if (key != "geometry" && key != "drag" && key != "timeline") {
      log::warn("config: ignoring unknown section '" + key + "'");
    }
  }

  if (const auto* g = section(root, "geometry")) {
    for (const auto& [key, v] : *g) {
      if (key == "day_cell_width") {
        cfg.geometry.day_cell_width = require_positive(v, "geometry.day_cell_width");
      } else if (key == "week_cell_width") {
        cfg.geometry.week_cell_width = require_positive(v, "geometry.week_cell_width");
      } else if (key == "month_cell_width") {
        cfg.geometry.month_cell_width = require_positive(v, "geometry.month_cell_width");
      } else if (key == "auto_fit") {
        cfg.geometry.auto_fit = require_bool(v, "geometry.auto_fit");
      } else {
        log::warn("config: ignoring unknown key 'geometry." + key + "'");
      }
    }
  }

  if (const auto* d = section(root, "drag")) {
    for (const auto& [key, v] : *d) {
      if (key == "dependency_pause_ms") {
        cfg.drag.dependency_pause_ms = require_non_negative_int(v, "drag.dependency_pause_ms");
      } else if (key == "rollback") {
        cfg.drag.rollback = require_policy(v);
      } else {
        log::warn("config: ignoring unknown key 'drag." + key + "'");
      }
    }
  }

  if (const auto* t = section(root, "timeline")) {
    for (const auto& [key, v] : *t) {
      if (key == "padding_days") {
        cfg.timeline.padding_days = require_non_negative_int(v, "timeline.padding_days");
      } else if (key == "default_span_months") {
        cfg.timeline.default_span_months = require_non_negative_int(v, "timeline.default_span_months");
      } else {
        log::warn("config: ignoring unknown key 'timeline." + key + "'");
      }
    }
  }

  return cfg;
}

std::string engine_config_to_json(const EngineConfig& cfg) {
  json::Object geometry;
  geometry["day_cell_width"] = cfg.geometry.day_cell_width;
  geometry["week_cell_width"] = cfg.geometry.week_cell_width;
  geometry["month_cell_width"] = cfg.geometry.month_cell_width;
  geometry["auto_fit"] = cfg.geometry.auto_fit;

  json::Object drag;
  drag["dependency_pause_ms"] = static_cast<double>(cfg.drag.dependency_pause_ms);
  drag["rollback"] = rollback_policy_to_string(cfg.drag.rollback);

  json::Object timeline;
  timeline["padding_days"] = static_cast<double>(cfg.timeline.padding_days);
  timeline["default_span_months"] = static_cast<double>(cfg.timeline.default_span_months);

  json::Object root;
  root["geometry"] = json::object(std::move(geometry));
  root["drag"] = json::object(std::move(drag));
  root["timeline"] = json::object(std::move(timeline));
  return json::stringify(json::object(std::move(root)), 2);
}

} // namespace sitetrack
