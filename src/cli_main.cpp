#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sitetrack/core/config.h"
#include "sitetrack/core/date.h"
#include "sitetrack/core/drag.h"
#include "sitetrack/core/enum_strings.h"
#include "sitetrack/core/geometry.h"
#include "sitetrack/core/scurve.h"
#include "sitetrack/core/serialization.h"
#include "sitetrack/core/summaries.h"
#include "sitetrack/core/task_graph.h"
#include "sitetrack/core/task_store.h"
#include "sitetrack/util/file_io.h"
#include "sitetrack/util/log.h"
#include "sitetrack/util/schedule_export.h"
#include "sitetrack/util/strings.h"

namespace {

#ifndef SITETRACK_VERSION
#define SITETRACK_VERSION "unknown"
#endif

double get_double_arg(int argc, char** argv, const std::string& key, double def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stod(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

// Writes to `path`, or stdout when empty.
void emit(const std::string& path, const std::string& text, bool quiet) {
  if (path.empty()) {
    std::cout << text;
    return;
  }
  sitetrack::write_text_file(path, text);
  if (!quiet) std::cerr << "Wrote " << path << "\n";
}

// Bad command-line input; main reports it and exits with status 2.
class UsageError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

template <typename T>
T parse_choice_arg(int argc, char** argv, const std::string& flag, const std::string& def,
                   std::optional<T> (*parse)(const std::string&), const char* expected) {
  const std::string raw = get_str_arg(argc, argv, flag, def);
  const auto v = parse(raw);
  if (!v) throw UsageError("Unknown " + flag + ": " + raw + " (expected " + expected + ")");
  return *v;
}

sitetrack::Date parse_date_arg(const std::string& flag, const std::string& raw) {
  const auto d = sitetrack::Date::parse(raw);
  if (!d) throw std::runtime_error(flag + ": not a date: " + raw);
  return *d;
}

sitetrack::TimeRange resolve_window(int argc, char** argv, const std::vector<sitetrack::Task>& tasks,
                                    const sitetrack::Date& today, const sitetrack::TimelineConfig& cfg) {
  const std::string from = get_str_arg(argc, argv, "--from", "");
  const std::string to = get_str_arg(argc, argv, "--to", "");
  if (!from.empty() || !to.empty()) return sitetrack::default_time_range(from, to, today, cfg);
  if (auto r = sitetrack::time_range_from_tasks(tasks, cfg)) return *r;
  return sitetrack::default_time_range("", "", today, cfg);
}

void print_usage(const char* exe) {
  std::cout << "sitetrack CLI v" << SITETRACK_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "sitetrack_cli") << " --tasks FILE [options] COMMAND\n\n";
  std::cout << "Commands:\n";
  std::cout << "  --scurve         Print the planned/actual progress curve\n";
  std::cout << "    --mode M         physical|financial (default: physical)\n";
  std::cout << "    --format F       csv|json (default: csv)\n";
  std::cout << "    --kpis           Print the headline KPIs instead of the points\n";
  std::cout << "    --as-of D        Reference date for --kpis\n";
  std::cout << "  --bars           Print bar geometry for every task as JSON\n";
  std::cout << "  --summary        Print category and group rollups as JSON\n";
  std::cout << "  --drag ID        Simulate dragging a bar by --dx pixels and print the resulting updates\n";
  std::cout << "    --bar B          plan|actual (default: plan)\n";
  std::cout << "    --type T         move|resize-left|resize-right (default: move)\n";
  std::cout << "    --dx PX          Pointer delta in pixels\n";
  std::cout << "    --apply          Apply the updates and write the task file to --out\n";
  std::cout << "  --check-parent ID --candidate ID\n";
  std::cout << "                   Check whether ID may be moved under the candidate parent\n";
  std::cout << "  --print-config   Print the effective engine configuration\n\n";
  std::cout << "Options:\n";
  std::cout << "  --tasks PATH     Task document (array or {\"tasks\": [...]})\n";
  std::cout << "  --config PATH    Engine configuration JSON\n";
  std::cout << "  --from D --to D  Visible window (default: task dates plus padding)\n";
  std::cout << "  --today D        Override today's date\n";
  std::cout << "  --view V         day|week|month (default: day)\n";
  std::cout << "  --cell-width PX  Cell width (default: from config)\n";
  std::cout << "  --container-width PX  Container width used to auto-fit cells\n";
  std::cout << "  --out PATH       Write output to a file instead of stdout\n";
  std::cout << "  --log-level L    debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet          Suppress status output\n";
  std::cout << "  -h, --help       Show this help\n";
  std::cout << "  --version        Print version and exit\n";
}

int run_drag(int argc, char** argv, const std::vector<sitetrack::Task>& stored,
             const std::vector<sitetrack::Task>& tasks, const sitetrack::EngineConfig& cfg,
             const sitetrack::TimeRange& window, double cell_width, sitetrack::Granularity view, bool quiet) {
  const std::string id = get_str_arg(argc, argv, "--drag", "");
  const auto bar =
      parse_choice_arg(argc, argv, "--bar", "plan", &sitetrack::try_bar_type_from_string, "plan|actual");
  const auto type = parse_choice_arg(argc, argv, "--type", "move", &sitetrack::try_drag_type_from_string,
                                     "move|resize-left|resize-right");
  const double dx = get_double_arg(argc, argv, "--dx", 0.0);

  const sitetrack::TaskGraph graph(tasks);
  sitetrack::DragController drag(cfg.drag);
  sitetrack::DragSessionGuard guard(drag);

  // Start at the bar's left edge so the pointer position is meaningful.
  double origin = 0.0;
  if (const auto* t = graph.find(id)) {
    const auto span = bar == sitetrack::BarType::Plan ? sitetrack::plan_span(*t) : sitetrack::actual_span(*t);
    if (span) origin = sitetrack::coordinate_x(span->start, window.start, cell_width, view);
  }

  if (!drag.begin(graph, id, type, bar, origin, view, cell_width)) {
    std::cerr << "Cannot drag task '" << id << "' (unknown id or unusable dates)\n";
    return 1;
  }
  drag.move(origin + dx);
  const sitetrack::DragCommit commit = drag.end(graph);

  if (!quiet) {
    std::cerr << sitetrack::drag_type_to_string(commit.type) << " " << sitetrack::bar_type_to_string(commit.bar)
              << " bar of " << id << ": " << sitetrack::format_date_range(commit.original.start, commit.original.end)
              << " -> " << sitetrack::format_date_range(commit.committed.start, commit.committed.end) << "\n";
    if (commit.dependency_cascade) {
      std::cerr << "Successors shifted by " << commit.dependency_shift_days << " day(s)\n";
    }
    for (const auto& o : commit.overlapping_task_ids) {
      std::cerr << "Note: " << o << " was reached by both the hierarchy and the dependency cascade\n";
    }
  }

  const std::string out_path = get_str_arg(argc, argv, "--out", "");
  if (!has_flag(argc, argv, "--apply")) {
    emit(out_path, sitetrack::serialize_update_batch_to_json(commit.updates) + "\n", quiet);
    drag.complete();
    return 0;
  }

  if (out_path.empty()) {
    std::cerr << "--apply requires --out\n";
    return 2;
  }

  sitetrack::TaskStore mirror(tasks);
  sitetrack::TaskStore persisted(stored);
  sitetrack::StoreUpdateSink sink(persisted);
  const auto result = sitetrack::apply_commit(commit, mirror, sink, cfg.drag.rollback);
  drag.complete();

  sitetrack::write_text_file(out_path, sitetrack::serialize_tasks_to_json(persisted.tasks()) + "\n");
  if (!quiet) {
    std::cerr << "Applied " << commit.updates.size() << " update(s) to " << out_path << "\n";
  }
  for (const auto& f : result.failures) {
    std::cerr << "  failed: " << f.task_id << ": " << f.error << "\n";
  }
  return result.ok ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << SITETRACK_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const bool quiet = has_flag(argc, argv, "--quiet");
    if (has_kv_arg(argc, argv, "--log-level")) {
      const std::string raw = get_str_arg(argc, argv, "--log-level", "info");
      const auto lvl = sitetrack::log::level_from_string(raw);
      if (!lvl) {
        std::cerr << "Unknown log level: " << raw << "\n";
        return 2;
      }
      sitetrack::log::set_level(*lvl);
    } else if (quiet) {
      sitetrack::log::set_level(sitetrack::log::Level::Error);
    }

    sitetrack::EngineConfig cfg;
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    if (!config_path.empty()) cfg = sitetrack::load_engine_config(sitetrack::read_text_file(config_path), cfg);

    if (has_flag(argc, argv, "--print-config")) {
      std::cout << sitetrack::engine_config_to_json(cfg) << "\n";
      return 0;
    }

    const std::string tasks_path = get_str_arg(argc, argv, "--tasks", "");
    if (tasks_path.empty()) {
      std::cerr << "--tasks is required\n\n";
      print_usage(argv[0]);
      return 2;
    }
    const auto stored = sitetrack::deserialize_tasks_from_json(sitetrack::read_text_file(tasks_path));
    // Group rows display dates and progress rolled up from their leaves.
    const auto tasks = sitetrack::derive_group_fields(stored);

    const sitetrack::Date today = has_kv_arg(argc, argv, "--today")
                                      ? parse_date_arg("--today", get_str_arg(argc, argv, "--today", ""))
                                      : sitetrack::Date::today();
    const sitetrack::TimeRange window = resolve_window(argc, argv, tasks, today, cfg.timeline);
    const auto view =
        parse_choice_arg(argc, argv, "--view", "day", &sitetrack::try_granularity_from_string, "day|week|month");

    double cell_width = get_double_arg(argc, argv, "--cell-width", 0.0);
    if (cell_width <= 0.0) {
      const double container = get_double_arg(argc, argv, "--container-width", 0.0);
      cell_width = sitetrack::effective_cell_width(cfg.geometry, window, view, container);
    }

    const std::string out_path = get_str_arg(argc, argv, "--out", "");
    sitetrack::log::debug("window " + window.start.to_string() + " .. " + window.end.to_string());

    if (has_flag(argc, argv, "--scurve")) {
      const auto mode = parse_choice_arg(argc, argv, "--mode", "physical", &sitetrack::try_progress_mode_from_string,
                                         "physical|financial");
      const auto result = sitetrack::compute_scurve(tasks, window, mode, today);

      if (has_flag(argc, argv, "--kpis")) {
        std::optional<sitetrack::Date> as_of;
        if (has_kv_arg(argc, argv, "--as-of")) as_of = parse_date_arg("--as-of", get_str_arg(argc, argv, "--as-of", ""));
        emit(out_path, sitetrack::scurve_kpis_to_json(sitetrack::compute_scurve_kpis(result, tasks, as_of, today)),
             quiet);
        return 0;
      }

      const std::string format = sitetrack::to_lower(get_str_arg(argc, argv, "--format", "csv"));
      if (format == "csv") {
        emit(out_path, sitetrack::scurve_to_csv(result), quiet);
      } else if (format == "json") {
        emit(out_path, sitetrack::scurve_to_json(result), quiet);
      } else {
        std::cerr << "Unknown --format: " << format << " (expected csv|json)\n";
        return 2;
      }
      return 0;
    }

    if (has_flag(argc, argv, "--bars")) {
      emit(out_path, sitetrack::timeline_bars_to_json(tasks, window, view, cell_width), quiet);
      return 0;
    }

    if (has_flag(argc, argv, "--summary")) {
      const auto mode = parse_choice_arg(argc, argv, "--mode", "physical", &sitetrack::try_progress_mode_from_string,
                                         "physical|financial");
      emit(out_path, sitetrack::summaries_to_json(tasks, mode), quiet);
      return 0;
    }

    if (has_kv_arg(argc, argv, "--drag")) {
      return run_drag(argc, argv, stored, tasks, cfg, window, cell_width, view, quiet);
    }

    if (has_kv_arg(argc, argv, "--check-parent")) {
      const std::string id = get_str_arg(argc, argv, "--check-parent", "");
      const std::string candidate = get_str_arg(argc, argv, "--candidate", "");
      const sitetrack::TaskGraph graph(tasks);
      if (!graph.contains(id) || !graph.contains(candidate)) {
        std::cerr << "Unknown task id\n";
        return 2;
      }
      if (candidate == id || graph.is_descendant(candidate, id)) {
        std::cout << "rejected: " << candidate << " is inside the subtree of " << id << "\n";
        return 1;
      }
      std::cout << "allowed\n";
      return 0;
    }

    std::cerr << "No command given\n\n";
    print_usage(argv[0]);
    return 2;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    sitetrack::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
