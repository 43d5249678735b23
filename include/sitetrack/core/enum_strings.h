#pragma once

#include <optional>
#include <string>

#include "sitetrack/core/entities.h"

namespace sitetrack {

// Shared string <-> enum conversion helpers.
//
// The strings match the persisted task documents ("in-progress", "group") and
// the CLI flags ("resize-left", "week"). The plain *_from_string forms map
// unknown strings to a safe default, which suits persisted documents. The
// try_* forms return nullopt instead, for user input that must be exact.

std::string task_type_to_string(TaskType t);
TaskType task_type_from_string(const std::string& s);

std::string task_status_to_string(TaskStatus s);
TaskStatus task_status_from_string(const std::string& s);

std::string granularity_to_string(Granularity g);
Granularity granularity_from_string(const std::string& s);
std::optional<Granularity> try_granularity_from_string(const std::string& s);

std::string progress_mode_to_string(ProgressMode m);
ProgressMode progress_mode_from_string(const std::string& s);
std::optional<ProgressMode> try_progress_mode_from_string(const std::string& s);

std::string bar_type_to_string(BarType b);
BarType bar_type_from_string(const std::string& s);
std::optional<BarType> try_bar_type_from_string(const std::string& s);

std::string drag_type_to_string(DragType t);
DragType drag_type_from_string(const std::string& s);
std::optional<DragType> try_drag_type_from_string(const std::string& s);

} // namespace sitetrack
