#include <iostream>
#include <string>

#include "sitetrack/util/log.h"
#include "sitetrack/util/strings.h"

#define ST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_util() {
  ST_ASSERT(sitetrack::to_lower("Resize-Left") == "resize-left");
  ST_ASSERT(sitetrack::trim_copy("  week \n") == "week");
  ST_ASSERT(sitetrack::trim_copy(" \t ").empty());

  const auto parts = sitetrack::split("a,,b", ',');
  ST_ASSERT(parts.size() == 3);
  ST_ASSERT(parts[1].empty());
  ST_ASSERT(parts[2] == "b");

  ST_ASSERT(sitetrack::csv_escape("plain") == "plain");
  ST_ASSERT(sitetrack::csv_escape("a,b") == "\"a,b\"");
  ST_ASSERT(sitetrack::csv_escape("say \"hi\"") == "\"say \"\"hi\"\"\"");

  ST_ASSERT(sitetrack::format_fixed(12.5, 2) == "12.50");
  ST_ASSERT(sitetrack::format_fixed(2.0 / 3.0, 2) == "0.67");
  ST_ASSERT(sitetrack::format_fixed(7.0, 0) == "7");

  namespace log = sitetrack::log;
  ST_ASSERT(log::level_from_string("WARNING") == log::Level::Warn);
  ST_ASSERT(log::level_from_string(" debug ") == log::Level::Debug);
  ST_ASSERT(log::level_from_string("off") == log::Level::Off);
  ST_ASSERT(!log::level_from_string("chatty"));
  ST_ASSERT(std::string(log::level_label(log::Level::Error)) == "ERROR");

  const log::Level saved = log::level();
  log::set_level(log::Level::Off);
  ST_ASSERT(log::level() == log::Level::Off);
  log::error("suppressed while the level is off");
  log::set_level(saved);

  return 0;
}
