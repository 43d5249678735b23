#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "sitetrack/util/file_io.h"

#define ST_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  // Prefer the system temp dir, but fall back to the working directory if not available.
  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "sitetrack_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  // Parent directories are created on demand.
  const fs::path target = dir / "nested" / "tasks.json";

  sitetrack::write_text_file(target.string(), "[]\n");
  ST_ASSERT(sitetrack::read_text_file(target.string()) == "[]\n");

  // Overwrite in place via temp file + rename.
  sitetrack::write_text_file(target.string(), "{\"tasks\": []}\n");
  ST_ASSERT(sitetrack::read_text_file(target.string()) == "{\"tasks\": []}\n");

  // No temp siblings are left behind.
  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(target.parent_path())) {
    const std::string name = entry.path().filename().string();
    ST_ASSERT(name.rfind(tmp_prefix, 0) != 0);
  }

  bool threw = false;
  try {
    (void)sitetrack::read_text_file((dir / "missing.json").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  ST_ASSERT(threw);

  sitetrack::ensure_dir((dir / "a" / "b").string());
  ST_ASSERT(fs::is_directory(dir / "a" / "b"));

  fs::remove_all(dir, ec);
  return 0;
}
