#include "sitetrack/util/file_io.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sitetrack {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned> g_temp_counter{0};

// "<name>.tmp.<ticks>.<n>" next to the target, so the final rename stays on
// one filesystem.
fs::path temp_sibling(const fs::path& target) {
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  const unsigned n = g_temp_counter.fetch_add(1);
  const std::string name =
      target.filename().string() + ".tmp." + std::to_string(static_cast<long long>(ticks)) + "." + std::to_string(n);
  return target.has_parent_path() ? target.parent_path() / name : fs::path(name);
}

// Owns a temp file until release(); removes it on every other exit path.
class TempFile {
 public:
  explicit TempFile(fs::path p) : path_(std::move(p)) {}
  ~TempFile() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove(path_, ec);
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  const fs::path& path() const { return path_; }
  void release() { path_.clear(); }

 private:
  fs::path path_;
};

void replace_file(const fs::path& from, const fs::path& to, const std::string& display) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec) return;

  // Some platforms refuse to rename over an existing file.
  std::error_code rm_ec;
  fs::remove(to, rm_ec);
  ec.clear();
  fs::rename(from, to, ec);
  if (ec) throw std::runtime_error("Failed to replace file: " + display + " (" + ec.message() + ")");
}

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path p(path);
  std::error_code ec;
  if (fs::is_directory(p, ec)) throw std::runtime_error("Expected a file but found a directory: " + path);

  std::ifstream in(p, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + path);
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path target(path);
  if (target.has_parent_path()) ensure_dir(target.parent_path().string());

  TempFile tmp(temp_sibling(target));
  {
    std::ofstream out(tmp.path(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.path().string());
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.path().string());
  }

  replace_file(tmp.path(), target, path);
  tmp.release();
}

} // namespace sitetrack
