#include "tidewater/util/file_io.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tidewater {

namespace {

std::filesystem::path make_temp_sibling_path(const std::filesystem::path& target) {
  const auto dir = target.parent_path();
  const std::string base = target.filename().string();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();

  for (int attempt = 0; attempt < 100; ++attempt) {
    std::string name = base + ".tmp." + std::to_string(now);
    if (attempt > 0) name += "." + std::to_string(attempt);
    std::filesystem::path candidate = dir.empty() ? std::filesystem::path(name) : (dir / name);
    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec) && !ec) return candidate;
  }
  const std::string name = base + ".tmp." + std::to_string(now);
  return dir.empty() ? std::filesystem::path(name) : (dir / name);
}

struct TempFileCleanup {
  std::filesystem::path path;
  bool active{true};
  explicit TempFileCleanup(std::filesystem::path p) : path(std::move(p)) {}
  ~TempFileCleanup() {
    if (!active) return;
    std::error_code ec;
    std::filesystem::remove(path, ec);
  }
  void release() { active = false; }
};

} // namespace

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) throw std::runtime_error("Failed to open file for reading: " + path);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
  }
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) && !ec;
}

std::string join_path(const std::string& dir, const std::string& name) {
  if (dir.empty()) return name;
  return (std::filesystem::path(dir) / name).string();
}

void write_text_file(const std::string& path, const std::string& contents) {
  const std::filesystem::path p(path);
  if (p.has_parent_path()) ensure_dir(p.parent_path().string());

  const std::filesystem::path tmp = make_temp_sibling_path(p);
  TempFileCleanup cleanup(tmp);

  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    // On Windows, rename generally doesn't replace existing files, so try an explicit remove.
    std::error_code rm_ec;
    std::filesystem::remove(p, rm_ec);
    ec.clear();
    std::filesystem::rename(tmp, p, ec);
  }
  if (ec) {
    throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  }

  cleanup.release();
}

} // namespace tidewater
