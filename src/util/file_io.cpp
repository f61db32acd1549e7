#include "settlesim/util/file_io.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace settlesim {

namespace fs = std::filesystem;

namespace {

std::atomic<unsigned long long> g_temp_counter{0};

fs::path make_temp_sibling_path(const fs::path& target) {
  const auto dir = target.parent_path();
  const std::string base = target.filename().string();

  // Same directory so the final rename stays on one filesystem. The counter keeps
  // concurrent writers (one per settlement) from colliding.
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  for (int attempt = 0; attempt < 100; ++attempt) {
    const std::string name = base + ".tmp." + std::to_string(now) + "." + std::to_string(g_temp_counter.fetch_add(1));
    fs::path candidate = dir.empty() ? fs::path(name) : (dir / name);
    std::error_code ec;
    if (!fs::exists(candidate, ec) && !ec) return candidate;
  }
  throw std::runtime_error("Failed to allocate temporary file name next to: " + target.string());
}

struct TempFileCleanup {
  fs::path path;
  bool active{true};
  explicit TempFileCleanup(fs::path p) : path(std::move(p)) {}
  ~TempFileCleanup() {
    if (!active) return;
    std::error_code ec;
    fs::remove(path, ec);
  }
  void release() { active = false; }
};

fs::path resolve_existing_read_path(const fs::path& requested) {
  if (requested.empty() || requested.is_absolute()) return requested;

  std::error_code ec;
  if (fs::exists(requested, ec) && !ec) return requested;

  std::vector<fs::path> roots;

#ifdef SETTLESIM_SOURCE_DIR
  roots.emplace_back(SETTLESIM_SOURCE_DIR);
#endif

  ec.clear();
  fs::path cur = fs::current_path(ec);
  if (!ec && !cur.empty()) {
    for (int depth = 0; depth < 8; ++depth) {
      roots.push_back(cur);
      const auto parent = cur.parent_path();
      if (parent.empty() || parent == cur) break;
      cur = parent;
    }
  }

  for (const auto& root : roots) {
    ec.clear();
    const auto candidate = root / requested;
    if (fs::exists(candidate, ec) && !ec) return candidate;
  }

  return requested;
}

} // namespace

std::string read_text_file(const std::string& path) {
  const fs::path requested(path);
  const fs::path resolved = resolve_existing_read_path(requested);

  std::ifstream in(resolved, std::ios::in | std::ios::binary);
  if (!in) {
    if (resolved != requested) {
      throw std::runtime_error("Failed to open file for reading: " + path + " (resolved to: " + resolved.string() +
                               ")");
    }
    throw std::runtime_error("Failed to open file for reading: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) throw std::runtime_error("Failed to read file: " + path);
  return ss.str();
}

void ensure_dir(const std::string& path) {
  if (path.empty()) return;
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    throw std::runtime_error("Failed to create directory: " + path + " (" + ec.message() + ")");
  }
}

void write_text_file(const std::string& path, const std::string& contents) {
  const fs::path p(path);
  if (p.has_parent_path()) ensure_dir(p.parent_path().string());

  const fs::path tmp = make_temp_sibling_path(p);
  TempFileCleanup cleanup(tmp);

  {
    std::ofstream out(tmp, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + tmp.string());
    out << contents;
    out.flush();
    if (!out) throw std::runtime_error("Failed to write file: " + tmp.string());
  }

  std::error_code ec;
  fs::rename(tmp, p, ec);
  if (ec) {
    throw std::runtime_error("Failed to replace file: " + path + " (" + ec.message() + ")");
  }

  cleanup.release();
}

void append_text_file(const std::string& path, const std::string& contents) {
  const fs::path p(path);
  if (p.has_parent_path()) ensure_dir(p.parent_path().string());
  std::ofstream out(p, std::ios::out | std::ios::binary | std::ios::app);
  if (!out) throw std::runtime_error("Failed to open file for appending: " + path);
  out << contents;
  out.flush();
  if (!out) throw std::runtime_error("Failed to append to file: " + path);
}

bool file_exists(const std::string& path) {
  std::error_code ec;
  return fs::is_regular_file(fs::path(path), ec) && !ec;
}

bool remove_file(const std::string& path) {
  std::error_code ec;
  const bool removed = fs::remove(fs::path(path), ec);
  if (ec) throw std::runtime_error("Failed to remove file: " + path + " (" + ec.message() + ")");
  return removed;
}

std::vector<std::string> list_files(const std::string& dir, const std::string& extension) {
  std::vector<std::string> out;
  std::error_code ec;
  if (!fs::is_directory(fs::path(dir), ec) || ec) return out;

  for (fs::directory_iterator it(fs::path(dir), ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec) || ec) continue;
    const std::string name = it->path().filename().string();
    if (name.size() < extension.size()) continue;
    if (name.compare(name.size() - extension.size(), extension.size(), extension) != 0) continue;
    out.push_back(name);
  }
  if (ec) throw std::runtime_error("Failed to list directory: " + dir + " (" + ec.message() + ")");
  std::sort(out.begin(), out.end());
  return out;
}

} // namespace settlesim
