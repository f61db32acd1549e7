#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "settlesim/util/file_io.h"

#define SS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_file_io() {
  namespace fs = std::filesystem;

  struct CwdGuard {
    fs::path saved;
    explicit CwdGuard(fs::path p) : saved(std::move(p)) {}
    ~CwdGuard() {
      std::error_code ec_restore;
      fs::current_path(saved, ec_restore);
    }
  };

  // Prefer the system temp dir, but fall back to the repo root if not available.
  std::error_code ec;
  fs::path dir = fs::temp_directory_path(ec);
  if (ec || dir.empty()) dir = fs::path(".");

  const auto nonce = std::chrono::steady_clock::now().time_since_epoch().count();
  dir /= "settlesim_test_file_io";
  dir /= std::to_string(static_cast<long long>(nonce));

  settlesim::ensure_dir(dir.string());
  SS_ASSERT(fs::is_directory(dir));

  const fs::path target = dir / "hill-fort.json";

  settlesim::write_text_file(target.string(), "{\"revision\": 1}\n");
  SS_ASSERT(settlesim::read_text_file(target.string()) == "{\"revision\": 1}\n");

  // Overwrite goes through a temp sibling and a rename.
  settlesim::write_text_file(target.string(), "{\"revision\": 2}\n");
  SS_ASSERT(settlesim::read_text_file(target.string()) == "{\"revision\": 2}\n");
  SS_ASSERT(settlesim::file_exists(target.string()));

  // Parent directories are created on demand.
  const fs::path nested = dir / "events" / "2026" / "events.jsonl";
  settlesim::append_text_file(nested.string(), "{\"seq\":1}\n");
  settlesim::append_text_file(nested.string(), "{\"seq\":2}\n");
  SS_ASSERT(settlesim::read_text_file(nested.string()) == "{\"seq\":1}\n{\"seq\":2}\n");

  settlesim::write_text_file((dir / "bay.json").string(), "{}");
  settlesim::write_text_file((dir / "notes.txt").string(), "ignored");
  const auto files = settlesim::list_files(dir.string(), ".json");
  SS_ASSERT(files.size() == 2);
  SS_ASSERT(files[0] == "bay.json");
  SS_ASSERT(files[1] == "hill-fort.json");
  SS_ASSERT(settlesim::list_files((dir / "missing").string(), ".json").empty());

  SS_ASSERT(settlesim::remove_file((dir / "notes.txt").string()));
  SS_ASSERT(!settlesim::remove_file((dir / "notes.txt").string()));
  SS_ASSERT(!settlesim::file_exists((dir / "notes.txt").string()));
  SS_ASSERT(!settlesim::file_exists(dir.string()));

  bool threw = false;
  try {
    (void)settlesim::read_text_file((dir / "nope.json").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  SS_ASSERT(threw);

  // Relative content paths resolve from non-repo working directories too.
  const fs::path old_cwd = fs::current_path(ec);
  SS_ASSERT(!ec);
  CwdGuard cwd_guard(old_cwd);
  fs::current_path(dir, ec);
  SS_ASSERT(!ec);

  const std::string catalog = settlesim::read_text_file("data/catalog.json");
  SS_ASSERT(catalog.find("\"structures\"") != std::string::npos);

  fs::current_path(old_cwd, ec);
  SS_ASSERT(!ec);

  // No temp siblings are left behind.
  const std::string tmp_prefix = target.filename().string() + ".tmp";
  for (const auto& entry : fs::directory_iterator(dir)) {
    const std::string name = entry.path().filename().string();
    SS_ASSERT(name.rfind(tmp_prefix, 0) != 0);
  }

  fs::remove_all(dir, ec);
  return 0;
}
