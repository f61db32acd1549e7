#include "settlesim/core/repository.h"

#include <filesystem>

#include "settlesim/core/errors.h"
#include "settlesim/core/serialization.h"
#include "settlesim/core/state_validation.h"
#include "settlesim/util/file_io.h"
#include "settlesim/util/log.h"

namespace settlesim {
namespace {

const std::string kExtension = ".json";

// Ids become file names; keep them to a portable character set.
bool is_safe_id(const std::string& id) {
  if (id.empty() || id.size() > 128) return false;
  for (char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                    c == '_' || c == '.';
    if (!ok) return false;
  }
  return id != "." && id != "..";
}

} // namespace

void check_settlement(const Settlement& s, const StructureCatalog* catalog) {
  auto problems = validate_settlement(s, catalog);
  if (!problems.empty()) throw ValidationError(s.id, std::move(problems));
}

// --- InMemoryRepository ---

std::vector<std::string> InMemoryRepository::list_ids() {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<std::string> ids;
  ids.reserve(items_.size());
  for (const auto& kv : items_) ids.push_back(kv.first);
  return ids;
}

Settlement InMemoryRepository::load(const std::string& id) {
  Settlement s;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (failing_loads_.erase(id) > 0) throw PersistenceError("Injected load failure for settlement '" + id + "'");
    auto it = items_.find(id);
    if (it == items_.end()) throw PersistenceError("Settlement '" + id + "' not found");
    s = it->second;
  }
  check_settlement(s, catalog_);
  return s;
}

void InMemoryRepository::save(Settlement& s) {
  check_settlement(s, catalog_);
  std::lock_guard<std::mutex> lk(mu_);
  if (failing_saves_.erase(s.id) > 0) throw PersistenceError("Injected save failure for settlement '" + s.id + "'");
  ++s.revision;
  items_[s.id] = s;
  ++saves_;
}

void InMemoryRepository::put(const Settlement& s) {
  std::lock_guard<std::mutex> lk(mu_);
  items_[s.id] = s;
}

void InMemoryRepository::fail_loads_for(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  failing_loads_.insert(id);
}

void InMemoryRepository::fail_saves_for(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  failing_saves_.insert(id);
}

std::size_t InMemoryRepository::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return items_.size();
}

int InMemoryRepository::save_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return saves_;
}

// --- JsonDirectoryRepository ---

JsonDirectoryRepository::JsonDirectoryRepository(std::string dir, const StructureCatalog* catalog)
    : dir_(std::move(dir)), catalog_(catalog) {
  try {
    ensure_dir(dir_);
  } catch (const std::exception& e) {
    throw PersistenceError("Cannot create settlement directory '" + dir_ + "': " + e.what());
  }
}

std::string JsonDirectoryRepository::path_for(const std::string& id) const {
  if (!is_safe_id(id)) throw PersistenceError("Settlement id '" + id + "' is not usable as a file name");
  return (std::filesystem::path(dir_) / (id + kExtension)).string();
}

std::vector<std::string> JsonDirectoryRepository::list_ids() {
  std::vector<std::string> ids;
  try {
    for (const auto& file : list_files(dir_, kExtension)) {
      const std::string stem = std::filesystem::path(file).stem().string();
      if (is_safe_id(stem)) ids.push_back(stem);
    }
  } catch (const std::exception& e) {
    throw PersistenceError("Cannot list settlements in '" + dir_ + "': " + e.what());
  }
  return ids;
}

Settlement JsonDirectoryRepository::load(const std::string& id) {
  const std::string path = path_for(id);
  Settlement s;
  try {
    s = settlement_from_json(read_text_file(path));
  } catch (const std::exception& e) {
    throw PersistenceError("Cannot load settlement '" + id + "' from " + path + ": " + e.what());
  }
  if (s.id != id) {
    throw ValidationError(id, {"stored id '" + s.id + "' does not match file name"});
  }
  check_settlement(s, catalog_);
  return s;
}

void JsonDirectoryRepository::save(Settlement& s) {
  check_settlement(s, catalog_);
  const std::string path = path_for(s.id);

  Settlement copy = s;
  ++copy.revision;
  try {
    write_text_file(path, settlement_to_json(copy) + "\n");
  } catch (const std::exception& e) {
    throw PersistenceError("Cannot save settlement '" + s.id + "' to " + path + ": " + e.what());
  }
  s.revision = copy.revision;
  log::debug("Saved settlement " + s.id + " revision " + std::to_string(s.revision));
}

} // namespace settlesim
