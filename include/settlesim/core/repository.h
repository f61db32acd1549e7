#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "settlesim/core/catalog.h"
#include "settlesim/core/entities.h"

namespace settlesim {

// Persistent store of settlement aggregates.
//
// Implementations must allow concurrent load()/save() calls for different
// settlements. A save() writes the whole aggregate or nothing.
class SettlementRepository {
 public:
  virtual ~SettlementRepository() = default;

  // Sorted ids of every stored settlement. Throws PersistenceError.
  virtual std::vector<std::string> list_ids() = 0;

  // Throws PersistenceError when the settlement cannot be read and ValidationError
  // when it was read but violates the aggregate invariants.
  virtual Settlement load(const std::string& id) = 0;

  // Validates, increments `s.revision` and stores the aggregate. Throws
  // ValidationError (nothing written) or PersistenceError (stored copy unchanged).
  virtual void save(Settlement& s) = 0;
};

// Shared boundary checks used by the repositories. Throws ValidationError.
void check_settlement(const Settlement& s, const StructureCatalog* catalog);

// Thread-safe in-memory store (tests, --seed-demo dry runs).
class InMemoryRepository : public SettlementRepository {
 public:
  explicit InMemoryRepository(const StructureCatalog* catalog = nullptr) : catalog_(catalog) {}

  std::vector<std::string> list_ids() override;
  Settlement load(const std::string& id) override;
  void save(Settlement& s) override;

  // Stores without validation or revision bump (test setup, corrupt fixtures).
  void put(const Settlement& s);

  // Makes the next load()/save() of `id` throw PersistenceError.
  void fail_loads_for(const std::string& id);
  void fail_saves_for(const std::string& id);

  std::size_t size() const;
  int save_count() const;

 private:
  const StructureCatalog* catalog_{nullptr};
  mutable std::mutex mu_;
  std::map<std::string, Settlement> items_;
  std::set<std::string> failing_loads_;
  std::set<std::string> failing_saves_;
  int saves_{0};
};

// One "<id>.json" file per settlement under a directory. Writes go through a
// temporary sibling and a rename, so a crash never leaves a truncated file.
class JsonDirectoryRepository : public SettlementRepository {
 public:
  explicit JsonDirectoryRepository(std::string dir, const StructureCatalog* catalog = nullptr);

  const std::string& dir() const { return dir_; }

  std::vector<std::string> list_ids() override;
  Settlement load(const std::string& id) override;
  void save(Settlement& s) override;

  std::string path_for(const std::string& id) const;

 private:
  std::string dir_;
  const StructureCatalog* catalog_{nullptr};
};

} // namespace settlesim
