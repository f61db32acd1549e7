#include <iostream>
#include <string>
#include <vector>

#include "settlesim/core/catalog.h"
#include "settlesim/core/state_validation.h"

#define SS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool mentions(const std::vector<std::string>& errors, const std::string& needle) {
  for (const auto& e : errors) {
    if (e.find(needle) != std::string::npos) return true;
  }
  return false;
}

settlesim::Settlement valid_settlement() {
  settlesim::Settlement s;
  s.id = "valid";
  settlesim::StructureInstance st;
  st.id = settlesim::allocate_local_id(s, "structure");
  st.type = "FARM";
  s.structures.push_back(st);
  settlesim::PopulationState p;
  p.current = 5;
  p.capacity = 10;
  s.population = p;
  return s;
}

} // namespace

int test_state_validation() {
  settlesim::StructureCatalog catalog;
  settlesim::StructureDef farm;
  farm.type = "FARM";
  farm.max_level = 3;
  catalog.structures[farm.type] = farm;

  // A fresh settlement is internally consistent.
  {
    const auto errors = settlesim::validate_settlement(valid_settlement(), &catalog);
    if (!errors.empty()) {
      std::cerr << "State validation failed for a fresh settlement:\n";
      for (const auto& e : errors) std::cerr << "  - " << e << "\n";
      return 1;
    }
  }

  // Storage outside [0, capacity].
  {
    auto s = valid_settlement();
    s.storage[settlesim::Resource::Stone].amount = 1200.0;
    SS_ASSERT(mentions(settlesim::validate_settlement(s), "storage stone"));
  }

  // Population above capacity.
  {
    auto s = valid_settlement();
    s.population->current = 11;
    SS_ASSERT(mentions(settlesim::validate_settlement(s), "exceeds capacity"));
  }

  // Structure health, level and duplicate ids.
  {
    auto s = valid_settlement();
    s.structures[0].health = 120.0;
    s.structures[0].level = 4;
    s.structures.push_back(s.structures[0]);
    const auto errors = settlesim::validate_settlement(s, &catalog);
    SS_ASSERT(mentions(errors, "health"));
    SS_ASSERT(mentions(errors, "exceeds max 3"));
    SS_ASSERT(mentions(errors, "duplicate id"));
    // Without a catalog the level cap is unknown.
    SS_ASSERT(!mentions(settlesim::validate_settlement(s), "exceeds max"));
  }

  // Queue positions and slot limits.
  {
    auto s = valid_settlement();
    for (int i = 0; i < 3; ++i) {
      settlesim::ConstructionEntry e;
      e.id = settlesim::allocate_local_id(s, "build");
      e.position = i + 1;
      e.status = settlesim::ConstructionStatus::Active;
      s.construction.push_back(e);
    }
    SS_ASSERT(settlesim::validate_settlement(s, &catalog, 3).empty());
    SS_ASSERT(mentions(settlesim::validate_settlement(s, &catalog, 2), "slots"));
    s.construction[2].position = 7;
    SS_ASSERT(mentions(settlesim::validate_settlement(s), "position 7"));
  }

  // Disaster transitions must follow the lifecycle order.
  {
    auto s = valid_settlement();
    settlesim::DisasterEvent d;
    d.id = "disaster-9";
    d.severity = 40;
    d.phase = settlesim::DisasterPhase::Impact;
    d.warning_at = 1000;
    d.imminent_at = 2000;
    d.impact_start_at = 3000;
    d.impact_end_at = 4000;
    d.transitions = {{settlesim::DisasterPhase::Warning, 1000},
                     {settlesim::DisasterPhase::Imminent, 2000},
                     {settlesim::DisasterPhase::Impact, 3000}};
    s.active_disaster = d;
    SS_ASSERT(settlesim::validate_settlement(s).empty());

    // Skipping IMMINENT.
    s.active_disaster->transitions.erase(s.active_disaster->transitions.begin() + 1);
    SS_ASSERT(mentions(settlesim::validate_settlement(s), "transition 1"));

    // A resolved disaster belongs in the history.
    s.active_disaster = d;
    s.active_disaster->phase = settlesim::DisasterPhase::Resolved;
    s.active_disaster->transitions.push_back({settlesim::DisasterPhase::Aftermath, 4000});
    s.active_disaster->transitions.push_back({settlesim::DisasterPhase::Resolved, 5000});
    SS_ASSERT(mentions(settlesim::validate_settlement(s), "RESOLVED"));
  }

  // History is capped.
  {
    auto s = valid_settlement();
    s.disaster_history.resize(settlesim::kMaxDisasterHistory + 1);
    SS_ASSERT(mentions(settlesim::validate_settlement(s), "history"));
  }

  return 0;
}
