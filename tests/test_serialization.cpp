#include <iostream>
#include <stdexcept>
#include <string>

#include "settlesim/core/serialization.h"
#include "settlesim/util/json.h"
#include "settlesim/util/time.h"

#define SS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool parse_fails(const std::string& text) {
  try {
    (void)settlesim::settlement_from_json(text);
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

settlesim::Settlement sample_settlement() {
  using settlesim::Resource;
  const settlesim::Millis t0 = settlesim::parse_iso8601("2026-04-10T08:00:00Z");

  settlesim::Settlement s;
  s.id = "riverside";
  s.owner_id = "player-1";
  s.name = "Riverside";
  s.location = {"world-1", "region-east", "tile-0003"};
  s.world_template = "SURVIVAL";
  s.resilience = 12.0;
  s.created_at = t0;
  s.storage[Resource::Food] = {420.5, 1500.0};
  s.storage[Resource::Ore] = {3.0, 1000.0};

  settlesim::StructureInstance farm;
  farm.id = settlesim::allocate_local_id(s, "structure");
  farm.type = "FARM";
  farm.level = 2;
  farm.health = 87.5;
  farm.tile_id = "tile-0003";
  farm.built_at = t0;
  s.structures.push_back(farm);

  settlesim::PopulationState p;
  p.current = 7;
  p.capacity = 15;
  p.happiness = 64.25;
  p.happiness_label = "Happy";
  p.growth_rate = 0.18;
  p.growth_accumulator = 0.42;
  p.status = settlesim::PopulationStatus::Growing;
  p.updated_at = t0 + 3600000;
  s.population = p;

  settlesim::ConstructionEntry e;
  e.id = settlesim::allocate_local_id(s, "build");
  e.settlement_id = s.id;
  e.structure_type = "HOUSE";
  e.position = 1;
  e.status = settlesim::ConstructionStatus::Active;
  e.emergency = true;
  e.queued_at = t0;
  e.started_at = t0;
  e.completes_at = t0 + 300000;
  e.duration_ms = 300000;
  e.reported_progress = 25;
  s.construction.push_back(e);

  settlesim::DisasterEvent d;
  d.id = settlesim::allocate_local_id(s, "disaster");
  d.type = settlesim::DisasterType::Hurricane;
  d.severity = 66;
  d.severity_level = settlesim::SeverityLevel::Major;
  d.biome = "COASTAL";
  d.region_id = "region-east";
  d.phase = settlesim::DisasterPhase::Impact;
  d.warning_at = t0;
  d.imminent_at = t0 + 1000;
  d.impact_start_at = t0 + 2000;
  d.impact_end_at = t0 + 9000;
  d.transitions = {{settlesim::DisasterPhase::Warning, t0},
                   {settlesim::DisasterPhase::Imminent, t0 + 1000},
                   {settlesim::DisasterPhase::Impact, t0 + 2000}};
  d.damage_ticks_total = 9;
  d.damage_ticks_applied = 2;
  d.preparedness = 22.5;
  d.net_damage = 48.75;
  d.casualties_planned = 3;
  d.casualties = 1;
  d.structures_damaged = {"structure-1"};
  d.resources_lost[Resource::Food] = 40.0;
  s.active_disaster = d;

  s.revision = 4;
  return s;
}

} // namespace

int test_serialization() {
  const auto s = sample_settlement();
  const std::string text = settlesim::settlement_to_json(s);

  // Sorted keys and ISO timestamps.
  {
    SS_ASSERT(text.find("\"save_version\": 1") != std::string::npos);
    SS_ASSERT(text.find("\"created_at\": \"2026-04-10T08:00:00Z\"") != std::string::npos);
    SS_ASSERT(text.find("\"active_disaster\"") < text.find("\"construction\""));
    // Writing twice yields identical text.
    SS_ASSERT(settlesim::settlement_to_json(s) == text);
  }

  const auto back = settlesim::settlement_from_json(text);
  {
    SS_ASSERT(back.id == s.id);
    SS_ASSERT(back.owner_id == "player-1");
    SS_ASSERT(back.location.tile_id == "tile-0003");
    SS_ASSERT(back.world_template == "SURVIVAL");
    SS_ASSERT(back.created_at == s.created_at);
    SS_ASSERT(back.next_local_id == s.next_local_id);
    SS_ASSERT(back.revision == 4);
    SS_ASSERT(back.storage[settlesim::Resource::Food].amount == 420.5);
    SS_ASSERT(back.storage[settlesim::Resource::Food].capacity == 1500.0);

    SS_ASSERT(back.structures.size() == 1);
    SS_ASSERT(back.structures[0].level == 2);
    SS_ASSERT(back.structures[0].health == 87.5);
    SS_ASSERT(back.structures[0].tile_id == "tile-0003");

    SS_ASSERT(back.population.has_value());
    SS_ASSERT(back.population->current == 7);
    SS_ASSERT(back.population->growth_accumulator == 0.42);
    SS_ASSERT(back.population->status == settlesim::PopulationStatus::Growing);

    SS_ASSERT(back.construction.size() == 1);
    SS_ASSERT(back.construction[0].emergency);
    SS_ASSERT(back.construction[0].status == settlesim::ConstructionStatus::Active);
    SS_ASSERT(back.construction[0].completes_at == s.construction[0].completes_at);
    SS_ASSERT(back.construction[0].reported_progress == 25);

    SS_ASSERT(back.active_disaster.has_value());
    const auto& d = *back.active_disaster;
    SS_ASSERT(d.type == settlesim::DisasterType::Hurricane);
    SS_ASSERT(d.phase == settlesim::DisasterPhase::Impact);
    SS_ASSERT(d.transitions.size() == 3);
    SS_ASSERT(d.transitions[2].at == s.active_disaster->impact_start_at);
    SS_ASSERT(d.damage_ticks_applied == 2);
    SS_ASSERT(d.net_damage == 48.75);
    SS_ASSERT(d.structures_damaged.size() == 1);
    SS_ASSERT(d.resources_lost[settlesim::Resource::Food] == 40.0);
    SS_ASSERT(d.aftermath_end_at == 0);

    SS_ASSERT(settlesim::settlement_to_json(back) == text);
  }

  // A settlement without a population record stays without one.
  {
    settlesim::Settlement bare;
    bare.id = "bare";
    const auto again = settlesim::settlement_from_json(settlesim::settlement_to_json(bare));
    SS_ASSERT(!again.population.has_value());
    SS_ASSERT(!again.active_disaster.has_value());
    SS_ASSERT(again.world_template == "STANDARD");
  }

  // Malformed documents.
  {
    SS_ASSERT(parse_fails("{"));
    SS_ASSERT(parse_fails("[]"));
    SS_ASSERT(parse_fails("{\"name\": \"no id\"}"));
    SS_ASSERT(parse_fails("{\"id\": \"x\", \"save_version\": 99}"));
    SS_ASSERT(parse_fails("{\"id\": \"x\", \"active_disaster\": {\"id\": \"d\", \"type\": \"METEOR\"}}"));
  }

  return 0;
}
