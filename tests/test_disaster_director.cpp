#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "settlesim/core/catalog.h"
#include "settlesim/core/disaster_director.h"
#include "settlesim/core/events.h"
#include "settlesim/core/state_validation.h"
#include "settlesim/util/hash_rng.h"
#include "settlesim/util/time.h"

#define SS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using settlesim::DisasterPhase;
using settlesim::DisasterType;
using settlesim::EventType;
using settlesim::kMsPerSecond;

settlesim::StructureCatalog disaster_catalog() {
  auto c = settlesim::builtin_catalog_defaults();
  const auto add = [&](const std::string& type) -> settlesim::StructureDef& {
    settlesim::StructureDef d;
    d.type = type;
    c.structures[type] = d;
    return c.structures[type];
  };
  add("FARM");
  add("STORAGE").modifiers.push_back({settlesim::kModStorageCapacity, 500.0, std::nullopt});
  add("HOSPITAL");
  add("EMERGENCY_SHELTER").modifiers.push_back({settlesim::kModShelterCapacity, 50.0, std::nullopt});
  add("SEISMIC_FOUNDATION").resistances[DisasterType::Earthquake] = 0.5;
  add("FORTRESS").resistance_all = 0.3;
  add("DEEP_MINING_COMPLEX").resistances[DisasterType::Earthquake] = -0.4;
  return c;
}

settlesim::Settlement base_settlement() {
  settlesim::Settlement s;
  s.id = "quake-town";
  s.location.region_id = "region-a";
  s.location.tile_id = "tile-a";
  s.resilience = 50.0;
  return s;
}

settlesim::StructureInstance structure(settlesim::Settlement& s, const std::string& type, double health = 100.0) {
  settlesim::StructureInstance st;
  st.id = settlesim::allocate_local_id(s, "structure");
  st.type = type;
  st.health = health;
  return st;
}

std::vector<EventType> types_of(const settlesim::EventBuffer& events) {
  std::vector<EventType> out;
  for (const auto& e : events.events()) out.push_back(e.type);
  return out;
}

} // namespace

int test_disaster_director() {
  const auto catalog = disaster_catalog();
  const settlesim::DisasterDirector director(catalog);
  const settlesim::Millis t0 = settlesim::parse_iso8601("2026-05-01T12:00:00Z");

  // Severity bands and resilience gains.
  {
    SS_ASSERT(settlesim::severity_level_for(0) == settlesim::SeverityLevel::Mild);
    SS_ASSERT(settlesim::severity_level_for(24) == settlesim::SeverityLevel::Mild);
    SS_ASSERT(settlesim::severity_level_for(25) == settlesim::SeverityLevel::Moderate);
    SS_ASSERT(settlesim::severity_level_for(74) == settlesim::SeverityLevel::Major);
    SS_ASSERT(settlesim::severity_level_for(75) == settlesim::SeverityLevel::Catastrophic);
    SS_ASSERT(settlesim::resilience_gain(settlesim::SeverityLevel::Major) == 10.0);

    settlesim::util::HashRng rng(42);
    for (int i = 0; i < 200; ++i) {
      const int sev = settlesim::roll_severity(rng, 1.0);
      SS_ASSERT(sev >= 20 && sev <= 80);
    }
  }

  // Severity 80 against resilience 50 and no defenses: preparedness 10, net damage
  // within 70 +/- 20%.
  {
    auto s = base_settlement();
    settlesim::EventBuffer events(s.id);
    SS_ASSERT(director.start(s, DisasterType::Earthquake, 80, "GRASSLAND", t0, events));
    SS_ASSERT(events.count(EventType::DisasterWarning) == 1);
    SS_ASSERT(s.active_disaster->severity_level == settlesim::SeverityLevel::Catastrophic);

    const auto& warn = events.events().front();
    SS_ASSERT(warn.fields.count("recommendedActions") == 1);
    SS_ASSERT(warn.fields.at("timeToImpactS").number_value() == 3600.0);

    settlesim::util::HashRng rng(9);
    director.advance(s, t0 + 3600 * kMsPerSecond, rng, events);
    SS_ASSERT(s.active_disaster->phase == DisasterPhase::Impact);
    SS_ASSERT(std::fabs(s.active_disaster->preparedness - 10.0) < 1e-9);
    SS_ASSERT(s.active_disaster->net_damage >= 56.0);
    SS_ASSERT(s.active_disaster->net_damage <= 84.0);
  }

  // Step-by-step lifecycle.
  {
    auto s = base_settlement();
    settlesim::EventBuffer events(s.id);
    settlesim::util::HashRng rng(1);
    SS_ASSERT(director.start(s, DisasterType::Earthquake, 40, "GRASSLAND", t0, events));
    // A second disaster cannot start while one is active.
    SS_ASSERT(!director.start(s, DisasterType::Flood, 40, "GRASSLAND", t0, events));

    SS_ASSERT(!director.advance(s, t0 + 1000 * kMsPerSecond, rng, events));
    SS_ASSERT(s.active_disaster->phase == DisasterPhase::Warning);

    SS_ASSERT(director.advance(s, t0 + 1800 * kMsPerSecond, rng, events));
    SS_ASSERT(s.active_disaster->phase == DisasterPhase::Imminent);

    SS_ASSERT(director.advance(s, t0 + 3600 * kMsPerSecond, rng, events));
    // A 600 s earthquake has one damage tick, due at impact start.
    SS_ASSERT(s.active_disaster->phase == DisasterPhase::Impact);
    SS_ASSERT(s.active_disaster->damage_ticks_applied == 1);

    SS_ASSERT(director.advance(s, t0 + 4200 * kMsPerSecond, rng, events));
    SS_ASSERT(s.active_disaster->phase == DisasterPhase::Aftermath);
    SS_ASSERT(director.repair_cost_multiplier(s, t0 + 5000 * kMsPerSecond) == 0.5);
    SS_ASSERT(settlesim::validate_settlement(s, &catalog).empty());

    const settlesim::Millis resolve_at = s.active_disaster->aftermath_end_at;
    SS_ASSERT(resolve_at == t0 + (4200 + 172800) * kMsPerSecond);
    SS_ASSERT(director.advance(s, resolve_at, rng, events));
    SS_ASSERT(!s.active_disaster.has_value());
    SS_ASSERT(director.repair_cost_multiplier(s, resolve_at) == 1.0);
    SS_ASSERT(s.disaster_history.size() == 1);
    SS_ASSERT(s.disaster_history[0].phase == DisasterPhase::Resolved);
    SS_ASSERT(s.resilience == 55.0);
  }

  // A late advance walks every overdue transition in order, at the scheduled times.
  {
    auto s = base_settlement();
    s.structures.push_back(structure(s, "FARM"));
    settlesim::EventBuffer events(s.id);
    settlesim::util::HashRng rng(5);
    SS_ASSERT(director.start(s, DisasterType::Earthquake, 60, "GRASSLAND", t0, events));
    events.clear();

    SS_ASSERT(director.advance(s, t0 + 7 * 86400 * kMsPerSecond, rng, events));
    SS_ASSERT(!s.active_disaster.has_value());

    std::vector<EventType> lifecycle;
    for (EventType t : types_of(events)) {
      if (t == EventType::StructureDamaged || t == EventType::StructureDestroyed) continue;
      lifecycle.push_back(t);
    }
    const std::vector<EventType> expected = {EventType::DisasterImminent,     EventType::DisasterImpactStart,
                                             EventType::DisasterDamageUpdate, EventType::DisasterImpactEnd,
                                             EventType::DisasterAftermath,    EventType::DisasterResolved};
    SS_ASSERT(lifecycle == expected);

    for (std::size_t i = 1; i < events.events().size(); ++i) {
      SS_ASSERT(events.events()[i - 1].timestamp <= events.events()[i].timestamp);
    }

    const auto& d = s.disaster_history.back();
    SS_ASSERT(d.transitions.size() == 5);
    SS_ASSERT(d.transitions[0].phase == DisasterPhase::Warning && d.transitions[0].at == t0);
    SS_ASSERT(d.transitions[1].at == t0 + 1800 * kMsPerSecond);
    SS_ASSERT(d.transitions[2].at == t0 + 3600 * kMsPerSecond);
    SS_ASSERT(d.transitions[3].at == t0 + 4200 * kMsPerSecond);
    SS_ASSERT(d.transitions[4].phase == DisasterPhase::Resolved);
  }

  // Multi-tick impact: a one hour flood is split into six 10 minute damage ticks.
  {
    auto s = base_settlement();
    s.structures.push_back(structure(s, "FARM"));
    settlesim::EventBuffer events(s.id);
    settlesim::util::HashRng rng(8);
    SS_ASSERT(director.start(s, DisasterType::Flood, 50, "GRASSLAND", t0, events));
    SS_ASSERT(s.active_disaster->damage_ticks_total == 6);
    const settlesim::Millis impact = s.active_disaster->impact_start_at;
    SS_ASSERT(impact == t0 + 7200 * kMsPerSecond);

    director.advance(s, impact + 1500 * kMsPerSecond, rng, events);
    SS_ASSERT(s.active_disaster->damage_ticks_applied == 3);

    director.advance(s, s.active_disaster->impact_end_at, rng, events);
    SS_ASSERT(s.active_disaster->phase == DisasterPhase::Aftermath);

    std::vector<settlesim::Millis> ticks;
    for (const auto& e : events.events()) {
      if (e.type == EventType::DisasterDamageUpdate) ticks.push_back(e.timestamp);
    }
    SS_ASSERT(ticks.size() == 6);
    for (std::size_t i = 0; i < ticks.size(); ++i) {
      SS_ASSERT(ticks[i] == impact + static_cast<settlesim::Millis>(i) * 600 * kMsPerSecond);
    }
  }

  // Damage, destruction, storage losses and casualties.
  {
    auto s = base_settlement();
    s.resilience = 0.0;
    s.structures.push_back(structure(s, "FARM"));
    s.structures.push_back(structure(s, "FARM", 5.0));
    s.structures.push_back(structure(s, "STORAGE"));
    s.structures.push_back(structure(s, "SEISMIC_FOUNDATION"));
    s.storage[settlesim::Resource::Wood].amount = 400.0;
    settlesim::PopulationState p;
    p.current = 10;
    p.capacity = 10;
    s.population = p;

    settlesim::EventBuffer events(s.id);
    settlesim::util::HashRng rng(21);
    SS_ASSERT(director.start(s, DisasterType::Earthquake, 70, "MOUNTAIN", t0, events));
    director.advance(s, t0 + 4200 * kMsPerSecond, rng, events);
    SS_ASSERT(s.active_disaster->phase == DisasterPhase::Aftermath);

    const auto& d = *s.active_disaster;
    // Seismic foundation adds 0.5 * 30 = 15 defense.
    SS_ASSERT(std::fabs(d.preparedness - 15.0) < 1e-9);
    SS_ASSERT(d.net_damage > 0.0);

    // The 5% farm could not survive the hit.
    SS_ASSERT(d.structures_destroyed.size() == 1);
    SS_ASSERT(s.structures.size() == 3);
    SS_ASSERT(events.count(EventType::StructureDestroyed) == 1);
    SS_ASSERT(events.count(EventType::StructureDamaged) == 3);

    // The foundation takes half damage.
    const auto* farm = settlesim::find_structure(s, "structure-1");
    const auto* foundation = settlesim::find_structure(s, "structure-4");
    SS_ASSERT(farm && foundation);
    SS_ASSERT(std::fabs((100.0 - foundation->health) * 2.0 - (100.0 - farm->health)) < 1e-6);

    SS_ASSERT(d.resources_lost[settlesim::Resource::Wood] > 0.0);
    SS_ASSERT(s.storage[settlesim::Resource::Wood].amount < 400.0);

    const int expected = static_cast<int>(std::floor(10.0 * d.net_damage / 100.0));
    SS_ASSERT(d.casualties == expected);
    SS_ASSERT(s.population->current == 10 - expected);
    SS_ASSERT(settlesim::validate_settlement(s, &catalog).empty());
  }

  // Shelters and hospitals.
  {
    auto s = base_settlement();
    settlesim::PopulationState p;
    p.current = 40;
    p.capacity = 60;
    s.population = p;
    SS_ASSERT(settlesim::compute_casualties(s, catalog, DisasterType::Earthquake, 50.0) == 20);

    s.structures.push_back(structure(s, "HOSPITAL"));
    SS_ASSERT(settlesim::hospital_save_rate(s) == 0.5);
    SS_ASSERT(settlesim::compute_casualties(s, catalog, DisasterType::Earthquake, 50.0) == 10);
    s.structures.back().level = 3;
    SS_ASSERT(std::fabs(settlesim::hospital_save_rate(s) - 0.6) < 1e-9);
    s.structures.back().health = 20.0;
    SS_ASSERT(settlesim::hospital_save_rate(s) == 0.0);

    s.structures.push_back(structure(s, "EMERGENCY_SHELTER"));
    SS_ASSERT(settlesim::shelter_capacity(s, catalog) == 50.0);
    SS_ASSERT(settlesim::compute_casualties(s, catalog, DisasterType::Earthquake, 50.0) == 0);

    s.resilience = 0.0;
    s.structures.push_back(structure(s, "FORTRESS"));
    // Full shelter coverage 30 + defense 0.3 * 30 (shelter has none) + fortress 30.
    SS_ASSERT(std::fabs(settlesim::compute_preparedness(s, catalog, DisasterType::Flood) - 69.0) < 1e-9);
  }

  // Negative resistances lower the defense score, which never drops below 0.
  {
    auto s = base_settlement();
    s.resilience = 0.0;
    s.structures.push_back(structure(s, "SEISMIC_FOUNDATION"));
    SS_ASSERT(std::fabs(settlesim::compute_preparedness(s, catalog, DisasterType::Earthquake) - 15.0) < 1e-9);
    s.structures.push_back(structure(s, "DEEP_MINING_COMPLEX"));
    // 0.5 * 30 - 0.4 * 30
    SS_ASSERT(std::fabs(settlesim::compute_preparedness(s, catalog, DisasterType::Earthquake) - 3.0) < 1e-9);
    // Only the mine's own type is penalised.
    SS_ASSERT(std::fabs(settlesim::compute_preparedness(s, catalog, DisasterType::Flood) - 0.0) < 1e-9);
    s.structures.front().health = 0.0;
    SS_ASSERT(settlesim::compute_preparedness(s, catalog, DisasterType::Earthquake) == 0.0);
  }

  // Type selection from biome risk tiers.
  {
    settlesim::BiomeDisasterRisk empty;
    settlesim::util::HashRng rng(3);
    SS_ASSERT(!settlesim::pick_disaster_type(empty, rng).has_value());

    settlesim::BiomeDisasterRisk only_low;
    only_low.low = {DisasterType::Blizzard};
    for (int i = 0; i < 20; ++i) SS_ASSERT(settlesim::pick_disaster_type(only_low, rng) == DisasterType::Blizzard);
  }

  // roll(): unknown biome is skipped, a certain world always starts a warning.
  {
    auto certain = catalog;
    certain.world_templates["STANDARD"].disaster_probability = 1.0;
    const settlesim::DisasterDirector eager(certain);

    auto s = base_settlement();
    settlesim::EventBuffer events(s.id);
    settlesim::util::HashRng rng(77);

    settlesim::Tile odd;
    odd.id = "tile-a";
    odd.biome = "CRYSTAL_WASTES";
    SS_ASSERT(!eager.roll(s, &odd, t0, rng, events));
    SS_ASSERT(!eager.roll(s, nullptr, t0, rng, events));
    SS_ASSERT(events.empty());

    settlesim::Tile peak;
    peak.id = "tile-a";
    peak.biome = "mountain";
    SS_ASSERT(eager.roll(s, &peak, t0, rng, events));
    SS_ASSERT(s.active_disaster.has_value());
    SS_ASSERT(s.active_disaster->biome == "MOUNTAIN");
    SS_ASSERT(s.active_disaster->region_id == "region-a");
    // Already active: no second roll.
    SS_ASSERT(!eager.roll(s, &peak, t0, rng, events));
    SS_ASSERT(events.count(EventType::DisasterWarning) == 1);
  }

  // History keeps the most recent 20 disasters.
  {
    auto s = base_settlement();
    settlesim::EventBuffer events(s.id);
    settlesim::util::HashRng rng(2);
    settlesim::Millis now = t0;
    for (int i = 0; i < 25; ++i) {
      SS_ASSERT(director.start(s, DisasterType::Tornado, 10, "GRASSLAND", now, events));
      now += 30 * 86400 * kMsPerSecond;
      director.advance(s, now, rng, events);
      SS_ASSERT(!s.active_disaster.has_value());
    }
    SS_ASSERT(s.disaster_history.size() == settlesim::kMaxDisasterHistory);
    SS_ASSERT(s.disaster_history.back().id == "disaster-25");
    SS_ASSERT(s.resilience == 100.0);
  }

  return 0;
}
