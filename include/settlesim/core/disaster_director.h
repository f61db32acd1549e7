#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "settlesim/core/catalog.h"
#include "settlesim/core/entities.h"
#include "settlesim/core/events.h"
#include "settlesim/core/terrain.h"
#include "settlesim/util/hash_rng.h"

namespace settlesim {

// Structure types the damage model looks for by name.
inline constexpr const char* kHospitalType = "HOSPITAL";
inline constexpr const char* kFortressType = "FORTRESS";
inline constexpr const char* kWatchtowerType = "WATCHTOWER";
inline constexpr const char* kMeteorologyType = "METEOROLOGY_CENTER";
inline constexpr const char* kSeismologyType = "SEISMOLOGY_STATION";

struct DisasterSettings {
  // WARNING -> IMMINENT happens this long before impact.
  std::int64_t imminent_lead_s{1800};

  // Damage sub-interval during IMPACT. Independent of the disaster-check period.
  std::int64_t damage_interval_s{600};

  // Length of AFTERMATH (repair discount window).
  std::int64_t aftermath_window_s{172800};

  // Repair cost multiplier while in AFTERMATH.
  double repair_discount{0.5};

  // netDamage variance: (1 + v) with v uniform in [-variance, +variance].
  double damage_variance{0.2};
};

// <25 Mild, <50 Moderate, <75 Major, otherwise Catastrophic.
SeverityLevel severity_level_for(int severity);

// clamp(round((20 + u*60) * multiplier), 0, 100)
int roll_severity(util::HashRng& rng, double severity_multiplier);

// 60% high tier, 30% moderate, 10% low. An empty tier falls through to the next
// non-empty one. nullopt when every tier is empty.
std::optional<DisasterType> pick_disaster_type(const BiomeDisasterRisk& risk, util::HashRng& rng);

// People that fit into shelters ("Shelter Capacity" modifiers of intact structures).
double shelter_capacity(const Settlement& s, const StructureCatalog& catalog);

// 0..100:
//   shelter coverage min(1, shelter/population) * 30
//   + 5 each for an intact watchtower, meteorology center, seismology station
//   + defense up to 30 (resistances against `type` and "Defense" modifiers)
//   + 30 for an intact fortress
//   + resilience/100 * 20
double compute_preparedness(const Settlement& s, const StructureCatalog& catalog, DisasterType type);

// clamp((severity - preparedness) * (1 + variance_roll), 0, 100)
double net_damage(int severity, double preparedness, double variance_roll);

// Fraction of casualties prevented by the best working hospital (health > 20):
// 0.5 + (level-1)*0.05, at most 0.75. 0 without one.
double hospital_save_rate(const Settlement& s);

// floor(unsheltered * net/100 * type multiplier * (1 - hospital save rate))
int compute_casualties(const Settlement& s, const StructureCatalog& catalog, DisasterType type, double net);

// MILD 2, MODERATE 5, MAJOR 10, CATASTROPHIC 15.
double resilience_gain(SeverityLevel level);

// Drives the per-settlement disaster lifecycle:
//
//   IDLE -> WARNING -> IMMINENT -> IMPACT -> AFTERMATH -> RESOLVED -> IDLE
//
// Phases never skip. A late advance() walks every overdue transition (and every
// overdue damage tick) in order, emitting each event with its scheduled time.
class DisasterDirector {
 public:
  DisasterDirector(const StructureCatalog& catalog, DisasterSettings settings = {});

  const DisasterSettings& settings() const { return settings_; }

  // Disaster-check phase: with the world template's probability, picks a type from
  // the tile biome's risk tiers and issues a warning. Returns true when a disaster
  // was started. No-op while a disaster is active; an unknown biome is logged and
  // skipped.
  bool roll(Settlement& s, const Tile* tile, Millis now, util::HashRng& rng, EventBuffer& events) const;

  // Issues a warning for a specific disaster. Returns false if one is already active.
  bool start(Settlement& s, DisasterType type, int severity, const std::string& biome, Millis now,
             EventBuffer& events) const;

  // Applies every transition and damage tick due at `now`. Returns true if the
  // settlement changed.
  bool advance(Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events) const;

  // repair_discount during AFTERMATH, otherwise 1. Read-only query for collaborators
  // that price paid repairs; the engine's own passive repair is free and ignores it.
  double repair_cost_multiplier(const Settlement& s, Millis now) const;

 private:
  void enter(DisasterEvent& d, DisasterPhase phase, Millis at) const;

  void begin_impact(Settlement& s, Millis at, util::HashRng& rng, EventBuffer& events) const;
  void apply_damage_tick(Settlement& s, Millis at, EventBuffer& events) const;
  void end_impact(Settlement& s, Millis at, EventBuffer& events) const;
  void resolve(Settlement& s, Millis at, EventBuffer& events) const;

  Millis damage_tick_due(const DisasterEvent& d, int tick_index) const;

  const StructureCatalog& catalog_;
  DisasterSettings settings_;
};

} // namespace settlesim
