#include "settlesim/core/disaster_director.h"

#include <algorithm>
#include <cmath>

#include "settlesim/core/enum_strings.h"
#include "settlesim/util/log.h"
#include "settlesim/util/strings.h"
#include "settlesim/util/time.h"

namespace settlesim {
namespace {

bool is_storage_type(const std::string& type) {
  return type.find("STORAGE") != std::string::npos || type.find("WAREHOUSE") != std::string::npos;
}

std::string label(const DisasterEvent& d) {
  return std::string(severity_level_to_string(d.severity_level)) + " " + disaster_type_to_string(d.type);
}

json::Object base_fields(const DisasterEvent& d) {
  json::Object f;
  f["disasterId"] = d.id;
  f["disasterType"] = std::string(disaster_type_to_string(d.type));
  f["severity"] = static_cast<double>(d.severity);
  f["severityLevel"] = std::string(severity_level_to_string(d.severity_level));
  f["phase"] = std::string(disaster_phase_to_string(d.phase));
  return f;
}

json::Value resources_to_json(const ResourceTable<double>& t) {
  json::Object o;
  for (Resource r : kAllResources) o[resource_to_string(r)] = t[r];
  return o;
}

json::Value string_list(const std::vector<std::string>& v) {
  json::Array a;
  a.reserve(v.size());
  for (const auto& s : v) a.push_back(s);
  return a;
}

} // namespace

SeverityLevel severity_level_for(int severity) {
  if (severity < 25) return SeverityLevel::Mild;
  if (severity < 50) return SeverityLevel::Moderate;
  if (severity < 75) return SeverityLevel::Major;
  return SeverityLevel::Catastrophic;
}

int roll_severity(util::HashRng& rng, double severity_multiplier) {
  const double base = 20.0 + rng.next_u01() * 60.0;
  const double v = std::round(base * severity_multiplier);
  return static_cast<int>(std::clamp(v, 0.0, 100.0));
}

std::optional<DisasterType> pick_disaster_type(const BiomeDisasterRisk& risk, util::HashRng& rng) {
  const double u = rng.next_u01();
  const std::vector<DisasterType>* tiers[3] = {&risk.high, &risk.moderate, &risk.low};
  int first = 0;
  if (u >= 0.9) {
    first = 2;
  } else if (u >= 0.6) {
    first = 1;
  }
  for (int i = 0; i < 3; ++i) {
    const auto& tier = *tiers[(first + i) % 3];
    if (!tier.empty()) return tier[rng.index(tier.size())];
  }
  return std::nullopt;
}

double shelter_capacity(const Settlement& s, const StructureCatalog& catalog) {
  return std::max(0.0, catalog.sum_modifiers(s, kModShelterCapacity));
}

double compute_preparedness(const Settlement& s, const StructureCatalog& catalog, DisasterType type) {
  double score = 0.0;

  const int pop = s.population ? s.population->current : 0;
  if (pop > 0) {
    const double coverage = std::min(1.0, shelter_capacity(s, catalog) / static_cast<double>(pop));
    score += coverage * 30.0;
  }

  if (count_structures(s, kWatchtowerType) > 0) score += 5.0;
  if (count_structures(s, kMeteorologyType) > 0) score += 5.0;
  if (count_structures(s, kSeismologyType) > 0) score += 5.0;

  double defense = catalog.sum_modifiers(s, kModDefense);
  for (const auto& st : s.structures) {
    if (st.health <= 0.0) continue;
    const auto* def = catalog.find_structure(st.type);
    if (!def) continue;
    auto it = def->resistances.find(type);
    // Negative resistances (deep mines against earthquakes) lower the score.
    if (it != def->resistances.end()) defense += it->second * 30.0;
    defense += def->resistance_all * 30.0;
  }
  score += std::clamp(defense, 0.0, 30.0);

  if (count_structures(s, kFortressType) > 0) score += 30.0;

  score += std::clamp(s.resilience, 0.0, 100.0) / 100.0 * 20.0;

  return std::min(100.0, score);
}

double net_damage(int severity, double preparedness, double variance_roll) {
  const double base = static_cast<double>(severity) - preparedness;
  return std::clamp(base * (1.0 + variance_roll), 0.0, 100.0);
}

double hospital_save_rate(const Settlement& s) {
  int best_level = 0;
  for (const auto& st : s.structures) {
    if (st.type != kHospitalType || st.health <= 20.0) continue;
    best_level = std::max(best_level, st.level);
  }
  if (best_level == 0) return 0.0;
  return std::min(0.75, 0.5 + (best_level - 1) * 0.05);
}

int compute_casualties(const Settlement& s, const StructureCatalog& catalog, DisasterType type, double net) {
  if (!s.population || s.population->current <= 0) return 0;
  const double pop = static_cast<double>(s.population->current);
  const double unsheltered = std::max(0.0, pop - shelter_capacity(s, catalog));
  const double base = unsheltered * (net / 100.0) * catalog.disaster(type).casualty_multiplier;
  const double treated = base * (1.0 - hospital_save_rate(s));
  return std::clamp(static_cast<int>(std::floor(treated)), 0, s.population->current);
}

double resilience_gain(SeverityLevel level) {
  switch (level) {
    case SeverityLevel::Mild: return 2.0;
    case SeverityLevel::Moderate: return 5.0;
    case SeverityLevel::Major: return 10.0;
    case SeverityLevel::Catastrophic: return 15.0;
  }
  return 0.0;
}

DisasterDirector::DisasterDirector(const StructureCatalog& catalog, DisasterSettings settings)
    : catalog_(catalog), settings_(settings) {
  if (settings_.damage_interval_s < 1) settings_.damage_interval_s = 1;
  if (settings_.imminent_lead_s < 0) settings_.imminent_lead_s = 0;
  if (settings_.aftermath_window_s < 0) settings_.aftermath_window_s = 0;
}

bool DisasterDirector::roll(Settlement& s, const Tile* tile, Millis now, util::HashRng& rng,
                            EventBuffer& events) const {
  if (s.active_disaster) return false;

  const std::string biome = tile ? tile->biome : std::string();
  const auto* risk = catalog_.find_biome_disasters(biome);
  if (!risk) {
    log::warn("Disaster check [" + s.id + "]: unknown biome '" + biome + "' (tile '" + s.location.tile_id +
              "'), skipping");
    return false;
  }

  const WorldTemplate& world = catalog_.world_template(s.world_template);
  if (!rng.chance(world.disaster_probability)) return false;

  const auto type = pick_disaster_type(*risk, rng);
  if (!type) {
    log::warn("Disaster check [" + s.id + "]: biome '" + biome + "' has no disaster types");
    return false;
  }
  const int severity = roll_severity(rng, world.severity_multiplier);
  return start(s, *type, severity, to_upper(biome), now, events);
}

bool DisasterDirector::start(Settlement& s, DisasterType type, int severity, const std::string& biome, Millis now,
                             EventBuffer& events) const {
  if (s.active_disaster) return false;

  const WorldTemplate& world = catalog_.world_template(s.world_template);
  const DisasterTypeDef& def = catalog_.disaster(type);

  const double lead_s = std::max(0.0, std::round(static_cast<double>(def.warning_s) * world.warning_time_multiplier));
  const std::int64_t duration_s = std::max<std::int64_t>(1, def.impact_duration_s);

  DisasterEvent d;
  d.id = allocate_local_id(s, "disaster");
  d.type = type;
  d.severity = std::clamp(severity, 0, 100);
  d.severity_level = severity_level_for(d.severity);
  d.biome = biome;
  d.region_id = s.location.region_id;
  d.warning_at = now;
  d.impact_start_at = now + static_cast<Millis>(lead_s) * kMsPerSecond;
  d.imminent_at = std::max(now, d.impact_start_at - settings_.imminent_lead_s * kMsPerSecond);
  d.impact_end_at = d.impact_start_at + duration_s * kMsPerSecond;
  d.damage_ticks_total =
      static_cast<int>((duration_s + settings_.damage_interval_s - 1) / settings_.damage_interval_s);
  if (d.damage_ticks_total < 1) d.damage_ticks_total = 1;
  enter(d, DisasterPhase::Warning, now);

  json::Object f = base_fields(d);
  f["impactAt"] = format_iso8601(d.impact_start_at);
  f["timeToImpactS"] = lead_s;
  f["durationS"] = static_cast<double>(duration_s);
  f["biome"] = d.biome;
  f["regionId"] = d.region_id;
  f["recommendedActions"] = string_list(def.recommended_actions);
  events.emit(EventType::DisasterWarning, now,
              label(d) + " expected in " + format_duration_s(static_cast<std::int64_t>(lead_s)), std::move(f),
              EventLevel::Warn);

  log::info("Disaster [" + s.id + "]: " + label(d) + " (severity " + std::to_string(d.severity) + ") warning, impact at " +
            format_iso8601(d.impact_start_at));

  s.active_disaster = std::move(d);
  return true;
}

void DisasterDirector::enter(DisasterEvent& d, DisasterPhase phase, Millis at) const {
  d.phase = phase;
  d.transitions.push_back(PhaseTransition{phase, at});
}

Millis DisasterDirector::damage_tick_due(const DisasterEvent& d, int tick_index) const {
  // Tick 0 lands on impact start; the rest follow on the damage sub-interval.
  return d.impact_start_at + static_cast<Millis>(tick_index) * settings_.damage_interval_s * kMsPerSecond;
}

bool DisasterDirector::advance(Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events) const {
  bool changed = false;
  for (;;) {
    if (!s.active_disaster) return changed;
    DisasterEvent& d = *s.active_disaster;

    switch (d.phase) {
      case DisasterPhase::Idle:
      case DisasterPhase::Warning: {
        if (now < d.imminent_at) return changed;
        enter(d, DisasterPhase::Imminent, d.imminent_at);
        json::Object f = base_fields(d);
        f["impactAt"] = format_iso8601(d.impact_start_at);
        f["timeToImpactS"] = static_cast<double>(std::max<Millis>(0, d.impact_start_at - d.imminent_at) / kMsPerSecond);
        events.emit(EventType::DisasterImminent, d.imminent_at, label(d) + " is imminent", std::move(f),
                    EventLevel::Warn);
        changed = true;
        break;
      }
      case DisasterPhase::Imminent: {
        if (now < d.impact_start_at) return changed;
        begin_impact(s, d.impact_start_at, rng, events);
        changed = true;
        break;
      }
      case DisasterPhase::Impact: {
        if (d.damage_ticks_applied < d.damage_ticks_total) {
          const Millis due = std::min(damage_tick_due(d, d.damage_ticks_applied), d.impact_end_at);
          if (now < due) return changed;
          apply_damage_tick(s, due, events);
          changed = true;
          break;
        }
        if (now < d.impact_end_at) return changed;
        end_impact(s, d.impact_end_at, events);
        changed = true;
        break;
      }
      case DisasterPhase::Aftermath: {
        if (now < d.aftermath_end_at) return changed;
        resolve(s, d.aftermath_end_at, events);
        changed = true;
        break;
      }
      case DisasterPhase::Resolved:
        // Only reachable for a record that was saved mid-resolution; finish it.
        resolve(s, d.resolved_at != 0 ? d.resolved_at : now, events);
        changed = true;
        break;
    }
  }
}

void DisasterDirector::begin_impact(Settlement& s, Millis at, util::HashRng& rng, EventBuffer& events) const {
  DisasterEvent& d = *s.active_disaster;
  enter(d, DisasterPhase::Impact, at);

  const double variance = rng.range(-settings_.damage_variance, settings_.damage_variance);
  d.preparedness = compute_preparedness(s, catalog_, d.type);
  d.net_damage = net_damage(d.severity, d.preparedness, variance);
  d.casualties_planned = compute_casualties(s, catalog_, d.type, d.net_damage);
  d.damage_ticks_applied = 0;

  const std::int64_t duration_s = (d.impact_end_at - d.impact_start_at) / kMsPerSecond;
  json::Object f = base_fields(d);
  f["durationS"] = static_cast<double>(duration_s);
  f["impactEndAt"] = format_iso8601(d.impact_end_at);
  f["preparedness"] = d.preparedness;
  f["netDamage"] = d.net_damage;
  f["damageTicks"] = static_cast<double>(d.damage_ticks_total);
  events.emit(EventType::DisasterImpactStart, at,
              label(d) + " has struck (lasts " + format_duration_s(duration_s) + ")", std::move(f),
              EventLevel::Warn);

  log::info("Disaster [" + s.id + "]: impact, preparedness " + format_fixed(d.preparedness, 1) + ", net damage " +
            format_fixed(d.net_damage, 1) + ", planned casualties " + std::to_string(d.casualties_planned));
}

void DisasterDirector::apply_damage_tick(Settlement& s, Millis at, EventBuffer& events) const {
  DisasterEvent& d = *s.active_disaster;
  const double per_tick = d.net_damage / static_cast<double>(std::max(1, d.damage_ticks_total));

  double storage_health_lost = 0.0;
  int storage_hit = 0;

  for (auto& st : s.structures) {
    if (st.health <= 0.0) continue;
    const double dmg = std::max(0.0, per_tick * (1.0 - catalog_.resistance(st.type, d.type)));
    if (dmg <= 0.0) continue;

    const double old_health = st.health;
    st.health = std::max(0.0, old_health - dmg);

    if (is_storage_type(st.type)) {
      storage_health_lost += old_health - st.health;
      ++storage_hit;
    }

    json::Object f;
    f["disasterId"] = d.id;
    f["structureId"] = st.id;
    f["structureType"] = st.type;
    f["oldHealth"] = old_health;
    f["newHealth"] = st.health;
    if (st.health <= 0.0) {
      d.structures_destroyed.push_back(st.id);
      events.emit(EventType::StructureDestroyed, at, st.type + " " + st.id + " was destroyed", std::move(f),
                  EventLevel::Warn);
    } else {
      if (std::find(d.structures_damaged.begin(), d.structures_damaged.end(), st.id) == d.structures_damaged.end()) {
        d.structures_damaged.push_back(st.id);
      }
      events.emit(EventType::StructureDamaged, at,
                  st.type + " " + st.id + " damaged to " + format_fixed(st.health, 0) + "%", std::move(f));
    }
  }

  s.structures.erase(std::remove_if(s.structures.begin(), s.structures.end(),
                                    [](const StructureInstance& st) { return st.health <= 0.0; }),
                     s.structures.end());
  for (const auto& id : d.structures_destroyed) {
    d.structures_damaged.erase(std::remove(d.structures_damaged.begin(), d.structures_damaged.end(), id),
                               d.structures_damaged.end());
  }

  if (storage_hit > 0) {
    const double loss = std::clamp(storage_health_lost / storage_hit / 100.0, 0.0, 1.0);
    for (Resource r : kAllResources) {
      StorageSlot& slot = s.storage[r];
      const double lost = std::floor(slot.amount * loss);
      if (lost <= 0.0) continue;
      slot.amount = std::max(0.0, slot.amount - lost);
      d.resources_lost[r] += lost;
    }
  }

  ++d.damage_ticks_applied;

  // Casualties follow the damage ticks proportionally.
  const int due_casualties = d.casualties_planned * d.damage_ticks_applied / std::max(1, d.damage_ticks_total);
  int delta = due_casualties - d.casualties;
  if (delta > 0 && s.population) {
    delta = std::min(delta, s.population->current);
    s.population->current -= delta;
    s.population->updated_at = at;
    d.casualties += delta;
  }

  const double progress = 100.0 * d.damage_ticks_applied / std::max(1, d.damage_ticks_total);
  json::Object f = base_fields(d);
  f["progress"] = progress;
  f["tick"] = static_cast<double>(d.damage_ticks_applied);
  f["totalTicks"] = static_cast<double>(d.damage_ticks_total);
  f["casualties"] = static_cast<double>(d.casualties);
  f["structuresDamaged"] = static_cast<double>(d.structures_damaged.size());
  f["structuresDestroyed"] = static_cast<double>(d.structures_destroyed.size());
  f["resourcesLost"] = resources_to_json(d.resources_lost);
  events.emit(EventType::DisasterDamageUpdate, at, label(d) + " damage " + format_fixed(progress, 0) + "%",
              std::move(f));
}

void DisasterDirector::end_impact(Settlement& s, Millis at, EventBuffer& events) const {
  DisasterEvent& d = *s.active_disaster;

  json::Object summary = base_fields(d);
  summary["casualties"] = static_cast<double>(d.casualties);
  summary["structuresDamaged"] = string_list(d.structures_damaged);
  summary["structuresDestroyed"] = string_list(d.structures_destroyed);
  summary["resourcesLost"] = resources_to_json(d.resources_lost);
  summary["netDamage"] = d.net_damage;
  events.emit(EventType::DisasterImpactEnd, at,
              label(d) + " has passed: " + std::to_string(d.casualties) + " casualties, " +
                  std::to_string(d.structures_destroyed.size()) + " structures destroyed",
              std::move(summary));

  enter(d, DisasterPhase::Aftermath, at);
  d.aftermath_end_at = at + settings_.aftermath_window_s * kMsPerSecond;

  json::Object f = base_fields(d);
  f["repairDiscount"] = settings_.repair_discount;
  f["aftermathEndsAt"] = format_iso8601(d.aftermath_end_at);
  events.emit(EventType::DisasterAftermath, at,
              "Repairs discounted until " + format_iso8601(d.aftermath_end_at), std::move(f));
}

void DisasterDirector::resolve(Settlement& s, Millis at, EventBuffer& events) const {
  DisasterEvent d = std::move(*s.active_disaster);
  s.active_disaster.reset();

  if (d.phase != DisasterPhase::Resolved) enter(d, DisasterPhase::Resolved, at);
  d.resolved_at = at;

  const double gain = resilience_gain(d.severity_level);
  s.resilience = std::min(100.0, s.resilience + gain);

  json::Object f = base_fields(d);
  f["resilienceGain"] = gain;
  f["resilience"] = s.resilience;
  f["casualties"] = static_cast<double>(d.casualties);
  events.emit(EventType::DisasterResolved, at,
              label(d) + " resolved, resilience +" + format_fixed(gain, 0), std::move(f));

  log::info("Disaster [" + s.id + "]: " + d.id + " resolved, resilience now " + format_fixed(s.resilience, 0));

  s.disaster_history.push_back(std::move(d));
  if (s.disaster_history.size() > kMaxDisasterHistory) {
    s.disaster_history.erase(s.disaster_history.begin(),
                             s.disaster_history.end() - static_cast<std::ptrdiff_t>(kMaxDisasterHistory));
  }
}

double DisasterDirector::repair_cost_multiplier(const Settlement& s, Millis now) const {
  if (!s.active_disaster) return 1.0;
  const auto& d = *s.active_disaster;
  if (d.phase != DisasterPhase::Aftermath) return 1.0;
  if (now >= d.aftermath_end_at) return 1.0;
  return settings_.repair_discount;
}

} // namespace settlesim
