#include "settlesim/core/population.h"

#include <algorithm>
#include <cmath>

#include "settlesim/core/disaster_director.h"
#include "settlesim/core/enum_strings.h"
#include "settlesim/util/log.h"
#include "settlesim/util/strings.h"

namespace settlesim {
namespace {

// Stock covering this many hours of consumption scores 100.
constexpr double kComfortHours = 8.0;
constexpr double kBaseGrowth = 0.02;

double supply_score(double amount, int population, double per_person_hour) {
  if (population <= 0 || per_person_hour <= 0.0) return 100.0;
  const double hours = std::max(0.0, amount) / (population * per_person_hour);
  return std::min(100.0, hours / kComfortHours * 100.0);
}

double housing_score(const Settlement& s, int population, int capacity) {
  double score = 100.0;
  if (capacity > 0) {
    const double crowding = static_cast<double>(population) / capacity;
    if (crowding > 0.9) {
      score -= 30.0;
    } else if (crowding > 0.75) {
      score -= 15.0;
    } else if (crowding < 0.5) {
      score += 10.0;
    }
  } else if (population > 0) {
    score -= 30.0;
  }
  if (count_structures(s, "HOUSE") > 0) {
    score += 20.0;
  } else if (count_structures(s, "COTTAGE") > 0) {
    score += 10.0;
  }
  return std::clamp(score, 0.0, 100.0);
}

double trauma_score(const Settlement& s) {
  if (!s.active_disaster) return 100.0;
  const auto& d = *s.active_disaster;
  switch (d.phase) {
    case DisasterPhase::Impact:
    case DisasterPhase::Aftermath: return std::clamp(100.0 - d.severity, 0.0, 100.0);
    case DisasterPhase::Warning:
    case DisasterPhase::Imminent: return std::clamp(100.0 - d.severity / 2.0, 0.0, 100.0);
    default: return 100.0;
  }
}

json::Object state_fields(const PopulationState& p) {
  json::Object f;
  f["current"] = static_cast<double>(p.current);
  f["capacity"] = static_cast<double>(p.capacity);
  f["happiness"] = p.happiness;
  f["happinessLabel"] = p.happiness_label;
  f["growthRate"] = p.growth_rate;
  f["status"] = std::string(population_status_to_string(p.status));
  return f;
}

} // namespace

HappinessBand happiness_band(double h) {
  if (h >= 80.0) return {"Very Happy", PopulationStatus::Growing};
  if (h >= 60.0) return {"Happy", PopulationStatus::Growing};
  if (h >= 40.0) return {"Content", PopulationStatus::Stable};
  if (h >= 20.0) return {"Unhappy", PopulationStatus::Declining};
  return {"Very Unhappy", PopulationStatus::Declining};
}

double happiness_from_factors(const HappinessFactors& f) {
  const double h = f.resource_sufficiency * 0.30 + f.housing * 0.20 + f.preparedness * 0.15 + f.trauma * 0.15 +
                   f.morale * 0.15 + f.npc_relations * 0.05;
  return std::clamp(h, 0.0, 100.0);
}

int compute_population_capacity(const Settlement& s, const StructureCatalog& catalog) {
  const double cap = catalog.base_population_capacity + catalog.sum_modifiers(s, kModPopulationCapacity);
  return std::max(0, static_cast<int>(std::floor(cap)));
}

HappinessFactors compute_happiness_factors(const Settlement& s, const StructureCatalog& catalog, int capacity) {
  HappinessFactors f;
  const int pop = s.population ? s.population->current : 0;

  const ResourceTable<double>& per_capita = catalog.per_capita_consumption;
  f.resource_sufficiency = (supply_score(s.storage[Resource::Food].amount, pop, per_capita[Resource::Food]) +
                            supply_score(s.storage[Resource::Water].amount, pop, per_capita[Resource::Water])) /
                           2.0;
  f.housing = housing_score(s, pop, capacity);

  // Preparedness is measured against the threat at hand, or an earthquake as a baseline.
  const DisasterType threat = s.active_disaster ? s.active_disaster->type : DisasterType::Earthquake;
  f.preparedness = compute_preparedness(s, catalog, threat);

  f.trauma = trauma_score(s);
  f.morale = std::clamp(50.0 + catalog.sum_modifiers(s, kModMoraleBoost), 0.0, 100.0);
  f.npc_relations = 50.0;
  return f;
}

double growth_curve(double h) {
  if (h < 30.0) return -1.0 + h / 30.0;
  if (h < 50.0) return (h - 30.0) / 20.0;
  if (h < 75.0) return 1.0 + (h - 50.0) / 25.0;
  return 2.0 + (h - 75.0) / 12.5;
}

double growth_rate(double happiness, int population, int capacity, double world_multiplier) {
  if (capacity <= 0 || population >= capacity) return 0.0;
  const double room = 1.0 - static_cast<double>(population) / capacity;
  return kBaseGrowth * growth_curve(happiness) * world_multiplier * room;
}

double immigration_chance(double happiness, int population, int capacity) {
  if (happiness < 75.0 || capacity <= 0 || population >= capacity) return 0.0;
  const double happiness_factor = std::min(1.0, (happiness - 75.0) / 25.0);
  const double capacity_factor = 1.0 - static_cast<double>(population) / capacity;
  return 0.1 * happiness_factor * capacity_factor;
}

double emigration_chance(double happiness, int population) {
  if (happiness > 35.0 || population <= 1) return 0.0;
  return 0.15 * (35.0 - happiness) / 35.0;
}

std::vector<PopulationWarning> population_warnings(const PopulationState& p, double emigration_probability) {
  std::vector<PopulationWarning> out;
  if (p.happiness < 35.0) {
    out.push_back({"low_happiness", "Happiness is low (" + format_fixed(p.happiness, 0) + ")"});
  }
  if (emigration_probability > 0.0) {
    out.push_back({"emigration_risk",
                   "Settlers may leave (" + format_fixed(emigration_probability * 100.0, 1) + "% per hour)"});
  }
  if (p.current >= p.capacity) {
    out.push_back({"no_housing", "No housing left (" + std::to_string(p.current) + "/" +
                                     std::to_string(p.capacity) + ")"});
  }
  return out;
}

PopulationTickResult PopulationModel::tick(Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events) const {
  PopulationTickResult res;
  if (!s.population) {
    log::warn("Population [" + s.id + "]: no population record, skipping");
    return res;
  }

  PopulationState& p = *s.population;
  res.before = p.current;
  p.capacity = compute_population_capacity(s, catalog_);

  // Lost housing (e.g. a destroyed house) forces the overflow out immediately.
  if (p.current > p.capacity) {
    const int excess = p.current - p.capacity;
    p.current = p.capacity;
    res.emigrants += excess;
    json::Object f;
    f["count"] = static_cast<double>(excess);
    f["reason"] = std::string("no_housing");
    f["population"] = static_cast<double>(p.current);
    events.emit(EventType::PopulationEmigration, now, std::to_string(excess) + " settlers left: no housing",
                std::move(f), EventLevel::Warn);
  }

  const HappinessFactors factors = compute_happiness_factors(s, catalog_, p.capacity);
  p.happiness = happiness_from_factors(factors);
  const HappinessBand band = happiness_band(p.happiness);
  p.happiness_label = band.label;
  p.status = band.status;

  const WorldTemplate& world = catalog_.world_template(s.world_template);
  const double rate = growth_rate(p.happiness, p.current, p.capacity, world.population_growth_multiplier);
  p.growth_rate = rate * p.current;
  p.growth_accumulator += p.growth_rate;

  int whole = static_cast<int>(std::trunc(p.growth_accumulator));
  if (whole > 0) {
    whole = std::min(whole, p.capacity - p.current);
  } else if (whole < 0) {
    whole = -std::min(-whole, std::max(0, p.current - 1));
  }
  if (whole != 0) {
    p.current += whole;
    p.growth_accumulator -= whole;
    res.grown = whole;
    json::Object f;
    f["delta"] = static_cast<double>(whole);
    f["population"] = static_cast<double>(p.current);
    f["growthRate"] = p.growth_rate;
    events.emit(EventType::PopulationGrowth, now,
                (whole > 0 ? "Population grew by " : "Population shrank by ") + std::to_string(std::abs(whole)),
                std::move(f));
  }
  if (p.current >= p.capacity && p.growth_accumulator > 0.0) p.growth_accumulator = 0.0;

  const double p_in = immigration_chance(p.happiness, p.current, p.capacity);
  if (p_in > 0.0 && rng.chance(p_in)) {
    const int n = std::min(rng.range_int(2, 5), p.capacity - p.current);
    if (n > 0) {
      p.current += n;
      res.immigrants = n;
      json::Object f;
      f["count"] = static_cast<double>(n);
      f["population"] = static_cast<double>(p.current);
      f["happiness"] = p.happiness;
      events.emit(EventType::SettlerArrived, now, std::to_string(n) + " settlers arrived", std::move(f));
    }
  }

  const double p_out = emigration_chance(p.happiness, p.current);
  if (p_out > 0.0 && rng.chance(p_out)) {
    int n = std::min(rng.range_int(1, 3), static_cast<int>(std::floor(p.current * 0.2)));
    n = std::min(n, p.current - 1);
    if (n > 0) {
      p.current -= n;
      res.emigrants += n;
      json::Object f;
      f["count"] = static_cast<double>(n);
      f["reason"] = std::string("unhappy");
      f["population"] = static_cast<double>(p.current);
      events.emit(EventType::PopulationEmigration, now, std::to_string(n) + " settlers left", std::move(f),
                  EventLevel::Warn);
    }
  }

  for (const auto& w : population_warnings(p, emigration_chance(p.happiness, p.current))) {
    json::Object f;
    f["code"] = w.code;
    f["happiness"] = p.happiness;
    f["population"] = static_cast<double>(p.current);
    f["capacity"] = static_cast<double>(p.capacity);
    events.emit(EventType::PopulationWarning, now, w.message, std::move(f), EventLevel::Warn);
  }

  p.updated_at = now;
  res.after = p.current;

  json::Object f = state_fields(p);
  json::Object parts;
  parts["resourceSufficiency"] = factors.resource_sufficiency;
  parts["housing"] = factors.housing;
  parts["preparedness"] = factors.preparedness;
  parts["trauma"] = factors.trauma;
  parts["morale"] = factors.morale;
  parts["npcRelations"] = factors.npc_relations;
  f["factors"] = std::move(parts);
  events.emit(EventType::PopulationState, now,
              std::to_string(p.current) + "/" + std::to_string(p.capacity) + " settlers, " + p.happiness_label,
              std::move(f));
  return res;
}

} // namespace settlesim
