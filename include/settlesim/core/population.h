#pragma once

#include <string>
#include <vector>

#include "settlesim/core/catalog.h"
#include "settlesim/core/entities.h"
#include "settlesim/core/events.h"
#include "settlesim/util/hash_rng.h"

namespace settlesim {

// Component scores (0..100) feeding the happiness formula.
struct HappinessFactors {
  double resource_sufficiency{100.0};
  double housing{100.0};
  double preparedness{0.0};
  double trauma{100.0};
  double morale{50.0};
  double npc_relations{50.0};
};

struct HappinessBand {
  const char* label;
  PopulationStatus status;
};

// >=80 Very Happy / Growing, 60-79 Happy / Growing, 40-59 Content / Stable,
// 20-39 Unhappy / Declining, <20 Very Unhappy / Declining.
HappinessBand happiness_band(double happiness);

// Weighted sum clamped to [0,100]:
//   sufficiency .30, housing .20, preparedness .15, trauma .15, morale .15, npc .05
double happiness_from_factors(const HappinessFactors& f);

// 10 (catalog base) + "Population Capacity" modifiers of intact structures.
int compute_population_capacity(const Settlement& s, const StructureCatalog& catalog);

HappinessFactors compute_happiness_factors(const Settlement& s, const StructureCatalog& catalog, int capacity);

// Happiness -> growth curve multiplier (negative below 30).
double growth_curve(double happiness);

// Settlers per hour as a fraction of the current population:
//   0.02 * curve(h) * world multiplier * (1 - pop/cap); 0 at or above capacity.
double growth_rate(double happiness, int population, int capacity, double world_multiplier);

// Per-phase probabilities.
double immigration_chance(double happiness, int population, int capacity);
double emigration_chance(double happiness, int population);

struct PopulationWarning {
  // low_happiness, emigration_risk, no_housing
  std::string code;
  std::string message;
};

std::vector<PopulationWarning> population_warnings(const PopulationState& p, double emigration_probability);

struct PopulationTickResult {
  int before{0};
  int after{0};
  int grown{0};
  int immigrants{0};
  int emigrants{0};
};

// One population phase (one hour of simulated time) for a settlement.
//
// Updates capacity, happiness, growth, immigration and emigration, and emits
// population-growth / settler-arrived / population-emigration / population-warning /
// population-state events. Settlements without a population record are left alone.
class PopulationModel {
 public:
  explicit PopulationModel(const StructureCatalog& catalog) : catalog_(catalog) {}

  PopulationTickResult tick(Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events) const;

 private:
  const StructureCatalog& catalog_;
};

} // namespace settlesim
