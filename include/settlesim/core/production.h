#pragma once

#include <string>
#include <vector>

#include "settlesim/core/catalog.h"
#include "settlesim/core/entities.h"
#include "settlesim/core/terrain.h"

namespace settlesim {

struct ProductionReport {
  // Per-hour output after world and disaster multipliers.
  ResourceDelta amounts;

  // Extractors that contributed at least one resource.
  int extractors{0};

  // Lookups that failed and were treated as zero contribution.
  std::vector<std::string> issues;
};

// Production multiplier for a structure at `health` (0..100).
//
// 0 -> 0, 1-19 -> 0.1, 20-39 -> 0.5, 40-59 -> 0.7, 60-79 -> 0.85, 80-94 -> 0.95, 95+ -> 1.
double health_effectiveness(double health);

// 1 unless a disaster is in IMPACT or AFTERMATH, in which case
// max(0.1, 1 - impact(severity level)).
double disaster_production_multiplier(const Settlement& s);

// Output of one extractor for one resource:
//   base_rate * quality/100 * level_multiplier * biome_efficiency * health_effectiveness
double extractor_output(double base_rate, double quality, double level_multiplier, double biome_efficiency,
                        double health);

// Per-hour output of all extractors in the settlement.
//
// Never throws for missing configuration: an unknown structure type, a missing tile or
// an unknown biome contributes zero for the affected resources, is logged at Warn and
// recorded in ProductionReport::issues.
ProductionReport compute_production(const Settlement& s, const StructureCatalog& catalog,
                                    const TerrainProvider& terrain);

} // namespace settlesim
