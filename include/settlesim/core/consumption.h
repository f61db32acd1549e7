#pragma once

#include "settlesim/core/catalog.h"
#include "settlesim/core/entities.h"

namespace settlesim {

// Per-hour resource draw of `population` people (positive amounts).
ResourceDelta consumption_for(int population, const ResourceTable<double>& per_capita, double multiplier);

// Consumption for the settlement's current population, scaled by its world template.
//
// Returns an all-zero delta when the population record is unavailable so production
// is never blocked on it.
ResourceDelta compute_consumption(const Settlement& s, const StructureCatalog& catalog);

} // namespace settlesim
