#pragma once

#include <string>
#include <vector>

#include "settlesim/core/catalog.h"
#include "settlesim/core/entities.h"

namespace settlesim {

// Validate the invariants of a settlement aggregate:
// - storage amounts within [0, capacity], capacities >= 0
// - population within [0, capacity] when present
// - structure health within [0, 100], levels within [1, max_level], unique ids
// - construction positions 1..N, active slots within `max_active_slots`, timestamps ordered
// - active disaster phase and transitions consistent with its schedule
//
// If `catalog` is provided, structure levels are checked against the definitions.
//
// Returns a list of human-readable error strings. Empty => settlement is valid.
std::vector<std::string> validate_settlement(const Settlement& s, const StructureCatalog* catalog = nullptr,
                                             int max_active_slots = 0);

} // namespace settlesim
