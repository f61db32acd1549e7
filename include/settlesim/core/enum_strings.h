#pragma once

#include <optional>
#include <string>

#include "settlesim/core/entities.h"

namespace settlesim {

// Shared string <-> enum conversion helpers.
//
// Used by serialization, the catalog loader and event payloads so the save
// format and the event stream never drift apart.

const char* disaster_type_to_string(DisasterType t);
std::optional<DisasterType> disaster_type_from_string(const std::string& s);

const char* disaster_phase_to_string(DisasterPhase p);
std::optional<DisasterPhase> disaster_phase_from_string(const std::string& s);

const char* severity_level_to_string(SeverityLevel l);
SeverityLevel severity_level_from_string(const std::string& s);

const char* population_status_to_string(PopulationStatus s);
PopulationStatus population_status_from_string(const std::string& s);

const char* construction_status_to_string(ConstructionStatus s);
ConstructionStatus construction_status_from_string(const std::string& s);

} // namespace settlesim
