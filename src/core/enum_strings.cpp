#include "settlesim/core/enum_strings.h"

#include "settlesim/util/strings.h"

namespace settlesim {

const char* disaster_type_to_string(DisasterType t) {
  switch (t) {
    case DisasterType::Earthquake: return "EARTHQUAKE";
    case DisasterType::Flood: return "FLOOD";
    case DisasterType::Drought: return "DROUGHT";
    case DisasterType::Wildfire: return "WILDFIRE";
    case DisasterType::Hurricane: return "HURRICANE";
    case DisasterType::Tornado: return "TORNADO";
    case DisasterType::Blizzard: return "BLIZZARD";
    case DisasterType::Heatwave: return "HEATWAVE";
    case DisasterType::Sandstorm: return "SANDSTORM";
    case DisasterType::Volcano: return "VOLCANO";
    case DisasterType::Landslide: return "LANDSLIDE";
    case DisasterType::Avalanche: return "AVALANCHE";
    case DisasterType::LocustSwarm: return "LOCUST_SWARM";
    case DisasterType::InsectPlague: return "INSECT_PLAGUE";
    case DisasterType::Blight: return "BLIGHT";
  }
  return "EARTHQUAKE";
}

std::optional<DisasterType> disaster_type_from_string(const std::string& s) {
  const std::string u = to_upper(s);
  if (u == "EARTHQUAKE") return DisasterType::Earthquake;
  if (u == "FLOOD") return DisasterType::Flood;
  if (u == "DROUGHT") return DisasterType::Drought;
  if (u == "WILDFIRE") return DisasterType::Wildfire;
  if (u == "HURRICANE") return DisasterType::Hurricane;
  if (u == "TORNADO") return DisasterType::Tornado;
  if (u == "BLIZZARD") return DisasterType::Blizzard;
  if (u == "HEATWAVE") return DisasterType::Heatwave;
  if (u == "SANDSTORM") return DisasterType::Sandstorm;
  if (u == "VOLCANO") return DisasterType::Volcano;
  if (u == "LANDSLIDE") return DisasterType::Landslide;
  if (u == "AVALANCHE") return DisasterType::Avalanche;
  if (u == "LOCUST_SWARM") return DisasterType::LocustSwarm;
  if (u == "INSECT_PLAGUE") return DisasterType::InsectPlague;
  if (u == "BLIGHT") return DisasterType::Blight;
  return std::nullopt;
}

const char* disaster_phase_to_string(DisasterPhase p) {
  switch (p) {
    case DisasterPhase::Idle: return "IDLE";
    case DisasterPhase::Warning: return "WARNING";
    case DisasterPhase::Imminent: return "IMMINENT";
    case DisasterPhase::Impact: return "IMPACT";
    case DisasterPhase::Aftermath: return "AFTERMATH";
    case DisasterPhase::Resolved: return "RESOLVED";
  }
  return "IDLE";
}

std::optional<DisasterPhase> disaster_phase_from_string(const std::string& s) {
  const std::string u = to_upper(s);
  if (u == "IDLE") return DisasterPhase::Idle;
  if (u == "WARNING") return DisasterPhase::Warning;
  if (u == "IMMINENT") return DisasterPhase::Imminent;
  if (u == "IMPACT") return DisasterPhase::Impact;
  if (u == "AFTERMATH") return DisasterPhase::Aftermath;
  if (u == "RESOLVED") return DisasterPhase::Resolved;
  return std::nullopt;
}

const char* severity_level_to_string(SeverityLevel l) {
  switch (l) {
    case SeverityLevel::Mild: return "MILD";
    case SeverityLevel::Moderate: return "MODERATE";
    case SeverityLevel::Major: return "MAJOR";
    case SeverityLevel::Catastrophic: return "CATASTROPHIC";
  }
  return "MILD";
}

SeverityLevel severity_level_from_string(const std::string& s) {
  const std::string u = to_upper(s);
  if (u == "MODERATE") return SeverityLevel::Moderate;
  if (u == "MAJOR") return SeverityLevel::Major;
  if (u == "CATASTROPHIC") return SeverityLevel::Catastrophic;
  return SeverityLevel::Mild;
}

const char* population_status_to_string(PopulationStatus s) {
  switch (s) {
    case PopulationStatus::Growing: return "Growing";
    case PopulationStatus::Stable: return "Stable";
    case PopulationStatus::Declining: return "Declining";
  }
  return "Stable";
}

PopulationStatus population_status_from_string(const std::string& s) {
  const std::string l = to_lower(s);
  if (l == "growing") return PopulationStatus::Growing;
  if (l == "declining") return PopulationStatus::Declining;
  return PopulationStatus::Stable;
}

const char* construction_status_to_string(ConstructionStatus s) {
  switch (s) {
    case ConstructionStatus::Queued: return "queued";
    case ConstructionStatus::Active: return "active";
  }
  return "queued";
}

ConstructionStatus construction_status_from_string(const std::string& s) {
  if (to_lower(s) == "active") return ConstructionStatus::Active;
  return ConstructionStatus::Queued;
}

} // namespace settlesim
