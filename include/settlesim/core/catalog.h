#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "settlesim/core/entities.h"
#include "settlesim/core/resources.h"

namespace settlesim {

// Well-known modifier names (matched exactly).
inline constexpr const char* kModPopulationCapacity = "Population Capacity";
inline constexpr const char* kModStorageCapacity = "Storage Capacity";
inline constexpr const char* kModResourceStorage = "Storage";
inline constexpr const char* kModMoraleBoost = "Morale Boost";
inline constexpr const char* kModShelterCapacity = "Shelter Capacity";
inline constexpr const char* kModDefense = "Defense";

struct StructureModifier {
  std::string name;
  double value{0.0};
  // Only for per-resource modifiers ("Storage").
  std::optional<Resource> resource;
};

struct StructureDef {
  std::string type;
  std::string name;

  int max_level{5};

  // Base build time at level 1.
  std::int64_t build_time_ms{600000};

  ResourceTable<double> cost;

  // Applied at level 1; scaled by the level multiplier for higher levels.
  std::vector<StructureModifier> modifiers;

  // Fraction of incoming disaster damage absorbed (negative = more damage).
  std::unordered_map<DisasterType, double> resistances;
  // Resistance applied to every disaster type not listed above.
  double resistance_all{0.0};
};

// Base output per hour at level 1, quality 100 and biome efficiency 1.
struct ProductionRate {
  Resource resource{Resource::Food};
  std::string extractor_type;
  double base_rate{0.0};
};

struct WorldTemplate {
  std::string id;
  std::string name;
  double production_multiplier{1.0};
  double consumption_multiplier{1.0};
  double population_growth_multiplier{1.0};

  // Chance per disaster check that a settlement receives a warning.
  double disaster_probability{0.015};
  double severity_multiplier{1.0};
  double warning_time_multiplier{1.0};
};

struct BiomeDisasterRisk {
  std::vector<DisasterType> high;
  std::vector<DisasterType> moderate;
  std::vector<DisasterType> low;
};

struct DisasterTypeDef {
  DisasterType type{DisasterType::Earthquake};
  std::int64_t warning_s{7200};
  std::int64_t impact_duration_s{3600};
  double casualty_multiplier{1.0};
  std::vector<std::string> recommended_actions;
};

// Static, read-only configuration for the engine: structure definitions, production
// rates, biome tables, world templates and disaster parameters.
//
// Loaded once at startup (data/catalog.json) and shared by every worker thread.
struct StructureCatalog {
  std::unordered_map<std::string, StructureDef> structures;
  std::vector<ProductionRate> production_rates;

  // Keyed by upper-case biome name.
  std::unordered_map<std::string, ResourceTable<double>> biome_efficiency;
  std::unordered_map<std::string, BiomeDisasterRisk> biome_disasters;

  std::unordered_map<std::string, WorldTemplate> world_templates;
  std::unordered_map<DisasterType, DisasterTypeDef> disasters;

  // levelMultiplier = level_multiplier_base^(level-1)
  double level_multiplier_base{1.5};

  double base_storage_capacity{1000.0};
  int base_population_capacity{10};

  // Consumption per person per hour.
  ResourceTable<double> per_capita_consumption;

  // Build time for structure types missing from `structures`.
  std::int64_t default_build_time_ms{600000};

  const StructureDef* find_structure(const std::string& type) const;

  // Rates where `extractor_type` is the producing structure.
  std::vector<ProductionRate> rates_for(const std::string& extractor_type) const;

  bool is_extractor(const std::string& type) const;

  // nullptr for unknown biomes (case-insensitive).
  const ResourceTable<double>* find_biome(const std::string& biome) const;
  const BiomeDisasterRisk* find_biome_disasters(const std::string& biome) const;

  // Falls back to STANDARD (and then to built-in defaults) for unknown ids, logging a
  // warning on every miss.
  const WorldTemplate& world_template(const std::string& id) const;

  // Falls back to built-in defaults for unknown types.
  const DisasterTypeDef& disaster(DisasterType t) const;

  double level_multiplier(int level) const;

  std::int64_t build_time_ms(const std::string& type) const;

  // Sum of `name` modifiers over intact structures (health > 0), each scaled by its
  // level multiplier. When `resource` is set only modifiers for that resource count.
  double sum_modifiers(const Settlement& s, const std::string& name,
                       std::optional<Resource> resource = std::nullopt) const;

  // Resistance of a structure type against a disaster type (0 when unknown).
  double resistance(const std::string& structure_type, DisasterType t) const;
};

// Engine defaults: biome efficiency and disaster tiers, world templates, disaster
// timings and per-capita consumption. No structures or production rates.
StructureCatalog builtin_catalog_defaults();

// Parses a catalog document on top of builtin_catalog_defaults(); sections present in
// the document replace the matching defaults entry by entry.
// Throws ConfigurationError on malformed input.
StructureCatalog load_catalog_from_json(const std::string& json_text);

// Reads and parses a catalog file. Throws ConfigurationError / std::runtime_error.
StructureCatalog load_catalog_file(const std::string& path);

// Cross-checks a loaded catalog. Returns human-readable problems (empty = ok).
std::vector<std::string> validate_catalog(const StructureCatalog& c);

} // namespace settlesim
