#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "settlesim/core/catalog.h"
#include "settlesim/core/errors.h"
#include "settlesim/core/terrain.h"
#include "settlesim/util/log.h"

#define SS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

bool rejects(const std::string& text, const std::string& needle) {
  try {
    (void)settlesim::load_catalog_from_json(text);
  } catch (const settlesim::ConfigurationError& e) {
    const std::string msg = e.what();
    if (msg.find(needle) == std::string::npos) {
      std::cerr << "unexpected catalog error: " << msg << "\n";
      return false;
    }
    return true;
  }
  return false;
}

} // namespace

int test_catalog() {
  using settlesim::DisasterType;
  using settlesim::Resource;

  // Shipped content.
  {
    const auto c = settlesim::load_catalog_file("data/catalog.json");
    SS_ASSERT(settlesim::validate_catalog(c).empty());
    SS_ASSERT(c.find_structure("FARM") != nullptr);
    SS_ASSERT(c.find_structure("EMERGENCY_SHELTER") != nullptr);
    SS_ASSERT(c.find_structure("NOT_A_BUILDING") == nullptr);
    SS_ASSERT(c.is_extractor("FARM"));
    SS_ASSERT(c.is_extractor("WELL"));
    SS_ASSERT(!c.is_extractor("HOUSE"));

    const auto farm = c.rates_for("FARM");
    SS_ASSERT(farm.size() == 1);
    SS_ASSERT(farm[0].resource == Resource::Food);
    SS_ASSERT(approx(farm[0].base_rate, 240.0));

    SS_ASSERT(approx(c.per_capita_consumption[Resource::Food], 18.0));
    SS_ASSERT(approx(c.per_capita_consumption[Resource::Water], 36.0));

    SS_ASSERT(approx(c.level_multiplier(1), 1.0));
    SS_ASSERT(approx(c.level_multiplier(3), 2.25));

    SS_ASSERT(approx(c.resistance("SEISMIC_FOUNDATION", DisasterType::Earthquake), 0.5));
    SS_ASSERT(approx(c.resistance("SEISMIC_FOUNDATION", DisasterType::Flood), 0.0));
    SS_ASSERT(approx(c.resistance("FORTRESS", DisasterType::Flood), 0.3));
    SS_ASSERT(approx(c.resistance("UNKNOWN", DisasterType::Flood), 0.0));

    SS_ASSERT(c.build_time_ms("TENT") == 0);
    SS_ASSERT(c.build_time_ms("NOT_A_BUILDING") == c.default_build_time_ms);
  }

  // Built-in tables.
  {
    const auto c = settlesim::builtin_catalog_defaults();
    SS_ASSERT(c.structures.empty());
    SS_ASSERT(c.production_rates.empty());

    const auto* grass = c.find_biome("grassland");
    SS_ASSERT(grass != nullptr);
    SS_ASSERT(approx((*grass)[Resource::Food], 1.0));
    SS_ASSERT(c.find_biome("LAVA_LAKE") == nullptr);

    SS_ASSERT(c.world_template("SURVIVAL").id == "SURVIVAL");
    SS_ASSERT(approx(c.world_template("SURVIVAL").production_multiplier, 0.7));
    std::vector<std::string> warnings;
    settlesim::log::set_sink([&](settlesim::log::Level lvl, const std::string& msg) {
      if (lvl == settlesim::log::Level::Warn) warnings.push_back(msg);
    });
    const std::string fallback = c.world_template("no-such-world").id;
    const std::string known = c.world_template("survival").id;
    settlesim::log::set_sink({});
    SS_ASSERT(fallback == "STANDARD");
    SS_ASSERT(known == "SURVIVAL");
    SS_ASSERT(warnings.size() == 1);
    SS_ASSERT(warnings[0] == "Unknown world template 'no-such-world', using STANDARD");

    SS_ASSERT(c.disaster(DisasterType::Tornado).warning_s == 1800);
    SS_ASSERT(c.disaster(DisasterType::Flood).impact_duration_s == 3600);
  }

  // Modifier sums follow level and health.
  {
    const auto c = settlesim::load_catalog_file("data/catalog.json");
    settlesim::Settlement s;
    s.id = "mods";
    settlesim::StructureInstance house;
    house.id = "structure-1";
    house.type = "HOUSE";
    house.level = 2;
    s.structures.push_back(house);
    settlesim::StructureInstance tent;
    tent.id = "structure-2";
    tent.type = "TENT";
    s.structures.push_back(tent);
    SS_ASSERT(approx(c.sum_modifiers(s, settlesim::kModPopulationCapacity), 5.0 * 1.5 + 2.0));

    s.structures[0].health = 0.0;
    SS_ASSERT(approx(c.sum_modifiers(s, settlesim::kModPopulationCapacity), 2.0));

    settlesim::StructureInstance granary;
    granary.id = "structure-3";
    granary.type = "GRANARY";
    s.structures.push_back(granary);
    SS_ASSERT(approx(c.sum_modifiers(s, settlesim::kModResourceStorage, Resource::Food), 1000.0));
    SS_ASSERT(approx(c.sum_modifiers(s, settlesim::kModResourceStorage, Resource::Water), 0.0));
  }

  // Documents override defaults entry by entry.
  {
    const auto c = settlesim::load_catalog_from_json(
        R"({"world_templates": {"SURVIVAL": {"production_multiplier": 0.5}},
            "structures": {"HUT": {"max_level": 2, "modifiers": [{"name": "Population Capacity", "value": 3}]}},
            "production_rates": [{"resource": "wood", "extractor": "HUT", "base_rate": 10}]})");
    SS_ASSERT(approx(c.world_template("SURVIVAL").production_multiplier, 0.5));
    SS_ASSERT(c.world_template("RELAXED").id == "RELAXED");
    SS_ASSERT(c.find_structure("HUT") != nullptr);
    SS_ASSERT(c.find_structure("HUT")->max_level == 2);
    SS_ASSERT(c.is_extractor("HUT"));
    SS_ASSERT(settlesim::validate_catalog(c).empty());
  }

  // Malformed documents.
  SS_ASSERT(rejects("{ nope", "not valid JSON"));
  SS_ASSERT(rejects("[]", "expected an object"));
  SS_ASSERT(rejects(R"({"per_capita_consumption": {"gold": 1}})", "unknown resource 'gold'"));
  SS_ASSERT(rejects(R"({"structures": {"HUT": {"resistances": {"HAIL": 0.2}}}})", "unknown disaster type 'HAIL'"));
  SS_ASSERT(rejects(R"({"disasters": {"METEOR": {"warning_s": 10}}})", "unknown disaster type 'METEOR'"));
  SS_ASSERT(rejects(R"({"level_multiplier_base": "high"})", "expected a number"));

  // Problems the loader accepts but validation reports.
  {
    const auto c = settlesim::load_catalog_from_json(
        R"({"production_rates": [{"resource": "ore", "extractor": "GHOST_MINE", "base_rate": 5}]})");
    const auto problems = settlesim::validate_catalog(c);
    SS_ASSERT(problems.size() == 1);
    SS_ASSERT(problems[0].find("GHOST_MINE") != std::string::npos);
  }

  // Tiles.
  {
    const auto tiles = settlesim::load_tiles_file("data/tiles.json");
    SS_ASSERT(tiles.size() == 7);
    const auto ids = tiles.ids();
    SS_ASSERT(ids.front() == "tile-0001");
    const settlesim::Tile* t = tiles.find_tile("tile-0002");
    SS_ASSERT(t != nullptr);
    SS_ASSERT(t->biome == "GRASSLAND");
    SS_ASSERT(t->region_id == "region-north");
    SS_ASSERT(approx(t->quality[Resource::Food], 85.0));
    SS_ASSERT(tiles.find_tile("tile-9999") == nullptr);

    bool threw = false;
    try {
      (void)settlesim::load_tiles_from_json(R"({"tiles": [{"id": "x", "quality": {"gold": 5}}]})");
    } catch (const settlesim::ConfigurationError&) {
      threw = true;
    }
    SS_ASSERT(threw);
  }

  return 0;
}
