#include "settlesim/core/production.h"

#include <algorithm>

#include "settlesim/util/log.h"

namespace settlesim {
namespace {

double severity_impact(SeverityLevel l) {
  switch (l) {
    case SeverityLevel::Mild: return 0.2;
    case SeverityLevel::Moderate: return 0.4;
    case SeverityLevel::Major: return 0.6;
    case SeverityLevel::Catastrophic: return 0.8;
  }
  return 0.0;
}

void note(ProductionReport& report, const Settlement& s, std::string msg) {
  log::warn("Production [" + s.id + "]: " + msg);
  report.issues.push_back(std::move(msg));
}

} // namespace

double health_effectiveness(double health) {
  if (health <= 0.0) return 0.0;
  if (health < 20.0) return 0.1;
  if (health < 40.0) return 0.5;
  if (health < 60.0) return 0.7;
  if (health < 80.0) return 0.85;
  if (health < 95.0) return 0.95;
  return 1.0;
}

double disaster_production_multiplier(const Settlement& s) {
  if (!s.active_disaster) return 1.0;
  const auto& d = *s.active_disaster;
  if (d.phase != DisasterPhase::Impact && d.phase != DisasterPhase::Aftermath) return 1.0;
  return std::max(0.1, 1.0 - severity_impact(d.severity_level));
}

double extractor_output(double base_rate, double quality, double level_multiplier, double biome_efficiency,
                        double health) {
  const double q = std::clamp(quality, 0.0, 100.0) / 100.0;
  return base_rate * q * level_multiplier * biome_efficiency * health_effectiveness(health);
}

ProductionReport compute_production(const Settlement& s, const StructureCatalog& catalog,
                                    const TerrainProvider& terrain) {
  ProductionReport report;

  for (const auto& st : s.structures) {
    if (!catalog.find_structure(st.type)) {
      note(report, s, "unknown structure type '" + st.type + "' (" + st.id + ")");
      continue;
    }
    const auto rates = catalog.rates_for(st.type);
    if (rates.empty()) continue;

    const std::string& tile_id = st.tile_id.empty() ? s.location.tile_id : st.tile_id;
    const Tile* tile = terrain.find_tile(tile_id);
    if (!tile) {
      note(report, s, "extractor " + st.id + " references unknown tile '" + tile_id + "'");
      continue;
    }

    const auto* biome = catalog.find_biome(tile->biome);
    if (!biome) {
      note(report, s, "no efficiency table for biome '" + tile->biome + "' (extractor " + st.id + ")");
      continue;
    }

    const double level_mult = catalog.level_multiplier(st.level);
    bool contributed = false;
    for (const auto& rate : rates) {
      const double out =
          extractor_output(rate.base_rate, tile->quality[rate.resource], level_mult, (*biome)[rate.resource], st.health);
      if (out <= 0.0) continue;
      report.amounts[rate.resource] += out;
      contributed = true;
    }
    if (contributed) ++report.extractors;
  }

  const WorldTemplate& world = catalog.world_template(s.world_template);
  report.amounts *= world.production_multiplier * disaster_production_multiplier(s);
  return report;
}

} // namespace settlesim
