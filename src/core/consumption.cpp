#include "settlesim/core/consumption.h"

#include "settlesim/util/log.h"

namespace settlesim {

ResourceDelta consumption_for(int population, const ResourceTable<double>& per_capita, double multiplier) {
  ResourceDelta d;
  if (population <= 0 || multiplier <= 0.0) return d;
  for (Resource r : kAllResources) d[r] = per_capita[r] * population * multiplier;
  return d;
}

ResourceDelta compute_consumption(const Settlement& s, const StructureCatalog& catalog) {
  if (!s.population) {
    log::debug("Consumption [" + s.id + "]: no population record, treating consumption as zero");
    return ResourceDelta{};
  }
  const WorldTemplate& world = catalog.world_template(s.world_template);
  return consumption_for(s.population->current, catalog.per_capita_consumption, world.consumption_multiplier);
}

} // namespace settlesim
