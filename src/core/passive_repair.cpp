#include "settlesim/core/passive_repair.h"

#include <algorithm>

#include "settlesim/util/log.h"
#include "settlesim/util/strings.h"

namespace settlesim {

PassiveRepairResult apply_passive_repair(Settlement& s, Millis now, EventBuffer& events,
                                         const PassiveRepairSettings& settings) {
  PassiveRepairResult res;
  const StructureInstance* workshop = best_structure(s, "WORKSHOP");
  if (!workshop) return res;
  res.has_workshop = true;

  const double amount = settings.rate_per_hour * std::max(1, workshop->level);
  for (auto& st : s.structures) {
    if (st.health <= settings.min_health || st.health >= 100.0) continue;
    const double old_health = st.health;
    st.health = std::min(100.0, old_health + amount);
    ++res.repaired;
    res.health_restored += st.health - old_health;

    json::Object f;
    f["structureId"] = st.id;
    f["structureType"] = st.type;
    f["oldHealth"] = old_health;
    f["newHealth"] = st.health;
    f["source"] = std::string("passive");
    events.emit(EventType::StructureRepaired, now, st.type + " " + st.id + " repaired to " + format_fixed(st.health, 0) + "%",
                std::move(f));
  }

  if (res.repaired > 0) {
    log::debug("Passive repair [" + s.id + "]: " + std::to_string(res.repaired) + " structures, +" +
               format_fixed(res.health_restored, 1) + " health");
  }
  return res;
}

} // namespace settlesim
