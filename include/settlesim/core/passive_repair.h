#pragma once

#include "settlesim/core/entities.h"
#include "settlesim/core/events.h"

namespace settlesim {

struct PassiveRepairSettings {
  // Health restored per hour by a level 1 workshop.
  double rate_per_hour{1.0};

  // Structures at or below this health need a manual repair.
  double min_health{20.0};
};

struct PassiveRepairResult {
  bool has_workshop{false};
  int repaired{0};
  double health_restored{0.0};
};

// Hourly self-repair: a settlement with an intact WORKSHOP restores
// rate * workshop level health to every structure with min_health < health < 100,
// capped at 100. Emits structure-repaired per structure.
PassiveRepairResult apply_passive_repair(Settlement& s, Millis now, EventBuffer& events,
                                         const PassiveRepairSettings& settings = {});

} // namespace settlesim
