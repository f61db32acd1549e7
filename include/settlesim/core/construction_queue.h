#pragma once

#include <string>

#include "settlesim/core/catalog.h"
#include "settlesim/core/entities.h"
#include "settlesim/core/events.h"

namespace settlesim {

struct ConstructionSettings {
  // Parallel active builds per settlement (at least 1).
  int max_active_slots{3};

  // Build time factor for emergency builds.
  double emergency_time_factor{0.5};

  // construction-progress is announced each time an entry crosses a multiple of this.
  int progress_step_percent{25};
};

// 0..100. Zero-duration builds are always 100; queued entries are 0.
double construction_progress(const ConstructionEntry& e, Millis now);

int active_construction_count(const Settlement& s);

// Per-settlement build queue. Entries are processed FIFO; up to max_active_slots
// build at the same time and the next queued entry is promoted whenever a slot frees.
class ConstructionQueue {
 public:
  explicit ConstructionQueue(const StructureCatalog& catalog, ConstructionSettings settings = {});

  const ConstructionSettings& settings() const { return settings_; }

  // Build duration for `type`: catalog base time, halved for emergency builds.
  std::int64_t build_duration_ms(const std::string& type, bool emergency) const;

  // Appends a build and starts it at once when a slot is free. Unknown structure
  // types use the catalog default build time. Returns the new entry.
  const ConstructionEntry& enqueue(Settlement& s, const std::string& structure_type, Millis now, EventBuffer& events,
                                   bool emergency = false, const std::string& tile_id = std::string()) const;

  // Completes every active entry that reached 100% by `now`, promoting queued
  // entries into the freed slots (their start time is the moment the slot freed),
  // then announces progress for the entries still building. Returns the number of
  // completed builds.
  int process(Settlement& s, Millis now, EventBuffer& events) const;

  // Removes an entry and compacts positions. Returns false for unknown ids.
  bool cancel(Settlement& s, const std::string& entry_id, Millis now, EventBuffer& events) const;

 private:
  void start_entry(ConstructionEntry& e, Millis at, EventBuffer& events) const;
  bool promote_queued(Settlement& s, Millis at, EventBuffer& events) const;
  void emit_queue_updated(const Settlement& s, Millis at, EventBuffer& events) const;

  const StructureCatalog& catalog_;
  ConstructionSettings settings_;
};

} // namespace settlesim
