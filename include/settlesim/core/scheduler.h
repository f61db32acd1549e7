#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "settlesim/core/entities.h"

namespace settlesim {

enum class Phase {
  Production,
  Population,
  PassiveRepair,
  DisasterCheck,
  DisasterProgress,
};

constexpr std::size_t kPhaseCount = 5;

constexpr std::array<Phase, kPhaseCount> kAllPhases = {Phase::Production, Phase::Population, Phase::PassiveRepair,
                                                       Phase::DisasterCheck, Phase::DisasterProgress};

// "production", "population", "passive-repair", "disaster-check", "disaster-progress".
const char* phase_to_string(Phase p);
// Also accepts underscores and upper case ("DISASTER_CHECK").
std::optional<Phase> phase_from_string(const std::string& s);

struct PhaseSpec {
  Phase phase{Phase::Production};

  // Seconds. The phase is due when epochSeconds % period == offset.
  std::int64_t period_s{3600};
  std::int64_t offset_s{0};

  bool enabled{true};
};

// production 3600/0, population 3600/1800, passive repair 3600/2700,
// disaster check 900/0, disaster progress 600/60. Disaster progress runs at hh:m1 so it
// never shares a second with the quarter-hour phases.
std::vector<PhaseSpec> default_phase_schedule();

// Wall-clock aligned phase scheduler.
//
// Decisions depend on the absolute epoch second only, never on uptime or on how
// often the caller polls. Each phase fires at most once per epoch second: repeated
// calls within the same second are suppressed silently.
//
// Not thread-safe; owned by the engine's single scheduling loop.
class WallClockScheduler {
 public:
  WallClockScheduler();
  explicit WallClockScheduler(std::vector<PhaseSpec> phases);

  const std::vector<PhaseSpec>& phases() const { return phases_; }

  // Problems with the schedule (empty = ok): non-positive periods, offsets outside
  // [0, period), duplicate phases, equal offsets between phases sharing a period.
  std::vector<std::string> validate() const;

  // Phases due at `epoch_ms` that have not fired in this epoch second yet, in
  // declaration order. Records them as fired.
  std::vector<Phase> due_phases(Millis epoch_ms);

  // Same as due_phases() without recording anything.
  std::vector<Phase> peek_due(Millis epoch_ms) const;

  // First epoch second strictly after `epoch_ms`'s second at which any enabled
  // phase is due, as epoch milliseconds. -1 when nothing is enabled.
  Millis next_due(Millis epoch_ms) const;

  // Epoch second `phase` last fired, if ever.
  std::optional<std::int64_t> last_triggered_second(Phase phase) const;

  // Forgets every recorded trigger.
  void reset();

 private:
  bool is_due(const PhaseSpec& spec, std::int64_t sec) const;

  std::vector<PhaseSpec> phases_;
  std::array<std::optional<std::int64_t>, kPhaseCount> last_triggered_{};
};

} // namespace settlesim
