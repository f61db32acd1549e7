#include "settlesim/core/scheduler.h"

#include <algorithm>
#include <map>

#include "settlesim/util/strings.h"
#include "settlesim/util/time.h"

namespace settlesim {
namespace {

std::int64_t floor_mod(std::int64_t a, std::int64_t m) {
  const std::int64_t r = a % m;
  return r < 0 ? r + m : r;
}

} // namespace

const char* phase_to_string(Phase p) {
  switch (p) {
    case Phase::Production: return "production";
    case Phase::Population: return "population";
    case Phase::PassiveRepair: return "passive-repair";
    case Phase::DisasterCheck: return "disaster-check";
    case Phase::DisasterProgress: return "disaster-progress";
  }
  return "production";
}

std::optional<Phase> phase_from_string(const std::string& s) {
  std::string key = to_lower(trim(s));
  std::replace(key.begin(), key.end(), '_', '-');
  for (Phase p : kAllPhases) {
    if (key == phase_to_string(p)) return p;
  }
  return std::nullopt;
}

std::vector<PhaseSpec> default_phase_schedule() {
  return {
      {Phase::Production, 3600, 0, true},
      {Phase::Population, 3600, 1800, true},
      {Phase::PassiveRepair, 3600, 2700, true},
      {Phase::DisasterCheck, 900, 0, true},
      {Phase::DisasterProgress, 600, 60, true},
  };
}

WallClockScheduler::WallClockScheduler() : WallClockScheduler(default_phase_schedule()) {}

WallClockScheduler::WallClockScheduler(std::vector<PhaseSpec> phases) : phases_(std::move(phases)) {}

std::vector<std::string> WallClockScheduler::validate() const {
  std::vector<std::string> errors;
  std::array<int, kPhaseCount> seen{};
  std::map<std::int64_t, std::map<std::int64_t, Phase>> by_period;

  for (const auto& spec : phases_) {
    const std::string name = phase_to_string(spec.phase);
    if (++seen[static_cast<std::size_t>(spec.phase)] > 1) {
      errors.push_back("Phase " + name + " is scheduled more than once");
    }
    if (spec.period_s <= 0) {
      errors.push_back("Phase " + name + " has non-positive period " + std::to_string(spec.period_s));
      continue;
    }
    if (spec.offset_s < 0 || spec.offset_s >= spec.period_s) {
      errors.push_back("Phase " + name + " offset " + std::to_string(spec.offset_s) + " is outside [0, " +
                       std::to_string(spec.period_s) + ")");
      continue;
    }
    if (!spec.enabled) continue;

    auto& offsets = by_period[spec.period_s];
    auto it = offsets.find(spec.offset_s);
    if (it != offsets.end()) {
      errors.push_back("Phases " + std::string(phase_to_string(it->second)) + " and " + name +
                       " share period " + std::to_string(spec.period_s) + "s and offset " +
                       std::to_string(spec.offset_s) + "s");
    } else {
      offsets.emplace(spec.offset_s, spec.phase);
    }
  }
  return errors;
}

bool WallClockScheduler::is_due(const PhaseSpec& spec, std::int64_t sec) const {
  if (!spec.enabled || spec.period_s <= 0) return false;
  return floor_mod(sec, spec.period_s) == spec.offset_s;
}

std::vector<Phase> WallClockScheduler::due_phases(Millis epoch_ms) {
  const std::int64_t sec = epoch_seconds(epoch_ms);
  std::vector<Phase> out;
  for (const auto& spec : phases_) {
    if (!is_due(spec, sec)) continue;
    auto& last = last_triggered_[static_cast<std::size_t>(spec.phase)];
    if (last && *last == sec) continue;
    last = sec;
    out.push_back(spec.phase);
  }
  return out;
}

std::vector<Phase> WallClockScheduler::peek_due(Millis epoch_ms) const {
  const std::int64_t sec = epoch_seconds(epoch_ms);
  std::vector<Phase> out;
  for (const auto& spec : phases_) {
    if (!is_due(spec, sec)) continue;
    const auto& last = last_triggered_[static_cast<std::size_t>(spec.phase)];
    if (last && *last == sec) continue;
    out.push_back(spec.phase);
  }
  return out;
}

Millis WallClockScheduler::next_due(Millis epoch_ms) const {
  const std::int64_t sec = epoch_seconds(epoch_ms);
  std::optional<std::int64_t> best;
  for (const auto& spec : phases_) {
    if (!spec.enabled || spec.period_s <= 0) continue;
    const std::int64_t into = floor_mod(sec - spec.offset_s, spec.period_s);
    std::int64_t next = sec - into + spec.period_s;
    if (next <= sec) next += spec.period_s;
    if (!best || next < *best) best = next;
  }
  return best ? *best * kMsPerSecond : -1;
}

std::optional<std::int64_t> WallClockScheduler::last_triggered_second(Phase phase) const {
  return last_triggered_[static_cast<std::size_t>(phase)];
}

void WallClockScheduler::reset() { last_triggered_.fill(std::nullopt); }

} // namespace settlesim
