#include "settlesim/core/state_validation.h"

#include <cmath>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "settlesim/core/enum_strings.h"

namespace settlesim {

namespace {

constexpr double kEpsilon = 1e-6;

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

int phase_rank(DisasterPhase p) { return static_cast<int>(p); }

void validate_disaster(const DisasterEvent& d, const std::string& where, std::vector<std::string>& errors) {
  if (d.id.empty()) push(errors, join(where, " has an empty id"));
  if (d.severity < 0 || d.severity > 100) push(errors, join(where, " severity ", d.severity, " outside [0, 100]"));
  if (d.phase == DisasterPhase::Idle) push(errors, join(where, " is stored in phase IDLE"));

  if (d.imminent_at < d.warning_at || d.impact_start_at < d.imminent_at || d.impact_end_at < d.impact_start_at) {
    push(errors, join(where, " has an unordered schedule"));
  }
  if (d.damage_ticks_total < 1) push(errors, join(where, " damage_ticks_total must be >= 1"));
  if (d.damage_ticks_applied < 0 || d.damage_ticks_applied > d.damage_ticks_total) {
    push(errors, join(where, " damage_ticks_applied ", d.damage_ticks_applied, " outside [0, ", d.damage_ticks_total,
                      "]"));
  }
  if (d.net_damage < 0.0 || d.net_damage > 100.0) push(errors, join(where, " net_damage outside [0, 100]"));
  if (d.casualties < 0) push(errors, join(where, " has negative casualties"));

  // Transitions must walk the lifecycle one step at a time.
  int expected = phase_rank(DisasterPhase::Warning);
  Millis last_at = 0;
  for (std::size_t i = 0; i < d.transitions.size(); ++i) {
    const auto& t = d.transitions[i];
    if (phase_rank(t.phase) != expected) {
      push(errors, join(where, " transition ", i, " is ", disaster_phase_to_string(t.phase), ", expected ",
                        disaster_phase_to_string(static_cast<DisasterPhase>(expected))));
      break;
    }
    if (i > 0 && t.at < last_at) push(errors, join(where, " transition ", i, " goes back in time"));
    last_at = t.at;
    ++expected;
  }
  if (!d.transitions.empty() && d.transitions.back().phase != d.phase) {
    push(errors, join(where, " phase ", disaster_phase_to_string(d.phase), " does not match its last transition"));
  }
}

} // namespace

std::vector<std::string> validate_settlement(const Settlement& s, const StructureCatalog* catalog,
                                             int max_active_slots) {
  std::vector<std::string> errors;
  const std::string who = "Settlement '" + s.id + "'";

  if (s.id.empty()) push(errors, "Settlement has an empty id");
  if (!std::isfinite(s.resilience) || s.resilience < 0.0 || s.resilience > 100.0) {
    push(errors, join(who, " resilience ", s.resilience, " outside [0, 100]"));
  }

  for (Resource r : kAllResources) {
    const StorageSlot& slot = s.storage[r];
    if (!std::isfinite(slot.amount) || !std::isfinite(slot.capacity)) {
      push(errors, join(who, " storage ", resource_to_string(r), " is not finite"));
      continue;
    }
    if (slot.capacity < 0.0) push(errors, join(who, " storage ", resource_to_string(r), " has negative capacity"));
    if (slot.amount < -kEpsilon || slot.amount > slot.capacity + kEpsilon) {
      push(errors, join(who, " storage ", resource_to_string(r), " amount ", slot.amount, " outside [0, ",
                        slot.capacity, "]"));
    }
  }

  if (s.population) {
    const auto& p = *s.population;
    if (p.current < 0) push(errors, join(who, " population ", p.current, " is negative"));
    if (p.capacity < 0) push(errors, join(who, " population capacity ", p.capacity, " is negative"));
    if (p.current > p.capacity) {
      push(errors, join(who, " population ", p.current, " exceeds capacity ", p.capacity));
    }
    if (p.happiness < 0.0 || p.happiness > 100.0) {
      push(errors, join(who, " happiness ", p.happiness, " outside [0, 100]"));
    }
  }

  std::unordered_set<std::string> ids;
  for (const auto& st : s.structures) {
    if (st.id.empty()) push(errors, join(who, " has a structure with an empty id"));
    if (!ids.insert(st.id).second) push(errors, join(who, " has duplicate id '", st.id, "'"));
    if (st.health < 0.0 || st.health > 100.0) {
      push(errors, join(who, " structure ", st.id, " health ", st.health, " outside [0, 100]"));
    }
    if (st.level < 1) push(errors, join(who, " structure ", st.id, " level ", st.level, " is below 1"));
    if (catalog) {
      if (const auto* def = catalog->find_structure(st.type)) {
        if (st.level > def->max_level) {
          push(errors, join(who, " structure ", st.id, " level ", st.level, " exceeds max ", def->max_level));
        }
      }
    }
  }

  int active = 0;
  for (std::size_t i = 0; i < s.construction.size(); ++i) {
    const auto& e = s.construction[i];
    if (e.id.empty()) push(errors, join(who, " has a construction entry with an empty id"));
    if (!ids.insert(e.id).second) push(errors, join(who, " has duplicate id '", e.id, "'"));
    if (e.position != static_cast<int>(i) + 1) {
      push(errors, join(who, " construction ", e.id, " position ", e.position, ", expected ", i + 1));
    }
    if (e.duration_ms < 0) push(errors, join(who, " construction ", e.id, " has negative duration"));
    if (e.status == ConstructionStatus::Active) {
      ++active;
      if (e.completes_at < e.started_at) push(errors, join(who, " construction ", e.id, " completes before it starts"));
    }
  }
  if (max_active_slots > 0 && active > max_active_slots) {
    push(errors, join(who, " has ", active, " active builds, more than ", max_active_slots, " slots"));
  }

  if (s.active_disaster) {
    validate_disaster(*s.active_disaster, who + " disaster '" + s.active_disaster->id + "'", errors);
    if (s.active_disaster->phase == DisasterPhase::Resolved) {
      push(errors, join(who, " keeps a RESOLVED disaster active"));
    }
  }
  if (s.disaster_history.size() > kMaxDisasterHistory) {
    push(errors, join(who, " disaster history holds ", s.disaster_history.size(), " entries"));
  }

  return errors;
}

} // namespace settlesim
