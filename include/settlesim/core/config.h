#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "settlesim/core/construction_queue.h"
#include "settlesim/core/disaster_director.h"
#include "settlesim/core/passive_repair.h"
#include "settlesim/core/scheduler.h"

namespace settlesim {

struct EngineConfig {
  // Phase periods and offsets (seconds). See default_phase_schedule().
  std::vector<PhaseSpec> phases{default_phase_schedule()};

  // Disaster lifecycle timings. damage_interval_s is the IMPACT damage sub-interval
  // and is independent of the disaster-check period above.
  DisasterSettings disaster;

  ConstructionSettings construction;

  PassiveRepairSettings repair;

  // Threads processing settlements within one phase.
  // 0 = hardware concurrency (capped at max_worker_threads).
  int worker_threads{0};
  int max_worker_threads{8};

  // How long the loop sleeps at most between scheduler polls.
  //
  // The loop also wakes for the next due second, so this mostly bounds how quickly
  // a stop request or a clock jump is noticed.
  int poll_interval_ms{250};

  // storage-warning when a resource is above this fill ratio.
  double storage_warning_threshold{0.9};

  // resource-shortage when a draining resource runs out within this many hours.
  double shortage_buffer_hours{1.0};

  // Seed for the per-settlement disaster / population RNG streams. The stream for
  // a settlement is derived from (seed, settlement id, epoch second).
  std::uint64_t rng_seed{0x5e771e5eedULL};

  // Recent events kept in memory by the engine's EventLog. 0 = unlimited.
  int max_events{1000};
};

// Problems with a configuration (empty = ok).
std::vector<std::string> validate_engine_config(const EngineConfig& cfg);

// Document shape (every key optional):
//
//   {
//     "phases": {"production": {"period_s": 3600, "offset_s": 0, "enabled": true}, ...},
//     "disaster": {"imminent_lead_s": 1800, "damage_interval_s": 600,
//                  "aftermath_window_s": 172800, "repair_discount": 0.5, "damage_variance": 0.2},
//     "construction": {"max_active_slots": 3, "emergency_time_factor": 0.5, "progress_step_percent": 25},
//     "repair": {"rate_per_hour": 1, "min_health": 20},
//     "worker_threads": 0, "poll_interval_ms": 250, "storage_warning_threshold": 0.9,
//     "shortage_buffer_hours": 1, "rng_seed": 12345, "max_events": 1000
//   }
//
// Unknown keys are logged and ignored. Throws ConfigurationError on malformed values.
EngineConfig engine_config_from_json(const std::string& json_text, EngineConfig base = {});

EngineConfig load_engine_config(const std::string& path, EngineConfig base = {});

} // namespace settlesim
