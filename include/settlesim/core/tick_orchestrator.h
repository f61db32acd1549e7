#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "settlesim/core/catalog.h"
#include "settlesim/core/config.h"
#include "settlesim/core/construction_queue.h"
#include "settlesim/core/disaster_director.h"
#include "settlesim/core/events.h"
#include "settlesim/core/population.h"
#include "settlesim/core/repository.h"
#include "settlesim/core/scheduler.h"
#include "settlesim/core/terrain.h"
#include "settlesim/util/hash_rng.h"
#include "settlesim/util/worker_pool.h"

namespace settlesim {

struct TickSummary {
  Phase phase{Phase::Production};
  Millis at{0};

  // Settlements saved with changes.
  int processed{0};
  // Settlements whose update was aborted (load/handler/validation/save failure).
  int failed{0};
  // Settlements the handler left untouched (nothing due, no population record, ...).
  int skipped{0};

  double total_waste{0.0};
  std::size_t events{0};
  std::int64_t elapsed_ms{0};

  // "<settlement id>: <reason>" for every failure.
  std::vector<std::string> failures;
};

struct TickPassResult {
  Millis at{0};

  // True when the pass was refused because another pass was still in flight.
  bool skipped{false};

  std::vector<TickSummary> phases;

  int total_processed() const;
  int total_failed() const;
  std::size_t total_events() const;
};

std::string describe_summary(const TickSummary& s);

// Runs phase handlers over every stored settlement.
//
// Each settlement is processed inside its own boundary: load, handler, validate,
// save, then dispatch its events. A failure in one settlement is logged with its id
// and counted; the rest of the phase continues. Events are dispatched only after a
// successful save, so a failed save never announces a change that did not persist.
//
// Settlements within one phase run in parallel on the worker pool; phases of one
// pass run one after another.
class TickOrchestrator {
 public:
  TickOrchestrator(const StructureCatalog& catalog, const TerrainProvider& terrain, SettlementRepository& repo,
                   EventSink& sink, const EngineConfig& cfg);

  // Runs the given phases in order. Refuses (result.skipped) while another pass is
  // in flight.
  TickPassResult run_pass(const std::vector<Phase>& phases, Millis now);

  // One phase over every settlement. Does not take the in-flight guard.
  TickSummary run_phase(Phase phase, Millis now);

  bool in_flight() const { return in_flight_.load(); }

  const ConstructionQueue& construction() const { return construction_; }
  const DisasterDirector& director() const { return director_; }

  // Assigns sequence numbers and forwards events to the sink. Sink failures are
  // logged and dropped.
  void dispatch(std::vector<SimEvent> events);

  // Deterministic RNG stream for one settlement, phase and epoch second.
  util::HashRng rng_for(const std::string& settlement_id, Phase phase, Millis now) const;

 private:
  struct Outcome {
    enum class Kind { Processed, Skipped, Failed };
    Kind kind{Kind::Skipped};
    double waste{0.0};
    std::size_t events{0};
    std::string error;
  };

  Outcome process_settlement(Phase phase, const std::string& id, Millis now);

  // Handlers return true when the settlement changed and must be saved.
  bool handle(Phase phase, Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events, double* waste);
  bool handle_production(Settlement& s, Millis now, EventBuffer& events, double* waste);
  bool handle_population(Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events);
  bool handle_passive_repair(Settlement& s, Millis now, EventBuffer& events);
  bool handle_disaster_check(Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events);
  bool handle_disaster_progress(Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events);

  double production_hours() const;

  const StructureCatalog& catalog_;
  const TerrainProvider& terrain_;
  SettlementRepository& repo_;
  EventSink& sink_;
  EngineConfig cfg_;

  PopulationModel population_;
  ConstructionQueue construction_;
  DisasterDirector director_;

  util::WorkerPool pool_;

  std::atomic<bool> in_flight_{false};
  std::atomic<std::uint64_t> next_seq_{1};
};

} // namespace settlesim
