#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "settlesim/core/catalog.h"
#include "settlesim/core/config.h"
#include "settlesim/core/events.h"
#include "settlesim/core/repository.h"
#include "settlesim/core/terrain.h"
#include "settlesim/core/tick_orchestrator.h"
#include "settlesim/util/time.h"

#define SS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using settlesim::EventType;
using settlesim::Phase;
using settlesim::Resource;

settlesim::Settlement farmstead(const std::string& id, bool with_population = true) {
  settlesim::Settlement s;
  s.id = id;
  s.location.region_id = "region-north";
  s.location.tile_id = "tile-0002";
  s.storage[Resource::Food].amount = 100.0;
  s.storage[Resource::Water].amount = 400.0;
  if (with_population) {
    settlesim::PopulationState p;
    p.current = 3;
    s.population = p;
  }
  settlesim::StructureInstance farm;
  farm.id = settlesim::allocate_local_id(s, "structure");
  farm.type = "FARM";
  farm.tile_id = "tile-0002";
  s.structures.push_back(farm);
  return s;
}

std::size_t events_for(const settlesim::EventLog& log, const std::string& settlement_id) {
  std::size_t n = 0;
  for (const auto& e : log.snapshot()) {
    if (e.settlement_id == settlement_id) ++n;
  }
  return n;
}

// Blocks inside load() until released, so a pass can be held in flight.
class GatedRepository : public settlesim::InMemoryRepository {
 public:
  using InMemoryRepository::InMemoryRepository;

  settlesim::Settlement load(const std::string& id) override {
    entered_.store(true);
    while (!released_.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return InMemoryRepository::load(id);
  }

  bool entered() const { return entered_.load(); }
  void release() { released_.store(true); }

 private:
  std::atomic<bool> entered_{false};
  std::atomic<bool> released_{false};
};

class ThrowingSink : public settlesim::EventSink {
 public:
  void publish(const settlesim::SimEvent&) override { throw std::runtime_error("sink offline"); }
};

} // namespace

int test_tick_orchestrator() {
  const auto catalog = settlesim::load_catalog_file("data/catalog.json");
  const auto tiles = settlesim::load_tiles_file("data/tiles.json");
  const settlesim::Millis t0 = settlesim::parse_iso8601("2026-03-01T10:00:00Z");

  settlesim::EngineConfig cfg;
  cfg.worker_threads = 2;

  // Production over several settlements, one of which fails to save.
  {
    settlesim::InMemoryRepository repo(&catalog);
    repo.put(farmstead("alpha"));
    repo.put(farmstead("bravo"));
    repo.put(farmstead("charlie"));
    repo.fail_saves_for("bravo");

    settlesim::EventLog log(0);
    settlesim::TickOrchestrator orch(catalog, tiles, repo, log, cfg);

    const auto result = orch.run_pass({Phase::Production}, t0);
    SS_ASSERT(!result.skipped);
    SS_ASSERT(result.phases.size() == 1);
    const auto& summary = result.phases[0];
    SS_ASSERT(summary.phase == Phase::Production);
    SS_ASSERT(summary.processed == 2);
    SS_ASSERT(summary.failed == 1);
    SS_ASSERT(summary.failures.size() == 1);
    SS_ASSERT(summary.failures[0].rfind("bravo: ", 0) == 0);
    SS_ASSERT(result.total_failed() == 1);
    SS_ASSERT(!orch.in_flight());

    SS_ASSERT(log.count(EventType::ResourceTick) == 2);
    SS_ASSERT(events_for(log, "bravo") == 0);
    SS_ASSERT(events_for(log, "alpha") > 0);
    SS_ASSERT(summary.events == log.size());

    // Sequence numbers are unique and start at 1.
    std::uint64_t max_seq = 0;
    for (const auto& e : log.snapshot()) max_seq = std::max(max_seq, e.seq);
    SS_ASSERT(max_seq == log.size());

    const auto alpha = repo.load("alpha");
    SS_ASSERT(alpha.revision == 1);
    SS_ASSERT(alpha.storage[Resource::Food].amount > 100.0);
    SS_ASSERT(alpha.storage[Resource::Water].amount < 400.0);
    SS_ASSERT(repo.load("bravo").revision == 0);
    SS_ASSERT(repo.load("bravo").storage[Resource::Food].amount == 100.0);

    // The injected failure was one-shot; the next pass gets everyone.
    const auto again = orch.run_pass({Phase::Production}, t0 + settlesim::kMsPerHour);
    SS_ASSERT(again.total_processed() == 3);
    SS_ASSERT(again.total_failed() == 0);
  }

  // Population skips settlements without a record; a broken sink does not fail the settlement.
  {
    settlesim::InMemoryRepository repo(&catalog);
    repo.put(farmstead("with-people"));
    repo.put(farmstead("empty", false));

    ThrowingSink sink;
    settlesim::TickOrchestrator orch(catalog, tiles, repo, sink, cfg);
    const auto summary = orch.run_phase(Phase::Population, t0 + 1800 * settlesim::kMsPerSecond);
    SS_ASSERT(summary.processed == 1);
    SS_ASSERT(summary.skipped == 1);
    SS_ASSERT(summary.failed == 0);
    SS_ASSERT(repo.load("with-people").revision == 1);
    SS_ASSERT(repo.load("empty").revision == 0);

    // Nothing to repair without a workshop.
    const auto repair = orch.run_phase(Phase::PassiveRepair, t0 + 2700 * settlesim::kMsPerSecond);
    SS_ASSERT(repair.processed == 0);
    SS_ASSERT(repair.skipped == 2);
  }

  // A settlement that fails validation on load is reported and the rest continue.
  {
    settlesim::InMemoryRepository repo(&catalog);
    repo.put(farmstead("good"));
    auto bad = farmstead("bad");
    bad.storage[Resource::Stone].amount = -10.0;
    repo.put(bad);

    settlesim::EventLog log;
    settlesim::TickOrchestrator orch(catalog, tiles, repo, log, cfg);
    const auto summary = orch.run_phase(Phase::Production, t0);
    SS_ASSERT(summary.processed == 1);
    SS_ASSERT(summary.failed == 1);
    SS_ASSERT(summary.failures[0].rfind("bad: ", 0) == 0);
  }

  // Disaster progress advances the lifecycle and finishes builds.
  {
    settlesim::InMemoryRepository repo(&catalog);
    settlesim::EventLog log;
    settlesim::TickOrchestrator orch(catalog, tiles, repo, log, cfg);

    auto s = farmstead("river-bend");
    settlesim::EventBuffer setup(s.id);
    SS_ASSERT(orch.director().start(s, settlesim::DisasterType::Earthquake, 50, "GRASSLAND", t0, setup));
    orch.construction().enqueue(s, "WELL", t0, setup, false, "tile-0002");
    SS_ASSERT(s.construction.size() == 1);
    repo.save(s);
    orch.dispatch(setup.take());
    SS_ASSERT(log.count(EventType::DisasterWarning) == 1);
    SS_ASSERT(log.count(EventType::ConstructionStarted) == 1);

    // Nothing is due yet.
    const auto quiet = orch.run_phase(Phase::DisasterProgress, t0 + 30 * settlesim::kMsPerSecond);
    SS_ASSERT(quiet.skipped == 1);

    const auto summary = orch.run_phase(Phase::DisasterProgress, t0 + 1800 * settlesim::kMsPerSecond);
    SS_ASSERT(summary.processed == 1);
    const auto after = repo.load("river-bend");
    SS_ASSERT(after.active_disaster);
    SS_ASSERT(after.active_disaster->phase == settlesim::DisasterPhase::Imminent);
    SS_ASSERT(after.construction.empty());
    SS_ASSERT(settlesim::count_structures(after, "WELL") == 1);
    SS_ASSERT(log.count(EventType::DisasterImminent) == 1);
    SS_ASSERT(log.count(EventType::ConstructionComplete) == 1);
  }

  // Disaster check on a world with certain disasters.
  {
    auto certain = catalog;
    certain.world_templates["STANDARD"].disaster_probability = 1.0;
    settlesim::InMemoryRepository repo(&certain);
    repo.put(farmstead("unlucky"));
    settlesim::EventLog log;
    settlesim::TickOrchestrator orch(certain, tiles, repo, log, cfg);

    const auto summary = orch.run_phase(Phase::DisasterCheck, t0);
    SS_ASSERT(summary.processed == 1);
    SS_ASSERT(log.count(EventType::DisasterWarning) == 1);
    const auto s = repo.load("unlucky");
    SS_ASSERT(s.active_disaster);
    SS_ASSERT(s.active_disaster->phase == settlesim::DisasterPhase::Warning);
    SS_ASSERT(s.active_disaster->biome == "GRASSLAND");

    // Already active: a second check only advances.
    const auto second = orch.run_phase(Phase::DisasterCheck, t0 + 900 * settlesim::kMsPerSecond);
    SS_ASSERT(second.failed == 0);
    SS_ASSERT(log.count(EventType::DisasterWarning) == 1);
  }

  // RNG streams are a pure function of (seed, settlement, phase, second).
  {
    settlesim::InMemoryRepository repo;
    settlesim::EventLog log;
    settlesim::TickOrchestrator orch(catalog, tiles, repo, log, cfg);
    auto a = orch.rng_for("alpha", Phase::Population, t0);
    auto b = orch.rng_for("alpha", Phase::Population, t0 + 999);
    auto c = orch.rng_for("alpha", Phase::DisasterCheck, t0);
    auto d = orch.rng_for("bravo", Phase::Population, t0);
    const auto first = a.next_u64();
    SS_ASSERT(first == b.next_u64());
    SS_ASSERT(first != c.next_u64());
    SS_ASSERT(first != d.next_u64());
  }

  // A pass that overlaps one still in flight is refused.
  {
    GatedRepository repo(&catalog);
    repo.put(farmstead("slow"));
    settlesim::EventLog log;
    settlesim::TickOrchestrator orch(catalog, tiles, repo, log, cfg);

    settlesim::TickPassResult first;
    std::thread runner([&]() { first = orch.run_pass({Phase::Production}, t0); });
    while (!repo.entered()) std::this_thread::sleep_for(std::chrono::milliseconds(1));

    SS_ASSERT(orch.in_flight());
    const auto overlapped = orch.run_pass({Phase::Production}, t0);

    repo.release();
    runner.join();

    SS_ASSERT(overlapped.skipped);
    SS_ASSERT(overlapped.phases.empty());
    SS_ASSERT(!first.skipped);
    SS_ASSERT(first.total_processed() == 1);
    SS_ASSERT(!orch.in_flight());
  }

  // Empty store.
  {
    settlesim::InMemoryRepository repo;
    settlesim::EventLog log;
    settlesim::TickOrchestrator orch(catalog, tiles, repo, log, cfg);
    const auto result = orch.run_pass({Phase::Production, Phase::DisasterCheck}, t0);
    SS_ASSERT(result.phases.size() == 2);
    SS_ASSERT(result.total_processed() == 0);
    SS_ASSERT(result.total_events() == 0);
  }

  return 0;
}
