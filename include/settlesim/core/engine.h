#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "settlesim/core/config.h"
#include "settlesim/core/events.h"
#include "settlesim/core/repository.h"
#include "settlesim/core/scheduler.h"
#include "settlesim/core/tick_orchestrator.h"

namespace settlesim {

// Cooperative stop signal for the engine loop. cancel() may be called from any
// thread (including a signal-watching thread); waiters wake immediately.
class CancellationToken {
 public:
  void cancel();
  bool cancelled() const { return cancelled_.load(); }

  // Sleeps up to `timeout`. Returns true if the token was cancelled.
  bool wait_for(std::chrono::milliseconds timeout) const;

 private:
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
};

// Acknowledgment returned by the single-shot trigger.
struct TriggerAck {
  bool ok{false};
  std::string message;
  TickPassResult result;
};

// Owns the wall-clock scheduler and the orchestrator, and runs the tick loop.
class Engine {
 public:
  using Clock = std::function<Millis()>;

  // Throws ConfigurationError when the configuration (schedule included) is invalid.
  // `sink` may be null; events are always kept in recent_events().
  Engine(EngineConfig cfg, const StructureCatalog& catalog, const TerrainProvider& terrain,
         SettlementRepository& repo, std::shared_ptr<EventSink> sink = nullptr, Clock clock = Clock());

  const EngineConfig& config() const { return cfg_; }
  WallClockScheduler& scheduler() { return scheduler_; }
  TickOrchestrator& orchestrator() { return *orchestrator_; }
  const EventLog& recent_events() const { return *recent_; }

  // Scheduling loop: polls the clock, runs every due phase and sleeps until the next
  // due second (or poll_interval_ms). Returns once `token` is cancelled; a pass that
  // is already running finishes first. Due seconds that pass while a pass is running
  // are not replayed; each overrun is logged as a warning.
  void run(const CancellationToken& token);

  // Due seconds the loop skipped because a pass was still running.
  std::int64_t skipped_seconds() const { return skipped_seconds_.load(); }

  // Runs the phases due at `now` once. Phases already fired in this second are not
  // repeated. ok is false when the pass was skipped because another is in flight.
  TriggerAck trigger_once(Millis now);

  // Runs one phase at `now` regardless of the schedule (operator tooling).
  TriggerAck run_phase(Phase phase, Millis now);

  // Queues a build for a settlement and saves it. Events are dispatched after the save.
  TriggerAck enqueue_construction(const std::string& settlement_id, const std::string& structure_type, Millis now,
                                  bool emergency = false, const std::string& tile_id = std::string());

  // Loads and validates every stored settlement. Returns the number that failed.
  int validate_all();

 private:
  TriggerAck acknowledge(TickPassResult result) const;
  int report_overrun(Millis started, Millis finished);

  EngineConfig cfg_;
  SettlementRepository& repo_;
  Clock clock_;

  std::shared_ptr<EventLog> recent_;
  FanoutEventSink fanout_;

  WallClockScheduler scheduler_;
  std::unique_ptr<TickOrchestrator> orchestrator_;
  std::atomic<std::int64_t> skipped_seconds_{0};
};

} // namespace settlesim
