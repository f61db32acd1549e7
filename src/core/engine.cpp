#include "settlesim/core/engine.h"

#include <algorithm>
#include <map>

#include "settlesim/core/errors.h"
#include "settlesim/util/log.h"
#include "settlesim/util/time.h"

namespace settlesim {

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    cancelled_.store(true);
  }
  cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lk(mu_);
  return cv_.wait_for(lk, timeout, [&]() { return cancelled_.load(); });
}

Engine::Engine(EngineConfig cfg, const StructureCatalog& catalog, const TerrainProvider& terrain,
               SettlementRepository& repo, std::shared_ptr<EventSink> sink, Clock clock)
    : cfg_(std::move(cfg)), repo_(repo), clock_(std::move(clock)) {
  const auto errors = validate_engine_config(cfg_);
  if (!errors.empty()) {
    for (const auto& e : errors) log::error("Engine config: " + e);
    throw ConfigurationError("Engine config is invalid: " + errors.front());
  }
  if (!clock_) clock_ = []() { return static_cast<Millis>(now_epoch_ms()); };

  recent_ = std::make_shared<EventLog>(static_cast<std::size_t>(cfg_.max_events));
  fanout_.add(recent_);
  fanout_.add(std::move(sink));

  scheduler_ = WallClockScheduler(cfg_.phases);
  orchestrator_ = std::make_unique<TickOrchestrator>(catalog, terrain, repo_, fanout_, cfg_);
}

TriggerAck Engine::acknowledge(TickPassResult result) const {
  TriggerAck ack;
  if (result.skipped) {
    ack.ok = false;
    ack.message = "skipped: previous pass still in flight";
  } else if (result.phases.empty()) {
    ack.ok = true;
    ack.message = "no phases due at " + format_iso8601(result.at);
  } else {
    ack.ok = true;
    std::string names;
    for (const auto& p : result.phases) {
      if (!names.empty()) names += ",";
      names += phase_to_string(p.phase);
    }
    ack.message = "ran " + names + " @ " + format_iso8601(result.at) + ": processed " +
                  std::to_string(result.total_processed()) + ", failed " + std::to_string(result.total_failed()) +
                  ", events " + std::to_string(result.total_events());
  }
  ack.result = std::move(result);
  return ack;
}

int Engine::report_overrun(Millis started, Millis finished) {
  const Millis last_missed = (epoch_seconds(finished) - 1) * kMsPerSecond;
  std::map<Phase, int> missed;
  Millis first = -1;
  int seconds = 0;
  for (Millis t = scheduler_.next_due(started); t >= 0 && t <= last_missed; t = scheduler_.next_due(t)) {
    if (first < 0) first = t;
    ++seconds;
    for (Phase p : scheduler_.peek_due(t)) ++missed[p];
  }
  if (seconds == 0) return 0;

  std::string phases;
  for (const auto& [phase, n] : missed) {
    if (!phases.empty()) phases += ", ";
    phases += std::string(phase_to_string(phase)) + " x" + std::to_string(n);
  }
  log::warn("Tick pass at " + format_iso8601(started) + " overran by " +
            format_duration_s((finished - started) / kMsPerSecond) + "; skipped " + std::to_string(seconds) +
            " due second(s) from " + format_iso8601(first) + ": " + phases);
  return seconds;
}

void Engine::run(const CancellationToken& token) {
  log::info("Engine loop started (" + std::to_string(scheduler_.phases().size()) + " phases)");
  while (!token.cancelled()) {
    const Millis now = clock_();
    const auto due = scheduler_.due_phases(now);
    if (!due.empty()) {
      orchestrator_->run_pass(due, now);
      skipped_seconds_ += report_overrun(now, clock_());
      continue;
    }

    Millis wait_ms = cfg_.poll_interval_ms;
    const Millis next = scheduler_.next_due(now);
    if (next >= 0) wait_ms = std::clamp<Millis>(next - clock_(), 1, cfg_.poll_interval_ms);
    token.wait_for(std::chrono::milliseconds(wait_ms));
  }
  log::info("Engine loop stopped");
}

TriggerAck Engine::trigger_once(Millis now) {
  const auto due = scheduler_.due_phases(now);
  if (due.empty()) {
    TickPassResult empty;
    empty.at = now;
    return acknowledge(std::move(empty));
  }
  return acknowledge(orchestrator_->run_pass(due, now));
}

TriggerAck Engine::run_phase(Phase phase, Millis now) {
  return acknowledge(orchestrator_->run_pass({phase}, now));
}

TriggerAck Engine::enqueue_construction(const std::string& settlement_id, const std::string& structure_type,
                                        Millis now, bool emergency, const std::string& tile_id) {
  TriggerAck ack;
  try {
    Settlement s = repo_.load(settlement_id);
    EventBuffer events(settlement_id);
    const ConstructionEntry& e =
        orchestrator_->construction().enqueue(s, structure_type, now, events, emergency, tile_id);
    const std::string entry_id = e.id;
    const int position = e.position;
    repo_.save(s);
    orchestrator_->dispatch(events.take());
    ack.ok = true;
    ack.message = "queued " + structure_type + " as " + entry_id + " (position " + std::to_string(position) + ")";
  } catch (const std::exception& e) {
    log::error("Enqueue [" + settlement_id + "]: " + e.what());
    ack.ok = false;
    ack.message = e.what();
  }
  return ack;
}

int Engine::validate_all() {
  int failed = 0;
  for (const auto& id : repo_.list_ids()) {
    try {
      repo_.load(id);
    } catch (const ValidationError& e) {
      ++failed;
      for (const auto& p : e.problems()) log::error("Validate [" + id + "]: " + p);
    } catch (const std::exception& e) {
      ++failed;
      log::error("Validate [" + id + "]: " + e.what());
    }
  }
  return failed;
}

} // namespace settlesim
