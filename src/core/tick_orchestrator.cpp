#include "settlesim/core/tick_orchestrator.h"

#include <algorithm>
#include <chrono>
#include <thread>

#include "settlesim/core/consumption.h"
#include "settlesim/core/errors.h"
#include "settlesim/core/passive_repair.h"
#include "settlesim/core/production.h"
#include "settlesim/core/storage_ledger.h"
#include "settlesim/util/log.h"
#include "settlesim/util/strings.h"
#include "settlesim/util/time.h"

namespace settlesim {
namespace {

int worker_count(const EngineConfig& cfg) {
  int n = cfg.worker_threads;
  if (n <= 0) n = static_cast<int>(std::thread::hardware_concurrency());
  if (n <= 0) n = 1;
  return std::min(n, std::max(1, cfg.max_worker_threads));
}

json::Value delta_to_json(const ResourceDelta& d) {
  json::Object o;
  for (Resource r : kAllResources) o[resource_to_string(r)] = d[r];
  return o;
}

json::Value storage_to_json(const Storage& st) {
  json::Object o;
  for (Resource r : kAllResources) {
    json::Object slot;
    slot["amount"] = st[r].amount;
    slot["capacity"] = st[r].capacity;
    o[resource_to_string(r)] = slot;
  }
  return o;
}

// Clears the in-flight flag when a pass ends, including by exception.
class InFlightGuard {
 public:
  explicit InFlightGuard(std::atomic<bool>& flag) : flag_(flag) {}
  ~InFlightGuard() { flag_.store(false); }

 private:
  std::atomic<bool>& flag_;
};

} // namespace

int TickPassResult::total_processed() const {
  int n = 0;
  for (const auto& p : phases) n += p.processed;
  return n;
}

int TickPassResult::total_failed() const {
  int n = 0;
  for (const auto& p : phases) n += p.failed;
  return n;
}

std::size_t TickPassResult::total_events() const {
  std::size_t n = 0;
  for (const auto& p : phases) n += p.events;
  return n;
}

std::string describe_summary(const TickSummary& s) {
  return std::string("Tick ") + phase_to_string(s.phase) + " @ " + format_iso8601(s.at) + ": processed " +
         std::to_string(s.processed) + ", failed " + std::to_string(s.failed) + ", skipped " +
         std::to_string(s.skipped) + ", waste " + format_fixed(s.total_waste, 2) + ", events " +
         std::to_string(s.events) + " (" + std::to_string(s.elapsed_ms) + " ms)";
}

TickOrchestrator::TickOrchestrator(const StructureCatalog& catalog, const TerrainProvider& terrain,
                                   SettlementRepository& repo, EventSink& sink, const EngineConfig& cfg)
    : catalog_(catalog),
      terrain_(terrain),
      repo_(repo),
      sink_(sink),
      cfg_(cfg),
      population_(catalog),
      construction_(catalog, cfg.construction),
      director_(catalog, cfg.disaster),
      pool_(worker_count(cfg)) {}

util::HashRng TickOrchestrator::rng_for(const std::string& settlement_id, Phase phase, Millis now) const {
  const std::uint64_t key = util::fnv1a64(settlement_id) ^ (static_cast<std::uint64_t>(phase) + 1) * 0x9e3779b97f4a7c15ULL;
  return util::HashRng(util::mix_seed(cfg_.rng_seed, key, static_cast<std::uint64_t>(epoch_seconds(now))));
}

double TickOrchestrator::production_hours() const {
  for (const auto& spec : cfg_.phases) {
    if (spec.phase == Phase::Production && spec.period_s > 0) {
      return static_cast<double>(spec.period_s) / 3600.0;
    }
  }
  return 1.0;
}

TickPassResult TickOrchestrator::run_pass(const std::vector<Phase>& phases, Millis now) {
  TickPassResult result;
  result.at = now;

  bool expected = false;
  if (!in_flight_.compare_exchange_strong(expected, true)) {
    log::warn("Tick pass @ " + format_iso8601(now) + " skipped: previous pass still in flight");
    result.skipped = true;
    return result;
  }
  InFlightGuard guard(in_flight_);

  for (Phase p : phases) result.phases.push_back(run_phase(p, now));
  return result;
}

TickSummary TickOrchestrator::run_phase(Phase phase, Millis now) {
  const auto t0 = std::chrono::steady_clock::now();
  TickSummary summary;
  summary.phase = phase;
  summary.at = now;

  std::vector<std::string> ids;
  try {
    ids = repo_.list_ids();
  } catch (const std::exception& e) {
    log::error(std::string("Tick ") + phase_to_string(phase) + ": cannot list settlements: " + e.what());
    summary.failures.push_back(std::string("*: ") + e.what());
    summary.failed = 1;
    return summary;
  }

  std::vector<Outcome> outcomes(ids.size());
  pool_.parallel_for(ids.size(), [&](std::size_t i) { outcomes[i] = process_settlement(phase, ids[i], now); });

  for (std::size_t i = 0; i < ids.size(); ++i) {
    const Outcome& o = outcomes[i];
    switch (o.kind) {
      case Outcome::Kind::Processed: ++summary.processed; break;
      case Outcome::Kind::Skipped: ++summary.skipped; break;
      case Outcome::Kind::Failed:
        ++summary.failed;
        summary.failures.push_back(ids[i] + ": " + o.error);
        break;
    }
    summary.total_waste += o.waste;
    summary.events += o.events;
  }

  summary.elapsed_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
  if (summary.failed > 0) {
    log::warn(describe_summary(summary));
  } else {
    log::info(describe_summary(summary));
  }
  return summary;
}

TickOrchestrator::Outcome TickOrchestrator::process_settlement(Phase phase, const std::string& id, Millis now) {
  Outcome out;
  const std::string where = std::string("Tick ") + phase_to_string(phase) + " [" + id + "]";
  try {
    Settlement s = repo_.load(id);
    EventBuffer events(id);
    util::HashRng rng = rng_for(id, phase, now);

    double waste = 0.0;
    const bool changed = handle(phase, s, now, rng, events, &waste);
    if (!changed && events.empty()) {
      out.kind = Outcome::Kind::Skipped;
      return out;
    }

    repo_.save(s);

    out.kind = Outcome::Kind::Processed;
    out.waste = waste;
    out.events = events.size();
    dispatch(events.take());
  } catch (const ValidationError& e) {
    std::string detail;
    for (const auto& p : e.problems()) detail += "\n  - " + p;
    log::error(where + ": validation failed, settlement skipped" + detail);
    out = Outcome{};
    out.kind = Outcome::Kind::Failed;
    out.error = e.what();
  } catch (const std::exception& e) {
    log::error(where + ": " + e.what());
    out = Outcome{};
    out.kind = Outcome::Kind::Failed;
    out.error = e.what();
  }
  return out;
}

void TickOrchestrator::dispatch(std::vector<SimEvent> events) {
  for (auto& e : events) {
    e.seq = next_seq_.fetch_add(1);
    try {
      sink_.publish(e);
    } catch (const std::exception& ex) {
      log::warn(std::string("Event ") + event_type_to_string(e.type) + " [" + e.settlement_id +
                "] was not delivered: " + ex.what());
    }
  }
}

bool TickOrchestrator::handle(Phase phase, Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events,
                              double* waste) {
  switch (phase) {
    case Phase::Production: return handle_production(s, now, events, waste);
    case Phase::Population: return handle_population(s, now, rng, events);
    case Phase::PassiveRepair: return handle_passive_repair(s, now, events);
    case Phase::DisasterCheck: return handle_disaster_check(s, now, rng, events);
    case Phase::DisasterProgress: return handle_disaster_progress(s, now, rng, events);
  }
  return false;
}

bool TickOrchestrator::handle_production(Settlement& s, Millis now, EventBuffer& events, double* waste) {
  // Capacity follows the current structures (storage built, damaged or destroyed).
  const ResourceTable<double> shrink = set_capacity(s.storage, compute_storage_capacity(s, catalog_));

  const double hours = production_hours();
  const ProductionReport production = compute_production(s, catalog_, terrain_);
  const ResourceDelta consumption = compute_consumption(s, catalog_);
  const ResourceDelta net_per_hour = production.amounts - consumption;

  const LedgerResult ledger = apply_delta(s.storage, net_per_hour * hours);
  s.storage = ledger.storage;

  ResourceTable<double> wasted = ledger.waste;
  for (Resource r : kAllResources) wasted[r] += shrink[r];
  double total = 0.0;
  for (double w : wasted.values) total += w;
  *waste = total;

  json::Object f;
  f["hours"] = hours;
  f["production"] = delta_to_json(production.amounts * hours);
  f["consumption"] = delta_to_json(consumption * hours);
  f["net"] = delta_to_json(net_per_hour * hours);
  f["storage"] = storage_to_json(s.storage);
  f["extractors"] = static_cast<double>(production.extractors);
  if (!production.issues.empty()) {
    json::Array issues;
    for (const auto& i : production.issues) issues.push_back(i);
    f["issues"] = issues;
  }
  events.emit(EventType::ResourceTick, now, "Resources updated: " + describe_delta(net_per_hour * hours), std::move(f));

  if (total > 0.0) {
    ResourceDelta wd;
    wd.values = wasted.values;
    json::Object wf;
    wf["waste"] = delta_to_json(wd);
    wf["total"] = total;
    events.emit(EventType::ResourceWaste, now, format_fixed(total, 1) + " resources wasted: storage full",
                std::move(wf), EventLevel::Warn);
  }

  for (const auto& w : storage_warnings(s.storage, cfg_.storage_warning_threshold)) {
    json::Object wf;
    wf["resource"] = std::string(resource_to_string(w.resource));
    wf["amount"] = w.amount;
    wf["capacity"] = w.capacity;
    wf["fill"] = w.fill;
    events.emit(EventType::StorageWarning, now,
                std::string(resource_to_string(w.resource)) + " storage " + format_fixed(w.fill * 100.0, 0) + "% full",
                std::move(wf), EventLevel::Warn);
  }

  for (const auto& w : shortage_warnings(s.storage, net_per_hour, cfg_.shortage_buffer_hours)) {
    json::Object wf;
    wf["resource"] = std::string(resource_to_string(w.resource));
    wf["amount"] = w.amount;
    wf["netPerHour"] = w.net_per_hour;
    wf["hoursRemaining"] = w.hours_remaining;
    events.emit(EventType::ResourceShortage, now,
                std::string(resource_to_string(w.resource)) + " runs out in " + format_fixed(w.hours_remaining, 1) +
                    "h",
                std::move(wf), EventLevel::Warn);
  }

  construction_.process(s, now, events);
  return true;
}

bool TickOrchestrator::handle_population(Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events) {
  if (!s.population) {
    log::warn("Tick population [" + s.id + "]: no population record, skipping");
    return false;
  }
  population_.tick(s, now, rng, events);
  return true;
}

bool TickOrchestrator::handle_passive_repair(Settlement& s, Millis now, EventBuffer& events) {
  return apply_passive_repair(s, now, events, cfg_.repair).repaired > 0;
}

bool TickOrchestrator::handle_disaster_check(Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events) {
  bool changed = director_.advance(s, now, rng, events);
  if (!s.active_disaster) {
    const Tile* tile = terrain_.find_tile(s.location.tile_id);
    if (director_.roll(s, tile, now, rng, events)) changed = true;
  }
  return changed;
}

bool TickOrchestrator::handle_disaster_progress(Settlement& s, Millis now, util::HashRng& rng, EventBuffer& events) {
  bool changed = director_.advance(s, now, rng, events);
  if (!s.construction.empty()) {
    const std::size_t before = events.size();
    construction_.process(s, now, events);
    if (events.size() != before) changed = true;
  }
  return changed;
}

} // namespace settlesim
