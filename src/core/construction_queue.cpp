#include "settlesim/core/construction_queue.h"

#include <algorithm>
#include <cmath>

#include "settlesim/core/enum_strings.h"
#include "settlesim/util/log.h"
#include "settlesim/util/time.h"

namespace settlesim {
namespace {

void compact_positions(Settlement& s) {
  int pos = 1;
  for (auto& e : s.construction) e.position = pos++;
}

json::Object entry_fields(const ConstructionEntry& e) {
  json::Object f;
  f["entryId"] = e.id;
  f["structureType"] = e.structure_type;
  f["position"] = static_cast<double>(e.position);
  f["status"] = std::string(construction_status_to_string(e.status));
  f["emergency"] = e.emergency;
  if (!e.tile_id.empty()) f["tileId"] = e.tile_id;
  return f;
}

} // namespace

double construction_progress(const ConstructionEntry& e, Millis now) {
  if (e.status != ConstructionStatus::Active) return 0.0;
  const Millis span = e.completes_at - e.started_at;
  if (span <= 0) return 100.0;
  const double pct = static_cast<double>(now - e.started_at) / static_cast<double>(span) * 100.0;
  return std::clamp(pct, 0.0, 100.0);
}

int active_construction_count(const Settlement& s) {
  int n = 0;
  for (const auto& e : s.construction) {
    if (e.status == ConstructionStatus::Active) ++n;
  }
  return n;
}

ConstructionQueue::ConstructionQueue(const StructureCatalog& catalog, ConstructionSettings settings)
    : catalog_(catalog), settings_(settings) {
  if (settings_.max_active_slots < 1) settings_.max_active_slots = 1;
  if (settings_.emergency_time_factor <= 0.0) settings_.emergency_time_factor = 1.0;
  if (settings_.progress_step_percent < 1) settings_.progress_step_percent = 25;
}

std::int64_t ConstructionQueue::build_duration_ms(const std::string& type, bool emergency) const {
  const std::int64_t base = std::max<std::int64_t>(0, catalog_.build_time_ms(type));
  if (!emergency) return base;
  return static_cast<std::int64_t>(std::llround(static_cast<double>(base) * settings_.emergency_time_factor));
}

const ConstructionEntry& ConstructionQueue::enqueue(Settlement& s, const std::string& structure_type, Millis now,
                                                    EventBuffer& events, bool emergency,
                                                    const std::string& tile_id) const {
  if (!catalog_.find_structure(structure_type)) {
    log::warn("Construction [" + s.id + "]: unknown structure type '" + structure_type +
              "', using default build time");
  }

  ConstructionEntry e;
  e.id = allocate_local_id(s, "build");
  e.settlement_id = s.id;
  e.structure_type = structure_type;
  e.tile_id = tile_id;
  e.emergency = emergency;
  e.queued_at = now;
  e.duration_ms = build_duration_ms(structure_type, emergency);
  e.status = ConstructionStatus::Queued;
  s.construction.push_back(std::move(e));
  compact_positions(s);

  ConstructionEntry& added = s.construction.back();
  if (active_construction_count(s) < settings_.max_active_slots) {
    start_entry(added, now, events);
  }
  emit_queue_updated(s, now, events);
  return s.construction.back();
}

void ConstructionQueue::start_entry(ConstructionEntry& e, Millis at, EventBuffer& events) const {
  e.status = ConstructionStatus::Active;
  e.started_at = at;
  e.completes_at = at + e.duration_ms;
  e.reported_progress = 0;

  json::Object f = entry_fields(e);
  f["startedAt"] = format_iso8601(e.started_at);
  f["completesAt"] = format_iso8601(e.completes_at);
  f["durationS"] = static_cast<double>(e.duration_ms / kMsPerSecond);
  events.emit(EventType::ConstructionStarted, at,
              e.structure_type + " construction started (" + format_duration_s(e.duration_ms / kMsPerSecond) + ")",
              std::move(f));
}

bool ConstructionQueue::promote_queued(Settlement& s, Millis at, EventBuffer& events) const {
  bool promoted = false;
  for (auto& e : s.construction) {
    if (active_construction_count(s) >= settings_.max_active_slots) break;
    if (e.status != ConstructionStatus::Queued) continue;
    start_entry(e, at, events);
    promoted = true;
  }
  return promoted;
}

void ConstructionQueue::emit_queue_updated(const Settlement& s, Millis at, EventBuffer& events) const {
  json::Array entries;
  for (const auto& e : s.construction) {
    json::Object o = entry_fields(e);
    o["progress"] = construction_progress(e, at);
    entries.push_back(std::move(o));
  }
  json::Object f;
  f["entries"] = std::move(entries);
  f["active"] = static_cast<double>(active_construction_count(s));
  f["slots"] = static_cast<double>(settings_.max_active_slots);
  events.emit(EventType::QueueUpdated, at, std::to_string(s.construction.size()) + " builds queued", std::move(f));
}

int ConstructionQueue::process(Settlement& s, Millis now, EventBuffer& events) const {
  int completed = 0;
  bool changed = false;

  // Fill slots left empty by an earlier configuration or a cancelled build.
  if (promote_queued(s, now, events)) changed = true;

  for (;;) {
    // Earliest finished active entry first, so promotions chain in time order.
    auto done = s.construction.end();
    for (auto it = s.construction.begin(); it != s.construction.end(); ++it) {
      if (it->status != ConstructionStatus::Active) continue;
      if (construction_progress(*it, now) < 100.0) continue;
      if (done == s.construction.end() || it->completes_at < done->completes_at) done = it;
    }
    if (done == s.construction.end()) break;

    const ConstructionEntry e = *done;
    s.construction.erase(done);
    compact_positions(s);

    StructureInstance st;
    st.id = allocate_local_id(s, "structure");
    st.type = e.structure_type;
    st.level = 1;
    st.health = 100.0;
    st.tile_id = e.tile_id;
    st.built_at = e.completes_at;
    s.structures.push_back(st);

    json::Object f = entry_fields(e);
    f["structureId"] = st.id;
    f["completedAt"] = format_iso8601(e.completes_at);
    events.emit(EventType::ConstructionComplete, e.completes_at, e.structure_type + " construction complete",
                std::move(f));
    log::debug("Construction [" + s.id + "]: " + e.structure_type + " complete as " + st.id);

    ++completed;
    changed = true;
    promote_queued(s, e.completes_at, events);
  }

  const int step = settings_.progress_step_percent;
  for (auto& e : s.construction) {
    if (e.status != ConstructionStatus::Active) continue;
    const int pct = static_cast<int>(std::floor(construction_progress(e, now)));
    const int reached = pct / step * step;
    if (reached <= e.reported_progress) continue;
    e.reported_progress = reached;
    json::Object f = entry_fields(e);
    f["progress"] = static_cast<double>(reached);
    f["completesAt"] = format_iso8601(e.completes_at);
    events.emit(EventType::ConstructionProgress, now,
                e.structure_type + " construction " + std::to_string(reached) + "%", std::move(f));
    changed = true;
  }

  if (changed) emit_queue_updated(s, now, events);
  return completed;
}

bool ConstructionQueue::cancel(Settlement& s, const std::string& entry_id, Millis now, EventBuffer& events) const {
  auto it = std::find_if(s.construction.begin(), s.construction.end(),
                         [&](const ConstructionEntry& e) { return e.id == entry_id; });
  if (it == s.construction.end()) return false;

  log::info("Construction [" + s.id + "]: cancelled " + it->structure_type + " (" + it->id + ")");
  s.construction.erase(it);
  compact_positions(s);
  promote_queued(s, now, events);
  emit_queue_updated(s, now, events);
  return true;
}

} // namespace settlesim
