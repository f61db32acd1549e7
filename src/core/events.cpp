#include "settlesim/core/events.h"

#include <array>
#include <stdexcept>

#include "settlesim/util/file_io.h"
#include "settlesim/util/log.h"
#include "settlesim/util/time.h"

namespace settlesim {

namespace {

constexpr std::array<EventType, 23> kAllEventTypes = {
    EventType::ResourceTick,        EventType::ResourceWaste,         EventType::StorageWarning,
    EventType::ResourceShortage,    EventType::PopulationGrowth,      EventType::SettlerArrived,
    EventType::PopulationEmigration, EventType::PopulationWarning,    EventType::PopulationState,
    EventType::DisasterWarning,     EventType::DisasterImminent,      EventType::DisasterImpactStart,
    EventType::DisasterDamageUpdate, EventType::DisasterImpactEnd,    EventType::DisasterAftermath,
    EventType::DisasterResolved,    EventType::StructureDamaged,      EventType::StructureDestroyed,
    EventType::StructureRepaired,   EventType::ConstructionStarted,   EventType::ConstructionProgress,
    EventType::ConstructionComplete, EventType::QueueUpdated,
};

} // namespace

const char* event_type_to_string(EventType t) {
  switch (t) {
    case EventType::ResourceTick: return "resource-tick";
    case EventType::ResourceWaste: return "resource-waste";
    case EventType::StorageWarning: return "storage-warning";
    case EventType::ResourceShortage: return "resource-shortage";
    case EventType::PopulationGrowth: return "population-growth";
    case EventType::SettlerArrived: return "settler-arrived";
    case EventType::PopulationEmigration: return "population-emigration";
    case EventType::PopulationWarning: return "population-warning";
    case EventType::PopulationState: return "population-state";
    case EventType::DisasterWarning: return "disaster-warning";
    case EventType::DisasterImminent: return "disaster-imminent";
    case EventType::DisasterImpactStart: return "disaster-impact-start";
    case EventType::DisasterDamageUpdate: return "disaster-damage-update";
    case EventType::DisasterImpactEnd: return "disaster-impact-end";
    case EventType::DisasterAftermath: return "disaster-aftermath";
    case EventType::DisasterResolved: return "disaster-resolved";
    case EventType::StructureDamaged: return "structure-damaged";
    case EventType::StructureDestroyed: return "structure-destroyed";
    case EventType::StructureRepaired: return "structure-repaired";
    case EventType::ConstructionStarted: return "construction-started";
    case EventType::ConstructionProgress: return "construction-progress";
    case EventType::ConstructionComplete: return "construction-complete";
    case EventType::QueueUpdated: return "queue-updated";
  }
  return "resource-tick";
}

std::optional<EventType> event_type_from_string(const std::string& s) {
  for (EventType t : kAllEventTypes) {
    if (s == event_type_to_string(t)) return t;
  }
  return std::nullopt;
}

const char* event_level_to_string(EventLevel l) {
  switch (l) {
    case EventLevel::Info: return "info";
    case EventLevel::Warn: return "warn";
    case EventLevel::Error: return "error";
  }
  return "info";
}

json::Value event_to_json(const SimEvent& e) {
  json::Object o;
  o["seq"] = static_cast<double>(e.seq);
  o["type"] = std::string(event_type_to_string(e.type));
  o["level"] = std::string(event_level_to_string(e.level));
  o["settlementId"] = e.settlement_id;
  o["timestamp"] = format_iso8601(e.timestamp);
  o["message"] = e.message;
  o["data"] = e.fields;
  return o;
}

std::string events_to_jsonl(const std::vector<SimEvent>& events) {
  std::string out;
  for (const auto& e : events) {
    out += json::stringify(event_to_json(e), 0);
    out += '\n';
  }
  return out;
}

std::string events_summary_to_json(const std::vector<SimEvent>& events) {
  json::Object types;
  json::Object levels;
  for (const auto& e : events) {
    auto& t = types[event_type_to_string(e.type)];
    t = t.number_value(0.0) + 1.0;
    auto& l = levels[event_level_to_string(e.level)];
    l = l.number_value(0.0) + 1.0;
  }
  json::Object root;
  root["count"] = static_cast<double>(events.size());
  root["types"] = types;
  root["levels"] = levels;
  return json::stringify(root, 2) + "\n";
}

SimEvent& EventBuffer::emit(EventType type, Millis at, std::string message, json::Object fields, EventLevel level) {
  SimEvent e;
  e.type = type;
  e.level = level;
  e.settlement_id = settlement_id_;
  e.timestamp = at;
  e.message = std::move(message);
  e.fields = std::move(fields);
  events_.push_back(std::move(e));
  return events_.back();
}

std::size_t EventBuffer::count(EventType type) const {
  std::size_t n = 0;
  for (const auto& e : events_) {
    if (e.type == type) ++n;
  }
  return n;
}

void EventLog::publish(const SimEvent& e) {
  std::lock_guard<std::mutex> lk(mu_);
  events_.push_back(e);
  if (max_events_ > 0) {
    while (events_.size() > max_events_) events_.pop_front();
  }
}

std::vector<SimEvent> EventLog::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return std::vector<SimEvent>(events_.begin(), events_.end());
}

std::size_t EventLog::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return events_.size();
}

std::size_t EventLog::count(EventType type) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (const auto& e : events_) {
    if (e.type == type) ++n;
  }
  return n;
}

void EventLog::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  events_.clear();
}

void JsonLinesEventSink::publish(const SimEvent& e) {
  const std::string line = json::stringify(event_to_json(e), 0);
  std::lock_guard<std::mutex> lk(mu_);
  out_ << line << '\n';
  out_.flush();
  if (!out_) throw std::runtime_error("event stream write failed");
}

void FileEventSink::publish(const SimEvent& e) {
  const std::string line = json::stringify(event_to_json(e), 0) + "\n";
  std::lock_guard<std::mutex> lk(mu_);
  append_text_file(path_, line);
}

void FanoutEventSink::add(std::shared_ptr<EventSink> sink) {
  if (sink) sinks_.push_back(std::move(sink));
}

void FanoutEventSink::publish(const SimEvent& e) {
  for (const auto& sink : sinks_) {
    try {
      sink->publish(e);
    } catch (const std::exception& ex) {
      log::warn(std::string("Event sink failed for ") + event_type_to_string(e.type) + " [" + e.settlement_id +
                "]: " + ex.what());
    }
  }
}

} // namespace settlesim
