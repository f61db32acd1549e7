#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "settlesim/core/entities.h"
#include "settlesim/util/json.h"

namespace settlesim {

enum class EventLevel { Info, Warn, Error };

enum class EventType {
  ResourceTick,
  ResourceWaste,
  StorageWarning,
  ResourceShortage,
  PopulationGrowth,
  SettlerArrived,
  PopulationEmigration,
  PopulationWarning,
  PopulationState,
  DisasterWarning,
  DisasterImminent,
  DisasterImpactStart,
  DisasterDamageUpdate,
  DisasterImpactEnd,
  DisasterAftermath,
  DisasterResolved,
  StructureDamaged,
  StructureDestroyed,
  StructureRepaired,
  ConstructionStarted,
  ConstructionProgress,
  ConstructionComplete,
  QueueUpdated,
};

// Wire names, e.g. "resource-tick", "settler-arrived", "disaster-damage-update".
const char* event_type_to_string(EventType t);
std::optional<EventType> event_type_from_string(const std::string& s);

const char* event_level_to_string(EventLevel l);

// Outbound notification. Keyed by settlement id; `fields` carries the type-specific payload.
struct SimEvent {
  // Assigned when the event is dispatched (monotonic per engine).
  std::uint64_t seq{0};

  EventType type{EventType::ResourceTick};
  EventLevel level{EventLevel::Info};

  std::string settlement_id;
  Millis timestamp{0};

  std::string message;
  json::Object fields;
};

json::Value event_to_json(const SimEvent& e);

// One compact JSON object per line, trailing newline included.
std::string events_to_jsonl(const std::vector<SimEvent>& events);

// {"count": N, "types": {"resource-tick": n, ...}, "levels": {...}}
std::string events_summary_to_json(const std::vector<SimEvent>& events);

// Events raised while processing one settlement. Handlers append here; the orchestrator
// dispatches the buffer only after the settlement has been saved.
class EventBuffer {
 public:
  EventBuffer() = default;
  explicit EventBuffer(std::string settlement_id) : settlement_id_(std::move(settlement_id)) {}

  SimEvent& emit(EventType type, Millis at, std::string message, json::Object fields = {},
                 EventLevel level = EventLevel::Info);

  const std::vector<SimEvent>& events() const { return events_; }
  std::vector<SimEvent> take() { return std::move(events_); }
  std::size_t size() const { return events_.size(); }
  bool empty() const { return events_.empty(); }
  void clear() { events_.clear(); }

  std::size_t count(EventType type) const;

 private:
  std::string settlement_id_;
  std::vector<SimEvent> events_;
};

// Receives dispatched events. publish() may be called from several worker threads.
// Failures are reported by throwing; the dispatcher logs them and moves on.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void publish(const SimEvent& e) = 0;
};

// Bounded in-memory log of recent events.
class EventLog : public EventSink {
 public:
  // 0 = unlimited.
  explicit EventLog(std::size_t max_events = 1000) : max_events_(max_events) {}

  void publish(const SimEvent& e) override;

  std::vector<SimEvent> snapshot() const;
  std::size_t size() const;
  std::size_t count(EventType type) const;
  void clear();

 private:
  mutable std::mutex mu_;
  std::deque<SimEvent> events_;
  std::size_t max_events_{1000};
};

// Streams events as JSON lines to an ostream (stdout for the CLI).
class JsonLinesEventSink : public EventSink {
 public:
  explicit JsonLinesEventSink(std::ostream& out) : out_(out) {}
  void publish(const SimEvent& e) override;

 private:
  std::mutex mu_;
  std::ostream& out_;
};

// Appends events as JSON lines to a file.
class FileEventSink : public EventSink {
 public:
  explicit FileEventSink(std::string path) : path_(std::move(path)) {}
  void publish(const SimEvent& e) override;

 private:
  std::mutex mu_;
  std::string path_;
};

// Forwards to several sinks; a failing sink does not prevent delivery to the others.
class FanoutEventSink : public EventSink {
 public:
  void add(std::shared_ptr<EventSink> sink);
  void publish(const SimEvent& e) override;

 private:
  std::vector<std::shared_ptr<EventSink>> sinks_;
};

} // namespace settlesim
