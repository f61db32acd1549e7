#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "settlesim/core/resources.h"

namespace settlesim {

// Wall-clock timestamps are epoch milliseconds (UTC).
using Millis = std::int64_t;

// --- disasters ---

enum class DisasterType {
  Earthquake,
  Flood,
  Drought,
  Wildfire,
  Hurricane,
  Tornado,
  Blizzard,
  Heatwave,
  Sandstorm,
  Volcano,
  Landslide,
  Avalanche,
  LocustSwarm,
  InsectPlague,
  Blight,
};

// Lifecycle of a single disaster. A settlement with no active disaster is Idle.
//
// Phases only ever advance in declaration order; the director never skips one.
enum class DisasterPhase { Idle, Warning, Imminent, Impact, Aftermath, Resolved };

enum class SeverityLevel { Mild, Moderate, Major, Catastrophic };

struct PhaseTransition {
  DisasterPhase phase{DisasterPhase::Warning};
  Millis at{0};
};

struct DisasterEvent {
  std::string id;
  DisasterType type{DisasterType::Earthquake};

  // 0..100
  int severity{0};
  SeverityLevel severity_level{SeverityLevel::Mild};

  std::string biome;
  std::string region_id;

  DisasterPhase phase{DisasterPhase::Warning};

  // Scheduled boundaries, fixed when the warning is issued.
  Millis warning_at{0};
  Millis imminent_at{0};
  Millis impact_start_at{0};
  Millis impact_end_at{0};

  // Set on entering AFTERMATH (end of the repair discount window).
  Millis aftermath_end_at{0};
  Millis resolved_at{0};

  // Actual time each phase was entered, in order.
  std::vector<PhaseTransition> transitions;

  // Impact bookkeeping. net_damage/preparedness/casualties_planned are rolled once
  // when the impact starts; each damage tick applies 1/damage_ticks_total of them.
  int damage_ticks_total{1};
  int damage_ticks_applied{0};
  double preparedness{0.0};
  double net_damage{0.0};
  int casualties_planned{0};
  int casualties{0};

  std::vector<std::string> structures_damaged;
  std::vector<std::string> structures_destroyed;
  ResourceTable<double> resources_lost;
};

// --- population ---

enum class PopulationStatus { Growing, Stable, Declining };

struct PopulationState {
  int current{0};
  int capacity{10};

  // 0..100
  double happiness{50.0};
  std::string happiness_label{"Content"};

  // Settlers per hour (signed).
  double growth_rate{0.0};

  // Fractional settlers carried between population ticks.
  double growth_accumulator{0.0};

  PopulationStatus status{PopulationStatus::Stable};
  Millis updated_at{0};
};

// --- construction ---

enum class ConstructionStatus { Queued, Active };

struct ConstructionEntry {
  std::string id;
  std::string settlement_id;
  std::string structure_type;

  // Target tile for extractors; empty otherwise.
  std::string tile_id;

  // 1-based position within the settlement's queue.
  int position{1};
  ConstructionStatus status{ConstructionStatus::Queued};
  bool emergency{false};

  Millis queued_at{0};
  // Both 0 while Queued.
  Millis started_at{0};
  Millis completes_at{0};

  // Build duration fixed at enqueue time.
  std::int64_t duration_ms{0};

  // Last progress percentage announced via construction-progress.
  int reported_progress{0};
};

// --- structures / storage ---

struct StructureInstance {
  std::string id;
  std::string type;
  int level{1};

  // 0..100; 0 means destroyed (removed from the settlement).
  double health{100.0};

  // Tile the extractor works; empty for non-extractors.
  std::string tile_id;

  Millis built_at{0};
};

struct StorageSlot {
  double amount{0.0};
  double capacity{1000.0};
};

using Storage = ResourceTable<StorageSlot>;

// --- settlement aggregate ---

struct LocationRef {
  std::string world_id;
  std::string region_id;
  std::string tile_id;
};

struct Settlement {
  std::string id;
  std::string owner_id;
  std::string name;
  LocationRef location;

  // World template id (STANDARD, SURVIVAL, RELAXED, FANTASY, APOCALYPSE).
  std::string world_template{"STANDARD"};

  // 0..100, raised by surviving disasters.
  double resilience{0.0};

  Millis created_at{0};

  Storage storage;
  std::vector<StructureInstance> structures;

  // Absent while the population record has not been created or could not be read.
  std::optional<PopulationState> population;

  std::vector<ConstructionEntry> construction;

  std::optional<DisasterEvent> active_disaster;

  // Most recent resolved disasters, newest last.
  std::vector<DisasterEvent> disaster_history;

  // Monotonic counter for structure / queue / disaster ids within this settlement.
  std::uint64_t next_local_id{1};

  // Incremented on every successful save.
  std::uint64_t revision{0};
};

constexpr std::size_t kMaxDisasterHistory = 20;

// Allocates "<prefix>-<n>" unique within the settlement.
std::string allocate_local_id(Settlement& s, const std::string& prefix);

StructureInstance* find_structure(Settlement& s, const std::string& structure_id);
const StructureInstance* find_structure(const Settlement& s, const std::string& structure_id);

// Number of structures of `type` with health > 0.
int count_structures(const Settlement& s, const std::string& type);

// Highest-level intact structure of `type`, or nullptr.
const StructureInstance* best_structure(const Settlement& s, const std::string& type);

DisasterPhase current_disaster_phase(const Settlement& s);

} // namespace settlesim
