#include "settlesim/core/serialization.h"

#include <stdexcept>

#include "settlesim/core/enum_strings.h"
#include "settlesim/util/time.h"

namespace settlesim {
namespace {

using json::Array;
using json::Object;
using json::Value;

void put_time(Object& o, const std::string& key, Millis t) {
  if (t != 0) o[key] = format_iso8601(t);
}

Millis get_time(const Object& o, const std::string& key) {
  auto it = o.find(key);
  if (it == o.end() || it->second.is_null()) return 0;
  if (it->second.is_number()) return static_cast<Millis>(it->second.int_value());
  return parse_iso8601(it->second.string_value());
}

std::string get_string(const Object& o, const std::string& key, const std::string& def = "") {
  auto it = o.find(key);
  return it == o.end() ? def : it->second.string_value(def);
}

double get_number(const Object& o, const std::string& key, double def = 0.0) {
  auto it = o.find(key);
  return it == o.end() ? def : it->second.number_value(def);
}

std::int64_t get_int(const Object& o, const std::string& key, std::int64_t def = 0) {
  auto it = o.find(key);
  return it == o.end() ? def : it->second.int_value(def);
}

Array string_vector_to_json(const std::vector<std::string>& v) {
  Array a;
  a.reserve(v.size());
  for (const auto& x : v) a.push_back(x);
  return a;
}

std::vector<std::string> string_vector_from_json(const Object& o, const std::string& key) {
  std::vector<std::string> out;
  auto it = o.find(key);
  if (it == o.end()) return out;
  for (const auto& x : it->second.array()) out.push_back(x.string_value());
  return out;
}

Value resource_table_to_json(const ResourceTable<double>& t) {
  Object o;
  for (Resource r : kAllResources) o[resource_to_string(r)] = t[r];
  return o;
}

ResourceTable<double> resource_table_from_json(const Object& o, const std::string& key) {
  ResourceTable<double> t;
  auto it = o.find(key);
  if (it == o.end()) return t;
  for (const auto& [k, v] : it->second.object()) {
    const auto r = resource_from_string(k);
    if (!r) throw std::runtime_error("Unknown resource '" + k + "' in " + key);
    t[*r] = v.number_value();
  }
  return t;
}

Value disaster_to_json(const DisasterEvent& d) {
  Object o;
  o["id"] = d.id;
  o["type"] = std::string(disaster_type_to_string(d.type));
  o["severity"] = static_cast<double>(d.severity);
  o["severity_level"] = std::string(severity_level_to_string(d.severity_level));
  o["biome"] = d.biome;
  o["region_id"] = d.region_id;
  o["phase"] = std::string(disaster_phase_to_string(d.phase));
  put_time(o, "warning_at", d.warning_at);
  put_time(o, "imminent_at", d.imminent_at);
  put_time(o, "impact_start_at", d.impact_start_at);
  put_time(o, "impact_end_at", d.impact_end_at);
  put_time(o, "aftermath_end_at", d.aftermath_end_at);
  put_time(o, "resolved_at", d.resolved_at);

  Array transitions;
  for (const auto& t : d.transitions) {
    Object to;
    to["phase"] = std::string(disaster_phase_to_string(t.phase));
    to["at"] = format_iso8601(t.at);
    transitions.push_back(to);
  }
  o["transitions"] = transitions;

  o["damage_ticks_total"] = static_cast<double>(d.damage_ticks_total);
  o["damage_ticks_applied"] = static_cast<double>(d.damage_ticks_applied);
  o["preparedness"] = d.preparedness;
  o["net_damage"] = d.net_damage;
  o["casualties_planned"] = static_cast<double>(d.casualties_planned);
  o["casualties"] = static_cast<double>(d.casualties);
  o["structures_damaged"] = string_vector_to_json(d.structures_damaged);
  o["structures_destroyed"] = string_vector_to_json(d.structures_destroyed);
  o["resources_lost"] = resource_table_to_json(d.resources_lost);
  return o;
}

DisasterEvent disaster_from_json(const Value& v) {
  const auto& o = v.object();
  DisasterEvent d;
  d.id = o.at("id").string_value();

  const std::string type = o.at("type").string_value();
  const auto t = disaster_type_from_string(type);
  if (!t) throw std::runtime_error("Unknown disaster type '" + type + "'");
  d.type = *t;

  d.severity = static_cast<int>(get_int(o, "severity"));
  d.severity_level = severity_level_from_string(get_string(o, "severity_level", "MILD"));
  d.biome = get_string(o, "biome");
  d.region_id = get_string(o, "region_id");

  const std::string phase = get_string(o, "phase", "WARNING");
  const auto p = disaster_phase_from_string(phase);
  if (!p) throw std::runtime_error("Unknown disaster phase '" + phase + "'");
  d.phase = *p;

  d.warning_at = get_time(o, "warning_at");
  d.imminent_at = get_time(o, "imminent_at");
  d.impact_start_at = get_time(o, "impact_start_at");
  d.impact_end_at = get_time(o, "impact_end_at");
  d.aftermath_end_at = get_time(o, "aftermath_end_at");
  d.resolved_at = get_time(o, "resolved_at");

  if (auto it = o.find("transitions"); it != o.end()) {
    for (const auto& tv : it->second.array()) {
      const auto& to = tv.object();
      const std::string tp = get_string(to, "phase");
      const auto parsed = disaster_phase_from_string(tp);
      if (!parsed) throw std::runtime_error("Unknown disaster phase '" + tp + "' in transitions");
      d.transitions.push_back(PhaseTransition{*parsed, get_time(to, "at")});
    }
  }

  d.damage_ticks_total = static_cast<int>(get_int(o, "damage_ticks_total", 1));
  d.damage_ticks_applied = static_cast<int>(get_int(o, "damage_ticks_applied"));
  d.preparedness = get_number(o, "preparedness");
  d.net_damage = get_number(o, "net_damage");
  d.casualties_planned = static_cast<int>(get_int(o, "casualties_planned"));
  d.casualties = static_cast<int>(get_int(o, "casualties"));
  d.structures_damaged = string_vector_from_json(o, "structures_damaged");
  d.structures_destroyed = string_vector_from_json(o, "structures_destroyed");
  d.resources_lost = resource_table_from_json(o, "resources_lost");
  return d;
}

} // namespace

Value settlement_to_json_value(const Settlement& s) {
  Object root;
  root["save_version"] = static_cast<double>(kCurrentSaveVersion);
  root["id"] = s.id;
  root["owner_id"] = s.owner_id;
  root["name"] = s.name;

  Object loc;
  loc["world_id"] = s.location.world_id;
  loc["region_id"] = s.location.region_id;
  loc["tile_id"] = s.location.tile_id;
  root["location"] = loc;

  root["world_template"] = s.world_template;
  root["resilience"] = s.resilience;
  put_time(root, "created_at", s.created_at);
  root["next_local_id"] = static_cast<double>(s.next_local_id);
  root["revision"] = static_cast<double>(s.revision);

  Object storage;
  for (Resource r : kAllResources) {
    Object slot;
    slot["amount"] = s.storage[r].amount;
    slot["capacity"] = s.storage[r].capacity;
    storage[resource_to_string(r)] = slot;
  }
  root["storage"] = storage;

  Array structures;
  for (const auto& st : s.structures) {
    Object o;
    o["id"] = st.id;
    o["type"] = st.type;
    o["level"] = static_cast<double>(st.level);
    o["health"] = st.health;
    if (!st.tile_id.empty()) o["tile_id"] = st.tile_id;
    put_time(o, "built_at", st.built_at);
    structures.push_back(o);
  }
  root["structures"] = structures;

  if (s.population) {
    const auto& p = *s.population;
    Object o;
    o["current"] = static_cast<double>(p.current);
    o["capacity"] = static_cast<double>(p.capacity);
    o["happiness"] = p.happiness;
    o["happiness_label"] = p.happiness_label;
    o["growth_rate"] = p.growth_rate;
    o["growth_accumulator"] = p.growth_accumulator;
    o["status"] = std::string(population_status_to_string(p.status));
    put_time(o, "updated_at", p.updated_at);
    root["population"] = o;
  }

  Array construction;
  for (const auto& e : s.construction) {
    Object o;
    o["id"] = e.id;
    o["structure_type"] = e.structure_type;
    if (!e.tile_id.empty()) o["tile_id"] = e.tile_id;
    o["position"] = static_cast<double>(e.position);
    o["status"] = std::string(construction_status_to_string(e.status));
    o["emergency"] = e.emergency;
    put_time(o, "queued_at", e.queued_at);
    put_time(o, "started_at", e.started_at);
    put_time(o, "completes_at", e.completes_at);
    o["duration_ms"] = static_cast<double>(e.duration_ms);
    o["reported_progress"] = static_cast<double>(e.reported_progress);
    construction.push_back(o);
  }
  root["construction"] = construction;

  if (s.active_disaster) root["active_disaster"] = disaster_to_json(*s.active_disaster);

  Array history;
  for (const auto& d : s.disaster_history) history.push_back(disaster_to_json(d));
  root["disaster_history"] = history;

  return root;
}

std::string settlement_to_json(const Settlement& s) { return json::stringify(settlement_to_json_value(s), 2); }

Settlement settlement_from_json_value(const Value& v) {
  const auto& root = v.object();

  const int version = static_cast<int>(get_int(root, "save_version", kCurrentSaveVersion));
  if (version > kCurrentSaveVersion) {
    throw std::runtime_error("Settlement save_version " + std::to_string(version) + " is newer than supported (" +
                             std::to_string(kCurrentSaveVersion) + ")");
  }

  Settlement s;
  s.id = root.at("id").string_value();
  if (s.id.empty()) throw std::runtime_error("Settlement has an empty id");
  s.owner_id = get_string(root, "owner_id");
  s.name = get_string(root, "name");

  if (auto it = root.find("location"); it != root.end()) {
    const auto& loc = it->second.object();
    s.location.world_id = get_string(loc, "world_id");
    s.location.region_id = get_string(loc, "region_id");
    s.location.tile_id = get_string(loc, "tile_id");
  }

  s.world_template = get_string(root, "world_template", "STANDARD");
  s.resilience = get_number(root, "resilience");
  s.created_at = get_time(root, "created_at");
  s.next_local_id = static_cast<std::uint64_t>(get_int(root, "next_local_id", 1));
  if (s.next_local_id == 0) s.next_local_id = 1;
  s.revision = static_cast<std::uint64_t>(get_int(root, "revision"));

  if (auto it = root.find("storage"); it != root.end()) {
    for (const auto& [k, sv] : it->second.object()) {
      const auto r = resource_from_string(k);
      if (!r) throw std::runtime_error("Unknown resource '" + k + "' in storage");
      const auto& slot = sv.object();
      s.storage[*r].amount = get_number(slot, "amount");
      s.storage[*r].capacity = get_number(slot, "capacity", 1000.0);
    }
  }

  if (auto it = root.find("structures"); it != root.end()) {
    for (const auto& stv : it->second.array()) {
      const auto& o = stv.object();
      StructureInstance st;
      st.id = o.at("id").string_value();
      st.type = o.at("type").string_value();
      st.level = static_cast<int>(get_int(o, "level", 1));
      st.health = get_number(o, "health", 100.0);
      st.tile_id = get_string(o, "tile_id");
      st.built_at = get_time(o, "built_at");
      s.structures.push_back(std::move(st));
    }
  }

  if (auto it = root.find("population"); it != root.end() && !it->second.is_null()) {
    const auto& o = it->second.object();
    PopulationState p;
    p.current = static_cast<int>(get_int(o, "current"));
    p.capacity = static_cast<int>(get_int(o, "capacity", 10));
    p.happiness = get_number(o, "happiness", 50.0);
    p.happiness_label = get_string(o, "happiness_label", "Content");
    p.growth_rate = get_number(o, "growth_rate");
    p.growth_accumulator = get_number(o, "growth_accumulator");
    p.status = population_status_from_string(get_string(o, "status", "Stable"));
    p.updated_at = get_time(o, "updated_at");
    s.population = p;
  }

  if (auto it = root.find("construction"); it != root.end()) {
    for (const auto& ev : it->second.array()) {
      const auto& o = ev.object();
      ConstructionEntry e;
      e.id = o.at("id").string_value();
      e.settlement_id = s.id;
      e.structure_type = o.at("structure_type").string_value();
      e.tile_id = get_string(o, "tile_id");
      e.position = static_cast<int>(get_int(o, "position", 1));
      e.status = construction_status_from_string(get_string(o, "status", "queued"));
      if (auto eit = o.find("emergency"); eit != o.end()) e.emergency = eit->second.bool_value(false);
      e.queued_at = get_time(o, "queued_at");
      e.started_at = get_time(o, "started_at");
      e.completes_at = get_time(o, "completes_at");
      e.duration_ms = get_int(o, "duration_ms");
      e.reported_progress = static_cast<int>(get_int(o, "reported_progress"));
      s.construction.push_back(std::move(e));
    }
  }

  if (auto it = root.find("active_disaster"); it != root.end() && !it->second.is_null()) {
    s.active_disaster = disaster_from_json(it->second);
  }

  if (auto it = root.find("disaster_history"); it != root.end()) {
    for (const auto& dv : it->second.array()) s.disaster_history.push_back(disaster_from_json(dv));
  }

  return s;
}

Settlement settlement_from_json(const std::string& json_text) {
  return settlement_from_json_value(json::parse(json_text));
}

} // namespace settlesim
