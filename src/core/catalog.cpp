#include "settlesim/core/catalog.h"

#include <cmath>
#include <stdexcept>

#include "settlesim/core/enum_strings.h"
#include "settlesim/core/errors.h"
#include "settlesim/util/file_io.h"
#include "settlesim/util/json.h"
#include "settlesim/util/log.h"
#include "settlesim/util/sorted_keys.h"
#include "settlesim/util/strings.h"

namespace settlesim {
namespace {

using json::Array;
using json::Object;
using json::Value;

ResourceTable<double> efficiency(double food, double water, double wood, double stone, double ore) {
  ResourceTable<double> t;
  t[Resource::Food] = food;
  t[Resource::Water] = water;
  t[Resource::Wood] = wood;
  t[Resource::Stone] = stone;
  t[Resource::Ore] = ore;
  return t;
}

DisasterTypeDef disaster_def(DisasterType t, std::int64_t warning_s, std::int64_t duration_s, double casualty,
                             std::vector<std::string> actions) {
  DisasterTypeDef d;
  d.type = t;
  d.warning_s = warning_s;
  d.impact_duration_s = duration_s;
  d.casualty_multiplier = casualty;
  d.recommended_actions = std::move(actions);
  return d;
}

WorldTemplate world(const std::string& id, const std::string& name, double prod, double cons, double growth,
                    double probability, double severity, double warning) {
  WorldTemplate w;
  w.id = id;
  w.name = name;
  w.production_multiplier = prod;
  w.consumption_multiplier = cons;
  w.population_growth_multiplier = growth;
  w.disaster_probability = probability;
  w.severity_multiplier = severity;
  w.warning_time_multiplier = warning;
  return w;
}

const WorldTemplate& fallback_world() {
  static const WorldTemplate w = world("STANDARD", "Standard Mode", 1.0, 1.0, 1.0, 0.015, 1.0, 1.0);
  return w;
}

const DisasterTypeDef& fallback_disaster(DisasterType t) {
  static const std::unordered_map<DisasterType, DisasterTypeDef> defs = builtin_catalog_defaults().disasters;
  static const DisasterTypeDef generic = disaster_def(DisasterType::Earthquake, 7200, 3600, 1.0, {});
  auto it = defs.find(t);
  return it == defs.end() ? generic : it->second;
}

// --- JSON helpers ---

[[noreturn]] void bad(const std::string& where, const std::string& what) {
  throw ConfigurationError("Catalog " + where + ": " + what);
}

double num(const Value& v, const std::string& where) {
  if (!v.is_number()) bad(where, "expected a number");
  return v.number_value();
}

ResourceTable<double> resource_table_from_json(const Value& v, const std::string& where) {
  if (!v.is_object()) bad(where, "expected an object of resource amounts");
  ResourceTable<double> t;
  for (const auto& [k, val] : v.object()) {
    const auto r = resource_from_string(k);
    if (!r) bad(where, "unknown resource '" + k + "'");
    t[*r] = num(val, where + "." + k);
  }
  return t;
}

std::vector<DisasterType> disaster_list_from_json(const Value* v, const std::string& where) {
  std::vector<DisasterType> out;
  if (!v) return out;
  if (!v->is_array()) bad(where, "expected an array of disaster types");
  for (const auto& e : v->array()) {
    const auto t = disaster_type_from_string(e.string_value());
    if (!t) bad(where, "unknown disaster type '" + e.string_value() + "'");
    out.push_back(*t);
  }
  return out;
}

StructureDef structure_from_json(const std::string& type, const Value& v, std::int64_t default_build_ms) {
  const std::string where = "structures." + type;
  if (!v.is_object()) bad(where, "expected an object");

  StructureDef d;
  d.type = type;
  d.name = type;
  d.build_time_ms = default_build_ms;
  if (const auto* p = v.find("name")) d.name = p->string_value(type);
  if (const auto* p = v.find("max_level")) d.max_level = static_cast<int>(p->int_value(5));
  if (d.max_level < 1) bad(where, "max_level must be >= 1");
  if (const auto* p = v.find("build_time_ms")) d.build_time_ms = p->int_value(default_build_ms);
  if (d.build_time_ms < 0) bad(where, "build_time_ms must be >= 0");
  if (const auto* p = v.find("cost")) d.cost = resource_table_from_json(*p, where + ".cost");

  if (const auto* p = v.find("modifiers")) {
    if (!p->is_array()) bad(where, "modifiers must be an array");
    for (const auto& mv : p->array()) {
      StructureModifier m;
      m.name = mv.at("name").string_value();
      m.value = num(mv.at("value"), where + ".modifiers." + m.name);
      if (const auto* r = mv.find("resource")) {
        m.resource = resource_from_string(r->string_value());
        if (!m.resource) bad(where, "unknown modifier resource '" + r->string_value() + "'");
      }
      d.modifiers.push_back(std::move(m));
    }
  }

  if (const auto* p = v.find("resistances")) {
    if (!p->is_object()) bad(where, "resistances must be an object");
    for (const auto& [k, rv] : p->object()) {
      const double r = num(rv, where + ".resistances." + k);
      if (to_upper(k) == "ALL") {
        d.resistance_all = r;
        continue;
      }
      const auto t = disaster_type_from_string(k);
      if (!t) bad(where, "unknown disaster type '" + k + "'");
      d.resistances[*t] = r;
    }
  }
  return d;
}

} // namespace

StructureCatalog builtin_catalog_defaults() {
  StructureCatalog c;

  c.per_capita_consumption[Resource::Food] = 18.0;
  c.per_capita_consumption[Resource::Water] = 36.0;

  c.biome_efficiency["GRASSLAND"] = efficiency(1.0, 1.0, 1.0, 1.0, 1.0);
  c.biome_efficiency["FOREST"] = efficiency(0.8, 1.0, 2.0, 0.8, 0.5);
  c.biome_efficiency["DESERT"] = efficiency(0.5, 0.3, 0.3, 2.0, 1.5);
  c.biome_efficiency["MOUNTAIN"] = efficiency(0.6, 0.7, 0.7, 1.5, 2.0);
  c.biome_efficiency["TUNDRA"] = efficiency(0.5, 1.0, 0.6, 1.0, 1.2);
  c.biome_efficiency["SWAMP"] = efficiency(1.2, 1.5, 0.8, 0.5, 0.4);
  c.biome_efficiency["COASTAL"] = efficiency(1.3, 1.2, 0.9, 0.9, 0.8);

  using D = DisasterType;
  c.biome_disasters["GRASSLAND"] = {{D::Drought, D::Tornado, D::LocustSwarm},
                                    {D::Flood, D::Wildfire, D::Heatwave},
                                    {D::Earthquake}};
  c.biome_disasters["FOREST"] = {{D::Wildfire, D::InsectPlague, D::Blight},
                                 {D::Flood, D::Tornado, D::Drought},
                                 {D::Earthquake, D::Heatwave}};
  c.biome_disasters["DESERT"] = {{D::Drought, D::Sandstorm, D::Heatwave, D::LocustSwarm},
                                 {D::Wildfire},
                                 {D::Flood, D::Blizzard}};
  c.biome_disasters["MOUNTAIN"] = {{D::Earthquake, D::Avalanche, D::Landslide, D::Volcano},
                                   {D::Blizzard, D::Wildfire},
                                   {D::Flood, D::Tornado, D::Drought}};
  c.biome_disasters["TUNDRA"] = {{D::Blizzard, D::Avalanche}, {D::Earthquake}, {D::Wildfire, D::Drought, D::Heatwave}};
  c.biome_disasters["SWAMP"] = {{D::Flood, D::InsectPlague, D::Blight},
                                {D::Wildfire, D::Tornado},
                                {D::Drought, D::Earthquake}};
  c.biome_disasters["COASTAL"] = {{D::Hurricane, D::Flood},
                                  {D::Earthquake, D::Tornado, D::Wildfire},
                                  {D::Drought, D::Blizzard}};

  const auto add = [&](DisasterTypeDef d) { c.disasters[d.type] = std::move(d); };
  add(disaster_def(D::Earthquake, 3600, 600, 1.0, {"Move settlers into shelters", "Reinforce foundations"}));
  add(disaster_def(D::Flood, 7200, 3600, 0.8, {"Move stores to high ground", "Build storm barriers"}));
  add(disaster_def(D::Drought, 86400, 86400, 0.6, {"Stockpile water", "Ration food"}));
  add(disaster_def(D::Wildfire, 5400, 7200, 0.9, {"Clear fire breaks", "Stockpile water"}));
  add(disaster_def(D::Hurricane, 14400, 5400, 1.2, {"Move settlers into shelters", "Secure storage"}));
  add(disaster_def(D::Tornado, 1800, 300, 1.3, {"Move settlers into shelters"}));
  add(disaster_def(D::Blizzard, 10800, 10800, 0.7, {"Stockpile wood", "Move settlers into shelters"}));
  add(disaster_def(D::Heatwave, 43200, 43200, 0.8, {"Stockpile water", "Reduce outdoor work"}));
  add(disaster_def(D::Sandstorm, 5400, 3600, 0.5, {"Seal storage", "Move settlers indoors"}));
  add(disaster_def(D::Volcano, 7200, 7200, 1.4, {"Evacuate to shelters", "Secure storage"}));
  add(disaster_def(D::Landslide, 3600, 1800, 1.1, {"Move settlers away from slopes"}));
  add(disaster_def(D::Avalanche, 1800, 600, 1.2, {"Move settlers into shelters"}));
  add(disaster_def(D::LocustSwarm, 172800, 21600, 0.3, {"Harvest early", "Stockpile food"}));
  add(disaster_def(D::InsectPlague, 259200, 43200, 0.3, {"Stockpile food", "Quarantine fields"}));
  add(disaster_def(D::Blight, 432000, 172800, 0.4, {"Stockpile food", "Rotate crops"}));

  const auto add_world = [&](WorldTemplate w) { c.world_templates[w.id] = std::move(w); };
  add_world(world("STANDARD", "Standard Mode", 1.0, 1.0, 1.0, 0.015, 1.0, 1.0));
  add_world(world("SURVIVAL", "Survival Mode", 0.7, 1.3, 0.8, 0.04, 1.2, 0.75));
  add_world(world("RELAXED", "Relaxed Mode", 1.5, 0.7, 1.3, 0.005, 0.7, 1.5));
  add_world(world("FANTASY", "Fantasy Mode", 1.2, 0.9, 1.1, 0.015, 1.0, 1.0));
  add_world(world("APOCALYPSE", "Apocalypse Mode", 0.5, 1.5, 0.5, 0.08, 1.5, 0.5));

  return c;
}

const StructureDef* StructureCatalog::find_structure(const std::string& type) const {
  auto it = structures.find(type);
  return it == structures.end() ? nullptr : &it->second;
}

std::vector<ProductionRate> StructureCatalog::rates_for(const std::string& extractor_type) const {
  std::vector<ProductionRate> out;
  for (const auto& r : production_rates) {
    if (r.extractor_type == extractor_type) out.push_back(r);
  }
  return out;
}

bool StructureCatalog::is_extractor(const std::string& type) const {
  for (const auto& r : production_rates) {
    if (r.extractor_type == type) return true;
  }
  return false;
}

const ResourceTable<double>* StructureCatalog::find_biome(const std::string& biome) const {
  auto it = biome_efficiency.find(to_upper(biome));
  return it == biome_efficiency.end() ? nullptr : &it->second;
}

const BiomeDisasterRisk* StructureCatalog::find_biome_disasters(const std::string& biome) const {
  auto it = biome_disasters.find(to_upper(biome));
  return it == biome_disasters.end() ? nullptr : &it->second;
}

const WorldTemplate& StructureCatalog::world_template(const std::string& id) const {
  auto it = world_templates.find(to_upper(id));
  if (it != world_templates.end()) return it->second;
  log::warn("Unknown world template '" + id + "', using STANDARD");
  auto std_it = world_templates.find("STANDARD");
  if (std_it != world_templates.end()) return std_it->second;
  return fallback_world();
}

const DisasterTypeDef& StructureCatalog::disaster(DisasterType t) const {
  auto it = disasters.find(t);
  if (it != disasters.end()) return it->second;
  return fallback_disaster(t);
}

double StructureCatalog::level_multiplier(int level) const {
  if (level < 1) level = 1;
  return std::pow(level_multiplier_base, static_cast<double>(level - 1));
}

std::int64_t StructureCatalog::build_time_ms(const std::string& type) const {
  if (const auto* d = find_structure(type)) return d->build_time_ms;
  return default_build_time_ms;
}

double StructureCatalog::sum_modifiers(const Settlement& s, const std::string& name,
                                       std::optional<Resource> resource) const {
  double sum = 0.0;
  for (const auto& st : s.structures) {
    if (st.health <= 0.0) continue;
    const auto* def = find_structure(st.type);
    if (!def) continue;
    for (const auto& m : def->modifiers) {
      if (m.name != name) continue;
      if (resource && m.resource != resource) continue;
      sum += m.value * level_multiplier(st.level);
    }
  }
  return sum;
}

double StructureCatalog::resistance(const std::string& structure_type, DisasterType t) const {
  const auto* def = find_structure(structure_type);
  if (!def) return 0.0;
  auto it = def->resistances.find(t);
  if (it != def->resistances.end()) return it->second;
  return def->resistance_all;
}

StructureCatalog load_catalog_from_json(const std::string& json_text) {
  Value root;
  try {
    root = json::parse(json_text);
  } catch (const std::runtime_error& e) {
    throw ConfigurationError(std::string("Catalog is not valid JSON: ") + e.what());
  }
  if (!root.is_object()) bad("root", "expected an object");

  StructureCatalog c = builtin_catalog_defaults();

  try {
    if (const auto* p = root.find("level_multiplier_base")) c.level_multiplier_base = num(*p, "level_multiplier_base");
    if (const auto* p = root.find("base_storage_capacity")) c.base_storage_capacity = num(*p, "base_storage_capacity");
    if (const auto* p = root.find("base_population_capacity")) {
      c.base_population_capacity = static_cast<int>(num(*p, "base_population_capacity"));
    }
    if (const auto* p = root.find("default_build_time_ms")) {
      c.default_build_time_ms = static_cast<std::int64_t>(num(*p, "default_build_time_ms"));
    }
    if (const auto* p = root.find("per_capita_consumption")) {
      c.per_capita_consumption = resource_table_from_json(*p, "per_capita_consumption");
    }

    if (const auto* p = root.find("production_rates")) {
      if (!p->is_array()) bad("production_rates", "expected an array");
      c.production_rates.clear();
      for (const auto& rv : p->array()) {
        ProductionRate r;
        const std::string res = rv.at("resource").string_value();
        const auto parsed = resource_from_string(res);
        if (!parsed) bad("production_rates", "unknown resource '" + res + "'");
        r.resource = *parsed;
        r.extractor_type = rv.at("extractor").string_value();
        r.base_rate = num(rv.at("base_rate"), "production_rates." + r.extractor_type);
        c.production_rates.push_back(std::move(r));
      }
    }

    if (const auto* p = root.find("biomes")) {
      if (!p->is_object()) bad("biomes", "expected an object");
      for (const auto& [name, bv] : p->object()) {
        const std::string key = to_upper(name);
        if (const auto* e = bv.find("efficiency")) {
          c.biome_efficiency[key] = resource_table_from_json(*e, "biomes." + name + ".efficiency");
        }
        if (const auto* d = bv.find("disasters")) {
          BiomeDisasterRisk risk;
          const std::string where = "biomes." + name + ".disasters";
          risk.high = disaster_list_from_json(d->find("high"), where + ".high");
          risk.moderate = disaster_list_from_json(d->find("moderate"), where + ".moderate");
          risk.low = disaster_list_from_json(d->find("low"), where + ".low");
          c.biome_disasters[key] = std::move(risk);
        }
      }
    }

    if (const auto* p = root.find("world_templates")) {
      if (!p->is_object()) bad("world_templates", "expected an object");
      for (const auto& [id, wv] : p->object()) {
        const std::string key = to_upper(id);
        auto existing = c.world_templates.find(key);
        if (existing == c.world_templates.end()) existing = c.world_templates.find("STANDARD");
        WorldTemplate w = existing != c.world_templates.end() ? existing->second : fallback_world();
        w.id = key;
        if (const auto* f = wv.find("name")) w.name = f->string_value(w.name);
        if (const auto* f = wv.find("production_multiplier")) w.production_multiplier = num(*f, id);
        if (const auto* f = wv.find("consumption_multiplier")) w.consumption_multiplier = num(*f, id);
        if (const auto* f = wv.find("population_growth_multiplier")) w.population_growth_multiplier = num(*f, id);
        if (const auto* f = wv.find("disaster_probability")) w.disaster_probability = num(*f, id);
        if (const auto* f = wv.find("severity_multiplier")) w.severity_multiplier = num(*f, id);
        if (const auto* f = wv.find("warning_time_multiplier")) w.warning_time_multiplier = num(*f, id);
        c.world_templates[key] = std::move(w);
      }
    }

    if (const auto* p = root.find("disasters")) {
      if (!p->is_object()) bad("disasters", "expected an object");
      for (const auto& [name, dv] : p->object()) {
        const auto t = disaster_type_from_string(name);
        if (!t) bad("disasters", "unknown disaster type '" + name + "'");
        DisasterTypeDef d = c.disaster(*t);
        d.type = *t;
        if (const auto* f = dv.find("warning_s")) d.warning_s = static_cast<std::int64_t>(num(*f, name));
        if (const auto* f = dv.find("impact_duration_s")) d.impact_duration_s = static_cast<std::int64_t>(num(*f, name));
        if (const auto* f = dv.find("casualty_multiplier")) d.casualty_multiplier = num(*f, name);
        if (const auto* f = dv.find("recommended_actions")) {
          d.recommended_actions.clear();
          for (const auto& a : f->array()) d.recommended_actions.push_back(a.string_value());
        }
        c.disasters[*t] = std::move(d);
      }
    }

    if (const auto* p = root.find("structures")) {
      if (!p->is_object()) bad("structures", "expected an object");
      for (const auto& type : util::sorted_keys(p->object())) {
        c.structures[type] = structure_from_json(type, p->object().at(type), c.default_build_time_ms);
      }
    }
  } catch (const ConfigurationError&) {
    throw;
  } catch (const std::runtime_error& e) {
    // json::Value::at() reports missing keys as runtime_error.
    throw ConfigurationError(std::string("Catalog: ") + e.what());
  }

  for (const auto& problem : validate_catalog(c)) log::warn("Catalog: " + problem);
  return c;
}

StructureCatalog load_catalog_file(const std::string& path) {
  const std::string text = read_text_file(path);
  StructureCatalog c = load_catalog_from_json(text);
  log::info("Loaded catalog " + path + ": " + std::to_string(c.structures.size()) + " structures, " +
            std::to_string(c.production_rates.size()) + " production rates");
  return c;
}

std::vector<std::string> validate_catalog(const StructureCatalog& c) {
  std::vector<std::string> errors;
  if (!(c.level_multiplier_base > 0.0)) errors.push_back("level_multiplier_base must be > 0");
  if (c.base_storage_capacity < 0.0) errors.push_back("base_storage_capacity must be >= 0");
  if (c.base_population_capacity < 0) errors.push_back("base_population_capacity must be >= 0");

  for (const auto& r : c.production_rates) {
    if (!c.find_structure(r.extractor_type)) {
      errors.push_back("production rate for unknown extractor '" + r.extractor_type + "'");
    }
    if (r.base_rate < 0.0) errors.push_back("negative base rate for '" + r.extractor_type + "'");
  }

  for (const auto& id : util::sorted_keys(c.world_templates)) {
    const auto& w = c.world_templates.at(id);
    if (w.disaster_probability < 0.0 || w.disaster_probability > 1.0) {
      errors.push_back("world template " + id + " disaster_probability outside [0,1]");
    }
  }

  for (const auto& biome : util::sorted_keys(c.biome_disasters)) {
    const auto& risk = c.biome_disasters.at(biome);
    if (risk.high.empty() && risk.moderate.empty() && risk.low.empty()) {
      errors.push_back("biome " + biome + " has no disaster types");
    }
  }
  return errors;
}

} // namespace settlesim
