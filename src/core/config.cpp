#include "settlesim/core/config.h"

#include <cmath>
#include <set>

#include "settlesim/core/errors.h"
#include "settlesim/util/file_io.h"
#include "settlesim/util/json.h"
#include "settlesim/util/log.h"
#include "settlesim/util/sorted_keys.h"

namespace settlesim {
namespace {

using json::Value;

[[noreturn]] void bad(const std::string& key, const std::string& what) {
  throw ConfigurationError("Engine config '" + key + "': " + what);
}

double num(const Value& v, const std::string& key) {
  if (!v.is_number()) bad(key, "expected a number");
  return v.number_value();
}

std::int64_t integer(const Value& v, const std::string& key) {
  const double d = num(v, key);
  if (std::floor(d) != d) bad(key, "expected an integer");
  return static_cast<std::int64_t>(d);
}

bool boolean(const Value& v, const std::string& key) {
  if (!v.is_bool()) bad(key, "expected true or false");
  return v.bool_value();
}

// Logs keys of `obj` that are not in `known`.
void warn_unknown(const json::Object& obj, const std::set<std::string>& known, const std::string& where) {
  for (const auto& k : util::sorted_keys(obj)) {
    if (known.count(k) == 0) log::warn("Engine config: ignoring unknown key '" + where + k + "'");
  }
}

const json::Object& section(const Value& v, const std::string& key) {
  if (!v.is_object()) bad(key, "expected an object");
  return v.object();
}

void read_phases(const Value& v, EngineConfig& cfg) {
  for (const auto& name : util::sorted_keys(section(v, "phases"))) {
    const auto phase = phase_from_string(name);
    if (!phase) {
      log::warn("Engine config: ignoring unknown phase '" + name + "'");
      continue;
    }
    const std::string where = "phases." + name;
    const Value& pv = v.at(name);
    const auto& obj = section(pv, where);
    warn_unknown(obj, {"period_s", "offset_s", "enabled"}, where + ".");

    PhaseSpec* spec = nullptr;
    for (auto& s : cfg.phases) {
      if (s.phase == *phase) spec = &s;
    }
    if (!spec) {
      cfg.phases.push_back(PhaseSpec{*phase, 3600, 0, true});
      spec = &cfg.phases.back();
    }
    if (const auto* p = pv.find("period_s")) spec->period_s = integer(*p, where + ".period_s");
    if (const auto* p = pv.find("offset_s")) spec->offset_s = integer(*p, where + ".offset_s");
    if (const auto* p = pv.find("enabled")) spec->enabled = boolean(*p, where + ".enabled");
  }
}

void read_disaster(const Value& v, DisasterSettings& d) {
  warn_unknown(section(v, "disaster"),
               {"imminent_lead_s", "damage_interval_s", "aftermath_window_s", "repair_discount", "damage_variance"},
               "disaster.");
  if (const auto* p = v.find("imminent_lead_s")) d.imminent_lead_s = integer(*p, "disaster.imminent_lead_s");
  if (const auto* p = v.find("damage_interval_s")) d.damage_interval_s = integer(*p, "disaster.damage_interval_s");
  if (const auto* p = v.find("aftermath_window_s")) {
    d.aftermath_window_s = integer(*p, "disaster.aftermath_window_s");
  }
  if (const auto* p = v.find("repair_discount")) d.repair_discount = num(*p, "disaster.repair_discount");
  if (const auto* p = v.find("damage_variance")) d.damage_variance = num(*p, "disaster.damage_variance");
}

void read_construction(const Value& v, ConstructionSettings& c) {
  warn_unknown(section(v, "construction"), {"max_active_slots", "emergency_time_factor", "progress_step_percent"},
               "construction.");
  if (const auto* p = v.find("max_active_slots")) {
    c.max_active_slots = static_cast<int>(integer(*p, "construction.max_active_slots"));
  }
  if (const auto* p = v.find("emergency_time_factor")) {
    c.emergency_time_factor = num(*p, "construction.emergency_time_factor");
  }
  if (const auto* p = v.find("progress_step_percent")) {
    c.progress_step_percent = static_cast<int>(integer(*p, "construction.progress_step_percent"));
  }
}

void read_repair(const Value& v, PassiveRepairSettings& r) {
  warn_unknown(section(v, "repair"), {"rate_per_hour", "min_health"}, "repair.");
  if (const auto* p = v.find("rate_per_hour")) r.rate_per_hour = num(*p, "repair.rate_per_hour");
  if (const auto* p = v.find("min_health")) r.min_health = num(*p, "repair.min_health");
}

} // namespace

std::vector<std::string> validate_engine_config(const EngineConfig& cfg) {
  std::vector<std::string> errors = WallClockScheduler(cfg.phases).validate();

  if (cfg.disaster.damage_interval_s < 1) errors.push_back("disaster.damage_interval_s must be >= 1");
  if (cfg.disaster.imminent_lead_s < 0) errors.push_back("disaster.imminent_lead_s must be >= 0");
  if (cfg.disaster.aftermath_window_s < 0) errors.push_back("disaster.aftermath_window_s must be >= 0");
  if (cfg.disaster.repair_discount < 0.0 || cfg.disaster.repair_discount > 1.0) {
    errors.push_back("disaster.repair_discount must be within [0, 1]");
  }
  if (cfg.disaster.damage_variance < 0.0 || cfg.disaster.damage_variance >= 1.0) {
    errors.push_back("disaster.damage_variance must be within [0, 1)");
  }
  if (cfg.construction.max_active_slots < 1) errors.push_back("construction.max_active_slots must be >= 1");
  if (cfg.construction.emergency_time_factor <= 0.0) {
    errors.push_back("construction.emergency_time_factor must be > 0");
  }
  if (cfg.repair.rate_per_hour < 0.0) errors.push_back("repair.rate_per_hour must be >= 0");
  if (cfg.worker_threads < 0) errors.push_back("worker_threads must be >= 0");
  if (cfg.max_worker_threads < 1) errors.push_back("max_worker_threads must be >= 1");
  if (cfg.poll_interval_ms < 1) errors.push_back("poll_interval_ms must be >= 1");
  if (cfg.storage_warning_threshold <= 0.0 || cfg.storage_warning_threshold > 1.0) {
    errors.push_back("storage_warning_threshold must be within (0, 1]");
  }
  if (cfg.shortage_buffer_hours < 0.0) errors.push_back("shortage_buffer_hours must be >= 0");
  if (cfg.max_events < 0) errors.push_back("max_events must be >= 0");
  return errors;
}

EngineConfig engine_config_from_json(const std::string& json_text, EngineConfig base) {
  Value root;
  try {
    root = json::parse(json_text);
  } catch (const std::runtime_error& e) {
    throw ConfigurationError(std::string("Engine config is not valid JSON: ") + e.what());
  }
  if (!root.is_object()) throw ConfigurationError("Engine config: expected an object");

  EngineConfig cfg = std::move(base);
  warn_unknown(root.object(),
               {"phases", "disaster", "construction", "repair", "worker_threads", "max_worker_threads",
                "poll_interval_ms", "storage_warning_threshold", "shortage_buffer_hours", "rng_seed", "max_events"},
               "");

  if (const auto* p = root.find("phases")) read_phases(*p, cfg);
  if (const auto* p = root.find("disaster")) read_disaster(*p, cfg.disaster);
  if (const auto* p = root.find("construction")) read_construction(*p, cfg.construction);
  if (const auto* p = root.find("repair")) read_repair(*p, cfg.repair);
  if (const auto* p = root.find("worker_threads")) cfg.worker_threads = static_cast<int>(integer(*p, "worker_threads"));
  if (const auto* p = root.find("max_worker_threads")) {
    cfg.max_worker_threads = static_cast<int>(integer(*p, "max_worker_threads"));
  }
  if (const auto* p = root.find("poll_interval_ms")) {
    cfg.poll_interval_ms = static_cast<int>(integer(*p, "poll_interval_ms"));
  }
  if (const auto* p = root.find("storage_warning_threshold")) {
    cfg.storage_warning_threshold = num(*p, "storage_warning_threshold");
  }
  if (const auto* p = root.find("shortage_buffer_hours")) cfg.shortage_buffer_hours = num(*p, "shortage_buffer_hours");
  if (const auto* p = root.find("rng_seed")) {
    const std::int64_t seed = integer(*p, "rng_seed");
    if (seed < 0) bad("rng_seed", "must be >= 0");
    cfg.rng_seed = static_cast<std::uint64_t>(seed);
  }
  if (const auto* p = root.find("max_events")) cfg.max_events = static_cast<int>(integer(*p, "max_events"));

  const auto errors = validate_engine_config(cfg);
  if (!errors.empty()) {
    std::string msg = "Engine config is invalid: " + errors.front();
    if (errors.size() > 1) msg += " (+" + std::to_string(errors.size() - 1) + " more)";
    throw ConfigurationError(msg);
  }
  return cfg;
}

EngineConfig load_engine_config(const std::string& path, EngineConfig base) {
  EngineConfig cfg = engine_config_from_json(read_text_file(path), std::move(base));
  log::info("Loaded engine config from " + path);
  return cfg;
}

} // namespace settlesim
