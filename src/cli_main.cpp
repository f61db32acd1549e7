#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "settlesim/core/catalog.h"
#include "settlesim/core/config.h"
#include "settlesim/core/engine.h"
#include "settlesim/core/errors.h"
#include "settlesim/core/events.h"
#include "settlesim/core/repository.h"
#include "settlesim/core/scheduler.h"
#include "settlesim/core/terrain.h"
#include "settlesim/util/log.h"
#include "settlesim/util/time.h"

namespace {

#ifndef SETTLESIM_VERSION
#define SETTLESIM_VERSION "unknown"
#endif

std::atomic<bool> g_stop_requested{false};

extern "C" void on_stop_signal(int) { g_stop_requested.store(true); }

int get_int_arg(int argc, char** argv, const std::string& key, int def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return std::stoi(argv[i + 1]);
  }
  return def;
}

std::string get_str_arg(int argc, char** argv, const std::string& key, const std::string& def) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return argv[i + 1];
  }
  return def;
}

bool has_kv_arg(int argc, char** argv, const std::string& key) {
  for (int i = 1; i < argc - 1; ++i) {
    if (argv[i] == key) return true;
  }
  return false;
}

bool has_flag(int argc, char** argv, const std::string& flag) {
  for (int i = 1; i < argc; ++i) {
    if (argv[i] == flag) return true;
  }
  return false;
}

void print_usage(const char* exe) {
  std::cout << "SettleSim tick engine v" << SETTLESIM_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "settlesim_cli") << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  --data DIR         Settlement store, one <id>.json per settlement (default: settlements)\n";
  std::cout << "  --catalog PATH     Structure catalog JSON (default: data/catalog.json)\n";
  std::cout << "  --tiles PATH       Tile table JSON (default: data/tiles.json)\n";
  std::cout << "  --config PATH      Engine config JSON (optional)\n";
  std::cout << "  --log-level L      debug|info|warn|error|off (default: info)\n";
  std::cout << "  --serve            Run the wall-clock tick loop until SIGINT/SIGTERM\n";
  std::cout << "  --run-once         Run the phases due now (or at --at) once and print the acknowledgment\n";
  std::cout << "  --phase NAME       Force one phase (production|population|passive-repair|disaster-check|\n";
  std::cout << "                     disaster-progress) at --at (default: now)\n";
  std::cout << "  --at TIME          ISO-8601 UTC time for --run-once / --phase / --enqueue\n";
  std::cout << "  --enqueue ID:TYPE  Queue a structure build for settlement ID\n";
  std::cout << "    --tile TILE_ID   Target tile for an extractor build\n";
  std::cout << "    --emergency      Emergency build (half build time)\n";
  std::cout << "  --validate         Validate catalog and every stored settlement, then exit\n";
  std::cout << "  --events-out PATH  Append dispatched events to PATH as JSON lines\n";
  std::cout << "  --seed-demo N      Create N demo settlements in --data (existing ids are kept)\n";
  std::cout << "  --quiet            Do not echo events to stdout\n";
  std::cout << "  -h, --help         Show this help\n";
  std::cout << "  --version          Print version and exit\n";
}

settlesim::Settlement make_demo_settlement(int n, const std::string& tile_id, const std::string& region_id,
                                           settlesim::Millis now) {
  using settlesim::Resource;
  settlesim::Settlement s;
  s.id = "demo-" + std::to_string(n);
  s.owner_id = "demo-player";
  s.name = "Demo Settlement " + std::to_string(n);
  s.location.world_id = "demo-world";
  s.location.region_id = region_id;
  s.location.tile_id = tile_id;
  s.created_at = now;

  s.storage[Resource::Food].amount = 500.0;
  s.storage[Resource::Water].amount = 500.0;
  s.storage[Resource::Wood].amount = 200.0;
  s.storage[Resource::Stone].amount = 100.0;
  s.storage[Resource::Ore].amount = 50.0;

  settlesim::PopulationState pop;
  pop.current = 6;
  pop.capacity = 10;
  pop.updated_at = now;
  s.population = pop;

  const char* starter[] = {"FARM", "WELL", "LUMBER_MILL", "TENT"};
  for (const char* type : starter) {
    settlesim::StructureInstance st;
    st.id = settlesim::allocate_local_id(s, "structure");
    st.type = type;
    if (std::string(type) != "TENT") st.tile_id = tile_id;
    st.built_at = now;
    s.structures.push_back(std::move(st));
  }
  return s;
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << SETTLESIM_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const std::string log_level = get_str_arg(argc, argv, "--log-level", "info");
    settlesim::log::Level lvl = settlesim::log::Level::Info;
    if (!settlesim::log::parse_level(log_level, &lvl)) {
      std::cerr << "Unknown --log-level '" << log_level << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }
    settlesim::log::set_level(lvl);

    const std::string data_dir = get_str_arg(argc, argv, "--data", "settlements");
    const std::string catalog_path = get_str_arg(argc, argv, "--catalog", "data/catalog.json");
    const std::string tiles_path = get_str_arg(argc, argv, "--tiles", "data/tiles.json");
    const std::string config_path = get_str_arg(argc, argv, "--config", "");
    const std::string events_out = get_str_arg(argc, argv, "--events-out", "");
    const std::string phase_name = get_str_arg(argc, argv, "--phase", "");
    const std::string enqueue_arg = get_str_arg(argc, argv, "--enqueue", "");
    const bool quiet = has_flag(argc, argv, "--quiet");

    const bool serve = has_flag(argc, argv, "--serve");
    const bool run_once = has_flag(argc, argv, "--run-once");
    const bool validate = has_flag(argc, argv, "--validate");
    const int seed_demo = get_int_arg(argc, argv, "--seed-demo", 0);

    const int modes = (serve ? 1 : 0) + (run_once ? 1 : 0) + (phase_name.empty() ? 0 : 1) + (validate ? 1 : 0) +
                      (enqueue_arg.empty() ? 0 : 1);
    if (modes > 1) {
      std::cerr << "Choose one of --serve, --run-once, --phase, --enqueue, --validate\n\n";
      print_usage(argv[0]);
      return 2;
    }
    if (modes == 0 && seed_demo <= 0) {
      print_usage(argv[0]);
      return 2;
    }

    settlesim::Millis at = settlesim::now_epoch_ms();
    if (has_kv_arg(argc, argv, "--at")) {
      try {
        at = settlesim::parse_iso8601(get_str_arg(argc, argv, "--at", ""));
      } catch (const std::exception& e) {
        std::cerr << "Invalid --at: " << e.what() << "\n";
        return 2;
      }
    }

    std::optional<settlesim::Phase> forced_phase;
    if (!phase_name.empty()) {
      forced_phase = settlesim::phase_from_string(phase_name);
      if (!forced_phase) {
        std::cerr << "Unknown --phase '" << phase_name << "'\n\n";
        print_usage(argv[0]);
        return 2;
      }
    }

    const auto catalog = settlesim::load_catalog_file(catalog_path);
    const auto catalog_errors = settlesim::validate_catalog(catalog);
    if (!catalog_errors.empty()) {
      std::cerr << "Catalog validation failed:\n";
      for (const auto& e : catalog_errors) std::cerr << "  - " << e << "\n";
      return 1;
    }
    const auto tiles = settlesim::load_tiles_file(tiles_path);

    settlesim::EngineConfig cfg;
    if (!config_path.empty()) cfg = settlesim::load_engine_config(config_path);

    settlesim::JsonDirectoryRepository repo(data_dir, &catalog);

    if (seed_demo > 0) {
      const auto tile_ids = tiles.ids();
      if (tile_ids.empty()) {
        std::cerr << "--seed-demo needs at least one tile in " << tiles_path << "\n";
        return 1;
      }
      const auto existing = repo.list_ids();
      int created = 0;
      for (int i = 1; i <= seed_demo; ++i) {
        const std::string& tile_id = tile_ids[static_cast<std::size_t>(i - 1) % tile_ids.size()];
        const settlesim::Tile* tile = tiles.find_tile(tile_id);
        auto s = make_demo_settlement(i, tile_id, tile ? tile->region_id : std::string(), at);
        if (std::find(existing.begin(), existing.end(), s.id) != existing.end()) continue;
        repo.save(s);
        ++created;
      }
      std::cout << "Seeded " << created << " demo settlements in " << data_dir << "\n";
      if (modes == 0) return 0;
    }

    auto sinks = std::make_shared<settlesim::FanoutEventSink>();
    if (!quiet) sinks->add(std::make_shared<settlesim::JsonLinesEventSink>(std::cout));
    if (!events_out.empty()) sinks->add(std::make_shared<settlesim::FileEventSink>(events_out));

    settlesim::Engine engine(cfg, catalog, tiles, repo, sinks);

    if (validate) {
      const int failed = engine.validate_all();
      if (failed > 0) {
        std::cerr << failed << " settlements failed validation\n";
        return 1;
      }
      std::cout << "Catalog and settlements OK\n";
      return 0;
    }

    if (!enqueue_arg.empty()) {
      const auto colon = enqueue_arg.find(':');
      if (colon == std::string::npos || colon == 0 || colon + 1 == enqueue_arg.size()) {
        std::cerr << "--enqueue expects SETTLEMENT_ID:STRUCTURE_TYPE\n";
        return 2;
      }
      const auto ack =
          engine.enqueue_construction(enqueue_arg.substr(0, colon), enqueue_arg.substr(colon + 1), at,
                                      has_flag(argc, argv, "--emergency"), get_str_arg(argc, argv, "--tile", ""));
      std::cerr << (ack.ok ? "OK: " : "FAILED: ") << ack.message << "\n";
      return ack.ok ? 0 : 1;
    }

    if (run_once || forced_phase) {
      const auto ack = forced_phase ? engine.run_phase(*forced_phase, at) : engine.trigger_once(at);
      std::cerr << (ack.ok ? "OK: " : "FAILED: ") << ack.message << "\n";
      return ack.ok ? 0 : 1;
    }

    // --serve
    std::signal(SIGINT, on_stop_signal);
    std::signal(SIGTERM, on_stop_signal);

    settlesim::CancellationToken token;
    std::atomic<bool> loop_done{false};
    std::thread watcher([&]() {
      while (!loop_done.load()) {
        if (g_stop_requested.load()) {
          settlesim::log::info("Stop requested, finishing the current pass");
          token.cancel();
          return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });

    try {
      engine.run(token);
    } catch (...) {
      loop_done.store(true);
      watcher.join();
      throw;
    }
    loop_done.store(true);
    watcher.join();
    return 0;
  } catch (const std::exception& e) {
    settlesim::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
