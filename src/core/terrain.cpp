#include "settlesim/core/terrain.h"

#include <algorithm>

#include "settlesim/core/errors.h"
#include "settlesim/util/file_io.h"
#include "settlesim/util/json.h"
#include "settlesim/util/log.h"
#include "settlesim/util/sorted_keys.h"

namespace settlesim {

void TileTable::add(Tile t) {
  for (double& q : t.quality.values) q = std::clamp(q, 0.0, 100.0);
  const std::string id = t.id;
  tiles_[id] = std::move(t);
}

const Tile* TileTable::find_tile(const std::string& tile_id) const {
  auto it = tiles_.find(tile_id);
  return it == tiles_.end() ? nullptr : &it->second;
}

std::vector<std::string> TileTable::ids() const {
  return util::sorted_keys(tiles_);
}

TileTable load_tiles_from_json(const std::string& json_text) {
  TileTable table;
  try {
    const auto root = json::parse(json_text);
    for (const auto& tv : root.at("tiles").array()) {
      Tile t;
      t.id = tv.at("id").string_value();
      if (t.id.empty()) throw ConfigurationError("Tiles: tile with empty id");
      if (const auto* p = tv.find("region_id")) t.region_id = p->string_value();
      t.biome = tv.at("biome").string_value();
      if (const auto* p = tv.find("plot_slots")) t.plot_slots = static_cast<int>(p->int_value());
      if (const auto* q = tv.find("quality")) {
        for (const auto& [k, v] : q->object()) {
          const auto r = resource_from_string(k);
          if (!r) throw ConfigurationError("Tiles: tile " + t.id + " has unknown resource '" + k + "'");
          t.quality[*r] = v.number_value();
        }
      }
      table.add(std::move(t));
    }
  } catch (const ConfigurationError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw ConfigurationError(std::string("Tiles: ") + e.what());
  }
  return table;
}

TileTable load_tiles_file(const std::string& path) {
  TileTable t = load_tiles_from_json(read_text_file(path));
  log::info("Loaded " + std::to_string(t.size()) + " tiles from " + path);
  return t;
}

} // namespace settlesim
