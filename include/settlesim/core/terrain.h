#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "settlesim/core/resources.h"

namespace settlesim {

// Read-only tile data supplied by the world/terrain service.
struct Tile {
  std::string id;
  std::string region_id;
  std::string biome;

  // 0..100 per resource; 0 means the resource is absent on this tile.
  ResourceTable<double> quality;

  int plot_slots{0};
};

// Read-only lookup into world tiles. Implementations must be safe to call from
// several worker threads at once.
class TerrainProvider {
 public:
  virtual ~TerrainProvider() = default;

  // nullptr when the tile is unknown.
  virtual const Tile* find_tile(const std::string& tile_id) const = 0;
};

// Immutable in-memory tile table (loaded once, shared by workers).
class TileTable : public TerrainProvider {
 public:
  TileTable() = default;

  void add(Tile t);
  std::size_t size() const { return tiles_.size(); }

  // Sorted tile ids.
  std::vector<std::string> ids() const;

  const Tile* find_tile(const std::string& tile_id) const override;

 private:
  std::unordered_map<std::string, Tile> tiles_;
};

// Document shape: {"tiles": [{"id": "...", "region_id": "...", "biome": "FOREST",
//                             "quality": {"food": 60, ...}, "plot_slots": 6}, ...]}
// Throws ConfigurationError on malformed input.
TileTable load_tiles_from_json(const std::string& json_text);
TileTable load_tiles_file(const std::string& path);

} // namespace settlesim
