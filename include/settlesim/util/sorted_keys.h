#pragma once

#include <algorithm>
#include <vector>

namespace settlesim::util {

// Settlement sub-tables are std::unordered_map. Their iteration order is not
// specified, so anything written to disk or emitted as events walks keys in
// sorted order instead.
template <typename Map>
inline std::vector<typename Map::key_type> sorted_keys(const Map& m) {
  std::vector<typename Map::key_type> keys;
  keys.reserve(m.size());
  for (const auto& kv : m) keys.push_back(kv.first);
  std::sort(keys.begin(), keys.end());
  return keys;
}

}  // namespace settlesim::util
