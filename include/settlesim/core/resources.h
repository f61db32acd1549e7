#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace settlesim {

enum class Resource { Food = 0, Water, Wood, Stone, Ore };

constexpr std::size_t kResourceCount = 5;

constexpr std::array<Resource, kResourceCount> kAllResources = {
    Resource::Food, Resource::Water, Resource::Wood, Resource::Stone, Resource::Ore};

constexpr std::size_t resource_index(Resource r) { return static_cast<std::size_t>(r); }

// Lower-case wire names: "food", "water", "wood", "stone", "ore".
const char* resource_to_string(Resource r);

// Accepts the wire names and their upper-case catalog spelling ("FOOD").
std::optional<Resource> resource_from_string(const std::string& s);

// Fixed-size table keyed by Resource. Every per-resource computation in the
// engine goes through this type, so clamp/waste logic is written once.
template <typename T>
struct ResourceTable {
  std::array<T, kResourceCount> values{};

  T& operator[](Resource r) { return values[resource_index(r)]; }
  const T& operator[](Resource r) const { return values[resource_index(r)]; }

  static ResourceTable filled(const T& v) {
    ResourceTable t;
    t.values.fill(v);
    return t;
  }
};

// Signed per-resource amounts used to hand production/consumption into the ledger.
struct ResourceDelta : ResourceTable<double> {
  bool is_zero() const;
  double total() const;

  ResourceDelta& operator+=(const ResourceDelta& o);
  ResourceDelta& operator-=(const ResourceDelta& o);
  ResourceDelta& operator*=(double k);
};

ResourceDelta operator+(ResourceDelta a, const ResourceDelta& b);
ResourceDelta operator-(ResourceDelta a, const ResourceDelta& b);
ResourceDelta operator*(ResourceDelta a, double k);

// "food=+10.00 water=-3.50 ..." for log lines.
std::string describe_delta(const ResourceDelta& d);

} // namespace settlesim
