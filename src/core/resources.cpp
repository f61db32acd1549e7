#include "settlesim/core/resources.h"

#include <cmath>

#include "settlesim/util/strings.h"

namespace settlesim {

const char* resource_to_string(Resource r) {
  switch (r) {
    case Resource::Food: return "food";
    case Resource::Water: return "water";
    case Resource::Wood: return "wood";
    case Resource::Stone: return "stone";
    case Resource::Ore: return "ore";
  }
  return "food";
}

std::optional<Resource> resource_from_string(const std::string& s) {
  const std::string l = to_lower(s);
  for (Resource r : kAllResources) {
    if (l == resource_to_string(r)) return r;
  }
  return std::nullopt;
}

bool ResourceDelta::is_zero() const {
  for (double v : values) {
    if (v != 0.0) return false;
  }
  return true;
}

double ResourceDelta::total() const {
  double sum = 0.0;
  for (double v : values) sum += v;
  return sum;
}

ResourceDelta& ResourceDelta::operator+=(const ResourceDelta& o) {
  for (std::size_t i = 0; i < kResourceCount; ++i) values[i] += o.values[i];
  return *this;
}

ResourceDelta& ResourceDelta::operator-=(const ResourceDelta& o) {
  for (std::size_t i = 0; i < kResourceCount; ++i) values[i] -= o.values[i];
  return *this;
}

ResourceDelta& ResourceDelta::operator*=(double k) {
  for (double& v : values) v *= k;
  return *this;
}

ResourceDelta operator+(ResourceDelta a, const ResourceDelta& b) { return a += b; }
ResourceDelta operator-(ResourceDelta a, const ResourceDelta& b) { return a -= b; }
ResourceDelta operator*(ResourceDelta a, double k) { return a *= k; }

std::string describe_delta(const ResourceDelta& d) {
  std::string out;
  for (Resource r : kAllResources) {
    if (!out.empty()) out += ' ';
    out += resource_to_string(r);
    out += '=';
    const double v = d[r];
    if (v >= 0.0) out += '+';
    out += format_fixed(v, 2);
  }
  return out;
}

} // namespace settlesim
