#pragma once

#include <vector>

#include "settlesim/core/catalog.h"
#include "settlesim/core/entities.h"

namespace settlesim {

struct LedgerResult {
  Storage storage;

  // Amount that would have exceeded capacity, per resource (>= 0).
  ResourceTable<double> waste;

  double total_waste() const;
  bool has_waste() const { return total_waste() > 0.0; }
};

// Applies a signed delta to every resource:
//   raw = amount + delta; waste = max(0, raw - capacity); amount = clamp(raw, 0, capacity)
//
// Pure function: the caller commits the returned storage together with the rest of the
// settlement in one repository write, so a failure never leaves a partial update.
LedgerResult apply_delta(const Storage& storage, const ResourceDelta& delta);

// Capacity per resource: base capacity + "Storage Capacity" modifiers (all resources)
// + per-resource "Storage" modifiers.
ResourceTable<double> compute_storage_capacity(const Settlement& s, const StructureCatalog& catalog);

// Installs new capacities. Amounts above a shrunken capacity are clamped and the
// excess returned as waste.
ResourceTable<double> set_capacity(Storage& storage, const ResourceTable<double>& capacity);

struct StorageWarning {
  Resource resource{Resource::Food};
  double amount{0.0};
  double capacity{0.0};
  // amount / capacity
  double fill{0.0};
};

// Resources whose fill ratio is above `threshold` (default 90%).
std::vector<StorageWarning> storage_warnings(const Storage& storage, double threshold = 0.9);

struct ShortageWarning {
  Resource resource{Resource::Food};
  double amount{0.0};
  double net_per_hour{0.0};
  double hours_remaining{0.0};
};

// Hours until a resource at `amount` runs out with hourly change `net`.
// Returns a negative value when the resource is not draining.
double hours_until_empty(double amount, double net_per_hour);

// Draining resources expected to run out within `buffer_hours`.
std::vector<ShortageWarning> shortage_warnings(const Storage& storage, const ResourceDelta& net_per_hour,
                                               double buffer_hours = 1.0);

} // namespace settlesim
