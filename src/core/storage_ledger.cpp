#include "settlesim/core/storage_ledger.h"

#include <algorithm>
#include <cmath>

#include "settlesim/util/log.h"

namespace settlesim {

double LedgerResult::total_waste() const {
  double sum = 0.0;
  for (double w : waste.values) sum += w;
  return sum;
}

LedgerResult apply_delta(const Storage& storage, const ResourceDelta& delta) {
  LedgerResult out;
  out.storage = storage;
  for (Resource r : kAllResources) {
    StorageSlot& slot = out.storage[r];
    const double cap = std::max(0.0, slot.capacity);
    double d = delta[r];
    if (!std::isfinite(d)) {
      log::warn(std::string("Ledger: non-finite delta for ") + resource_to_string(r) + " ignored");
      d = 0.0;
    }
    const double raw = slot.amount + d;
    out.waste[r] = std::max(0.0, raw - cap);
    slot.amount = std::clamp(raw, 0.0, cap);
  }
  return out;
}

ResourceTable<double> compute_storage_capacity(const Settlement& s, const StructureCatalog& catalog) {
  const double shared = catalog.sum_modifiers(s, kModStorageCapacity);
  ResourceTable<double> cap;
  for (Resource r : kAllResources) {
    cap[r] = std::max(0.0, catalog.base_storage_capacity + shared + catalog.sum_modifiers(s, kModResourceStorage, r));
  }
  return cap;
}

ResourceTable<double> set_capacity(Storage& storage, const ResourceTable<double>& capacity) {
  ResourceTable<double> waste;
  for (Resource r : kAllResources) {
    StorageSlot& slot = storage[r];
    slot.capacity = std::max(0.0, capacity[r]);
    if (slot.amount > slot.capacity) {
      waste[r] = slot.amount - slot.capacity;
      slot.amount = slot.capacity;
    }
  }
  return waste;
}

std::vector<StorageWarning> storage_warnings(const Storage& storage, double threshold) {
  std::vector<StorageWarning> out;
  for (Resource r : kAllResources) {
    const StorageSlot& slot = storage[r];
    if (slot.capacity <= 0.0) continue;
    const double fill = slot.amount / slot.capacity;
    if (fill > threshold) out.push_back(StorageWarning{r, slot.amount, slot.capacity, fill});
  }
  return out;
}

double hours_until_empty(double amount, double net_per_hour) {
  if (net_per_hour >= 0.0) return -1.0;
  return std::max(0.0, amount) / -net_per_hour;
}

std::vector<ShortageWarning> shortage_warnings(const Storage& storage, const ResourceDelta& net_per_hour,
                                               double buffer_hours) {
  std::vector<ShortageWarning> out;
  for (Resource r : kAllResources) {
    const double h = hours_until_empty(storage[r].amount, net_per_hour[r]);
    if (h < 0.0 || h >= buffer_hours) continue;
    out.push_back(ShortageWarning{r, storage[r].amount, net_per_hour[r], h});
  }
  return out;
}

} // namespace settlesim
