#include "settlesim/core/entities.h"

namespace settlesim {

std::string allocate_local_id(Settlement& s, const std::string& prefix) {
  if (s.next_local_id == 0) s.next_local_id = 1;
  return prefix + "-" + std::to_string(s.next_local_id++);
}

StructureInstance* find_structure(Settlement& s, const std::string& structure_id) {
  for (auto& st : s.structures) {
    if (st.id == structure_id) return &st;
  }
  return nullptr;
}

const StructureInstance* find_structure(const Settlement& s, const std::string& structure_id) {
  for (const auto& st : s.structures) {
    if (st.id == structure_id) return &st;
  }
  return nullptr;
}

int count_structures(const Settlement& s, const std::string& type) {
  int n = 0;
  for (const auto& st : s.structures) {
    if (st.type == type && st.health > 0.0) ++n;
  }
  return n;
}

const StructureInstance* best_structure(const Settlement& s, const std::string& type) {
  const StructureInstance* best = nullptr;
  for (const auto& st : s.structures) {
    if (st.type != type || st.health <= 0.0) continue;
    if (!best || st.level > best->level) best = &st;
  }
  return best;
}

DisasterPhase current_disaster_phase(const Settlement& s) {
  if (!s.active_disaster) return DisasterPhase::Idle;
  return s.active_disaster->phase;
}

} // namespace settlesim
