// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/slot_table.h"

#include "router/cluster/node_registry.h"
#include "router/cluster/slot_set.h"

using namespace std;

namespace kvr::cluster {

SlotTable::SlotTable(const NodeRegistry* registry)
    : registry_(registry), owner_(kNumSlots, kUnassigned) {
}

bool SlotTable::Assign(const SlotRange& range, uint32_t node_index) {
  if (!range.IsValid())
    return false;

  for (uint32_t i = range.start; i <= range.end; ++i) {
    if (owner_[i] != kUnassigned)
      return false;
  }

  for (uint32_t i = range.start; i <= range.end; ++i) {
    owner_[i] = node_index;
  }
  covered_ += range.end - range.start + 1;
  return true;
}

const NodeInfo* SlotTable::NodeForSlot(SlotId slot) const {
  if (slot > kMaxSlotNum || owner_[slot] == kUnassigned)
    return nullptr;
  return &registry_->At(owner_[slot]);
}

SlotRanges SlotTable::CoveredSlots() const {
  SlotSet slots;
  for (uint32_t i = 0; i < kNumSlots; ++i) {
    if (owner_[i] != kUnassigned)
      slots.Set(SlotId(i), true);
  }
  return slots.ToSlotRanges();
}

}  // namespace kvr::cluster
