// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

#include "router/cluster/cluster_defs.h"

namespace kvr::cluster {

class NodeRegistry;

// Maps every hash slot to the master serving it. Slots may be unassigned while the cluster
// is being configured or resharded.
class SlotTable {
 public:
  explicit SlotTable(const NodeRegistry* registry);

  SlotTable(const SlotTable&) = delete;
  SlotTable& operator=(const SlotTable&) = delete;

  // Assigns the range to the node at `node_index` in the registry.
  // Returns false if any slot of the range is already assigned.
  bool Assign(const SlotRange& range, uint32_t node_index);

  // Returns nullptr if no master serves the slot.
  const NodeInfo* NodeForSlot(SlotId slot) const;

  static SlotId SlotForKey(std::string_view key) {
    return KeySlot(key);
  }

  size_t CoveredCount() const {
    return covered_;
  }

  bool IsComplete() const {
    return covered_ == kNumSlots;
  }

  SlotRanges CoveredSlots() const;

 private:
  static constexpr uint32_t kUnassigned = std::numeric_limits<uint32_t>::max();

  const NodeRegistry* registry_;
  std::vector<uint32_t> owner_;
  size_t covered_ = 0;
};

}  // namespace kvr::cluster
