// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "facade/op_status.h"
#include "router/cluster/cluster_defs.h"
#include "router/cluster/node_registry.h"
#include "router/cluster/slot_table.h"

namespace kvr::cluster {

class Topology;
using TopologyPtr = std::shared_ptr<const Topology>;

// Immutable snapshot of the cluster: which master serves each slot and which nodes exist.
// Readers share it through TopologyPtr; a refresh builds a new snapshot instead of mutating.
class Topology {
 public:
  // Fails with TOPOLOGY_PARSE_ERROR when entries are inconsistent: invalid or overlapping
  // ranges, a node id reused with a different address or role, or a replica listed under two
  // masters. Partial slot coverage is accepted.
  static facade::OpResult<TopologyPtr> Create(const std::vector<ClusterShardInfo>& shards);

  Topology(const Topology&) = delete;
  Topology& operator=(const Topology&) = delete;

  const SlotTable& slots() const {
    return slots_;
  }

  const NodeRegistry& nodes() const {
    return nodes_;
  }

  const NodeInfo* NodeForSlot(SlotId slot) const {
    return slots_.NodeForSlot(slot);
  }

  const NodeInfo* NodeForKey(std::string_view key) const {
    return slots_.NodeForSlot(SlotTable::SlotForKey(key));
  }

  // Master first, then its replicas. Empty if the slot is not served.
  std::vector<const NodeInfo*> GetSlotServingNodes(SlotId slot) const;

 private:
  Topology() : slots_(&nodes_) {
  }

  NodeRegistry nodes_;
  SlotTable slots_;
};

}  // namespace kvr::cluster
