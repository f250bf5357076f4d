// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/topology.h"

#include <glog/logging.h>

using namespace std;
using facade::OpResult;
using facade::OpStatus;

namespace kvr::cluster {

namespace {

constexpr string_view kInvalidTopologyPrefix = "Invalid cluster topology: "sv;

// Registers `node` or checks it against an already registered node with the same id.
// Returns the registry index or nullopt on conflict.
optional<size_t> RegisterNode(const NodeInfo& node, NodeRegistry* registry) {
  if (const NodeInfo* existing = registry->LookupById(node.id); existing) {
    if (existing->address() != node.address()) {
      LOG(WARNING) << kInvalidTopologyPrefix << "node " << node.id << " reported at "
                   << existing->address() << " and at " << node.address();
      return nullopt;
    }
    if (existing->role != node.role || existing->master_id != node.master_id) {
      LOG(WARNING) << kInvalidTopologyPrefix << "node " << node.id
                   << " reported with conflicting roles";
      return nullopt;
    }
    return registry->IndexOf(node.id);
  }

  if (const NodeInfo* other = registry->LookupByAddress(node.host, node.port); other) {
    LOG(WARNING) << kInvalidTopologyPrefix << "address " << node.address()
                 << " is reported by both " << other->id << " and " << node.id;
    return nullopt;
  }

  NodeInfo entry = node;
  entry.slot_ranges = SlotRanges{};
  return registry->Add(std::move(entry));
}

}  // namespace

/* static */
OpResult<TopologyPtr> Topology::Create(const vector<ClusterShardInfo>& shards) {
  shared_ptr<Topology> result(new Topology());

  for (const auto& shard : shards) {
    const SlotRange& range = shard.slot_range;
    if (!range.IsValid()) {
      LOG(WARNING) << kInvalidTopologyPrefix << "invalid slot range " << range.ToString();
      return OpStatus::TOPOLOGY_PARSE_ERROR;
    }

    NodeInfo master = shard.master;
    master.role = NodeRole::MASTER;
    master.master_id.clear();

    optional<size_t> master_index = RegisterNode(master, &result->nodes_);
    if (!master_index)
      return OpStatus::TOPOLOGY_PARSE_ERROR;

    if (!result->slots_.Assign(range, *master_index)) {
      LOG(WARNING) << kInvalidTopologyPrefix << "slot range " << range.ToString()
                   << " overlaps a range that was already assigned";
      return OpStatus::TOPOLOGY_PARSE_ERROR;
    }

    result->nodes_.MutableById(master.id)->slot_ranges.Merge(SlotRanges({range}));

    for (const auto& replica : shard.replicas) {
      NodeInfo entry = replica;
      entry.role = NodeRole::REPLICA;
      entry.master_id = master.id;
      if (!RegisterNode(entry, &result->nodes_))
        return OpStatus::TOPOLOGY_PARSE_ERROR;
    }
  }

  VLOG(1) << "Created topology with " << result->nodes_.size() << " nodes covering "
          << result->slots_.CoveredCount() << " slots";

  return TopologyPtr(std::move(result));
}

vector<const NodeInfo*> Topology::GetSlotServingNodes(SlotId slot) const {
  vector<const NodeInfo*> res;
  const NodeInfo* master = slots_.NodeForSlot(slot);
  if (!master)
    return res;

  res.push_back(master);
  for (const NodeInfo* replica : nodes_.ReplicasOf(master->id)) {
    res.push_back(replica);
  }
  return res;
}

}  // namespace kvr::cluster
