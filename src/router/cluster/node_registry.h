// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/container/flat_hash_map.h>

#include <string>
#include <string_view>
#include <vector>

#include "router/cluster/cluster_defs.h"

namespace kvr::cluster {

// Set of nodes known from one topology fetch. Node pointers stay valid for the lifetime of the
// registry, nodes are never removed.
class NodeRegistry {
 public:
  NodeRegistry() = default;
  NodeRegistry(const NodeRegistry&) = delete;
  NodeRegistry& operator=(const NodeRegistry&) = delete;

  // Returns the index of the added node. The caller makes sure both id and address are unique.
  size_t Add(NodeInfo node);

  NodeInfo* MutableById(std::string_view id);

  const NodeInfo& At(size_t index) const {
    return nodes_[index];
  }

  size_t IndexOf(std::string_view id) const;

  const std::vector<NodeInfo>& AllNodes() const {
    return nodes_;
  }

  std::vector<const NodeInfo*> Masters() const;
  std::vector<const NodeInfo*> ReplicasOf(std::string_view master_id) const;

  // Nodes whose link state is CONNECTED.
  std::vector<const NodeInfo*> ActiveNodes() const;
  std::vector<const NodeInfo*> ActiveMasters() const;

  const NodeInfo* LookupById(std::string_view id) const;
  const NodeInfo* LookupByAddress(std::string_view host, uint16_t port) const;

  // Looks up by address when the node carries one, otherwise by id.
  const NodeInfo* Lookup(const NodeInfo& node) const;

  size_t size() const {
    return nodes_.size();
  }

  bool empty() const {
    return nodes_.empty();
  }

 private:
  std::vector<NodeInfo> nodes_;
  absl::flat_hash_map<std::string, size_t> by_id_;
  absl::flat_hash_map<NodeAddress, size_t> by_address_;
};

}  // namespace kvr::cluster
