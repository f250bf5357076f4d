// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/node_registry.h"

#include <glog/logging.h>

using namespace std;

namespace kvr::cluster {

size_t NodeRegistry::Add(NodeInfo node) {
  size_t index = nodes_.size();
  auto [it, inserted] = by_id_.emplace(node.id, index);
  DCHECK(inserted) << "duplicate node id " << node.id;
  by_address_.emplace(node.address(), index);
  nodes_.push_back(std::move(node));
  return index;
}

NodeInfo* NodeRegistry::MutableById(string_view id) {
  auto it = by_id_.find(id);
  return it == by_id_.end() ? nullptr : &nodes_[it->second];
}

size_t NodeRegistry::IndexOf(string_view id) const {
  auto it = by_id_.find(id);
  return it == by_id_.end() ? nodes_.size() : it->second;
}

vector<const NodeInfo*> NodeRegistry::Masters() const {
  vector<const NodeInfo*> res;
  for (const auto& node : nodes_) {
    if (node.IsMaster())
      res.push_back(&node);
  }
  return res;
}

vector<const NodeInfo*> NodeRegistry::ReplicasOf(string_view master_id) const {
  vector<const NodeInfo*> res;
  for (const auto& node : nodes_) {
    if (!node.IsMaster() && node.master_id == master_id)
      res.push_back(&node);
  }
  return res;
}

vector<const NodeInfo*> NodeRegistry::ActiveNodes() const {
  vector<const NodeInfo*> res;
  for (const auto& node : nodes_) {
    if (node.IsConnected())
      res.push_back(&node);
  }
  return res;
}

vector<const NodeInfo*> NodeRegistry::ActiveMasters() const {
  vector<const NodeInfo*> res;
  for (const auto& node : nodes_) {
    if (node.IsMaster() && node.IsConnected())
      res.push_back(&node);
  }
  return res;
}

const NodeInfo* NodeRegistry::LookupById(string_view id) const {
  auto it = by_id_.find(id);
  return it == by_id_.end() ? nullptr : &nodes_[it->second];
}

const NodeInfo* NodeRegistry::LookupByAddress(string_view host, uint16_t port) const {
  auto it = by_address_.find(NodeAddress{string(host), port});
  return it == by_address_.end() ? nullptr : &nodes_[it->second];
}

const NodeInfo* NodeRegistry::Lookup(const NodeInfo& node) const {
  if (!node.host.empty() && node.port != 0)
    return LookupByAddress(node.host, node.port);
  return LookupById(node.id);
}

}  // namespace kvr::cluster
