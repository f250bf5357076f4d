// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/topology_fetcher.h"

#include <glog/logging.h>

#include <optional>
#include <string_view>

#include "router/execution_channel.h"

using namespace std;
using facade::OpResult;
using facade::OpStatus;
using facade::RespExpr;
using facade::RespVec;

namespace kvr::cluster {

namespace {

constexpr string_view kInvalidSlotsPrefix = "Invalid CLUSTER SLOTS reply: "sv;

optional<SlotId> ReadSlot(const RespExpr& expr) {
  optional<int64_t> val = expr.GetInt();
  if (expr.type != RespExpr::INT64 || !val) {
    LOG(WARNING) << kInvalidSlotsPrefix << "slot is not an integer " << expr;
    return nullopt;
  }

  if (*val < 0 || *val > SlotRange::kMaxSlotId) {
    LOG(WARNING) << kInvalidSlotsPrefix << "slot " << *val << " is out of range";
    return nullopt;
  }
  return SlotId(*val);
}

optional<NodeInfo> ReadNode(const RespExpr& expr) {
  if (expr.type != RespExpr::ARRAY || expr.GetVec().size() < 2) {
    LOG(WARNING) << kInvalidSlotsPrefix << "node info must be an array of at least 2 elements "
                 << expr;
    return nullopt;
  }

  const RespVec& vec = expr.GetVec();
  if (vec[0].type != RespExpr::STRING || vec[0].GetView().empty()) {
    LOG(WARNING) << kInvalidSlotsPrefix << "invalid node host " << vec[0];
    return nullopt;
  }

  optional<int64_t> port = vec[1].GetInt();
  if (vec[1].type != RespExpr::INT64 || !port || *port <= 0 || *port > UINT16_MAX) {
    LOG(WARNING) << kInvalidSlotsPrefix << "invalid node port " << vec[1];
    return nullopt;
  }

  NodeInfo node;
  node.host = vec[0].GetString();
  node.port = uint16_t(*port);
  node.link_state = LinkState::CONNECTED;

  if (vec.size() > 2 && vec[2].type == RespExpr::STRING) {
    node.id = vec[2].GetString();
  } else if (vec.size() > 2 && vec[2].type != RespExpr::NIL) {
    LOG(WARNING) << kInvalidSlotsPrefix << "invalid node id " << vec[2];
    return nullopt;
  }

  if (node.id.empty()) {
    node.id = SynthesizeNodeId(node.host, node.port);
  }

  return node;
}

}  // namespace

OpResult<TopologyPtr> TopologyFetcher::Fetch() const {
  const string_view cmd[] = {"CLUSTER", "SLOTS"};
  OpResult<RespExpr> reply = channel_->Execute(nullopt, cmd);
  if (!reply) {
    LOG(WARNING) << "Failed to query cluster topology: " << reply.status();
    return reply.status();
  }

  if (reply->IsError()) {
    LOG(WARNING) << "Cluster topology query failed: " << reply->GetView();
    return OpStatus::NODE_ERROR;
  }

  return ParseTopology(*reply);
}

/* static */
OpResult<vector<ClusterShardInfo>> TopologyFetcher::ParseClusterSlots(const RespExpr& reply) {
  if (reply.type != RespExpr::ARRAY) {
    if (reply.type == RespExpr::NIL_ARRAY)
      return vector<ClusterShardInfo>{};

    LOG(WARNING) << kInvalidSlotsPrefix << "reply is not an array " << reply;
    return OpStatus::TOPOLOGY_PARSE_ERROR;
  }

  vector<ClusterShardInfo> shards;
  shards.reserve(reply.GetVec().size());

  for (const RespExpr& entry : reply.GetVec()) {
    if (entry.type != RespExpr::ARRAY || entry.GetVec().size() < 3) {
      LOG(WARNING) << kInvalidSlotsPrefix << "slot entry must be an array of at least 3 elements "
                   << entry;
      return OpStatus::TOPOLOGY_PARSE_ERROR;
    }

    const RespVec& vec = entry.GetVec();
    optional<SlotId> start = ReadSlot(vec[0]);
    optional<SlotId> end = ReadSlot(vec[1]);
    if (!start || !end)
      return OpStatus::TOPOLOGY_PARSE_ERROR;

    if (*start > *end) {
      LOG(WARNING) << kInvalidSlotsPrefix << "start=" << *start << " is larger than end=" << *end;
      return OpStatus::TOPOLOGY_PARSE_ERROR;
    }

    ClusterShardInfo shard;
    shard.slot_range = SlotRange{*start, *end};

    optional<NodeInfo> master = ReadNode(vec[2]);
    if (!master)
      return OpStatus::TOPOLOGY_PARSE_ERROR;
    shard.master = std::move(*master);

    for (size_t i = 3; i < vec.size(); ++i) {
      optional<NodeInfo> replica = ReadNode(vec[i]);
      if (!replica)
        return OpStatus::TOPOLOGY_PARSE_ERROR;
      replica->role = NodeRole::REPLICA;
      replica->master_id = shard.master.id;
      shard.replicas.push_back(std::move(*replica));
    }

    shards.push_back(std::move(shard));
  }

  return shards;
}

/* static */
OpResult<TopologyPtr> TopologyFetcher::ParseTopology(const RespExpr& reply) {
  OpResult<vector<ClusterShardInfo>> shards = ParseClusterSlots(reply);
  if (!shards)
    return shards.status();

  return Topology::Create(*shards);
}

}  // namespace kvr::cluster
