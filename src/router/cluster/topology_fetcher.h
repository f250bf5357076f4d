// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <vector>

#include "facade/resp_expr.h"
#include "router/cluster/topology.h"

namespace kvr {
class ExecutionChannel;
}  // namespace kvr

namespace kvr::cluster {

// Queries CLUSTER SLOTS and turns the reply into a Topology snapshot.
class TopologyFetcher {
 public:
  explicit TopologyFetcher(ExecutionChannel* channel) : channel_(channel) {
  }

  // Runs CLUSTER SLOTS on the channel's default node. Transport failures and error replies
  // are propagated, a malformed reply fails with TOPOLOGY_PARSE_ERROR.
  facade::OpResult<TopologyPtr> Fetch() const;

  // Parses [[start, end, [host, port, id?, ...], [replica]...], ...]. Any malformed entry fails
  // the whole reply. A missing or empty id is replaced with "host:port".
  static facade::OpResult<std::vector<ClusterShardInfo>> ParseClusterSlots(
      const facade::RespExpr& reply);

  static facade::OpResult<TopologyPtr> ParseTopology(const facade::RespExpr& reply);

 private:
  ExecutionChannel* channel_;
};

}  // namespace kvr::cluster
