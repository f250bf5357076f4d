// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "facade/facade_types.h"
#include "facade/resp_expr.h"
#include "router/cluster/topology.h"
#include "router/execution_channel.h"

namespace kvr::cluster {

class CrossSlotDecomposer;
class TopologyCache;

// Keys of one request grouped by the master serving them, in order of first appearance.
struct NodeKeys {
  NodeInfo node;
  std::vector<std::string> keys;
};

using NodeKeyMap = std::vector<NodeKeys>;

struct NodeReply {
  NodeInfo node;
  facade::RespExpr reply;
};

struct NodeRequest {
  NodeInfo node;
  facade::OwnedArgs args;
};

enum class FanOutMode : uint8_t {
  ALL,         // Wait for every node.
  FIRST_WINS,  // Stop at the first non-nil reply, errors included, and cancel the rest.
};

struct FanOutResult {
  // Aligned with the requests. Requests cancelled after a winner was found report CANCELLED.
  std::vector<facade::OpResult<facade::RespExpr>> replies;
  std::optional<size_t> winner;
};

enum class RoutePlanKind : uint8_t { SINGLE_NODE, CROSS_SLOT, EXPLICIT_ROUTE, DEFAULT_ROUTE };

struct RoutePlan {
  RoutePlanKind kind = RoutePlanKind::DEFAULT_ROUTE;

  // SINGLE_NODE: the master serving the slot. EXPLICIT_ROUTE: every node the route expands to.
  std::vector<NodeInfo> targets;
  bool broadcast = false;
};

enum class Outcome : uint8_t { SUCCESS, PARTIAL_FAILURE };

struct RoutedReply {
  RoutePlanKind plan = RoutePlanKind::DEFAULT_ROUTE;
  Outcome outcome = Outcome::SUCCESS;

  // The reply of the node for single target plans, the reassembled reply for cross slot
  // commands. For broadcasts: the first reply of a write broadcast, or an array of the
  // successful replies of a read aggregation.
  facade::RespExpr value;

  // Broadcasts only.
  std::vector<NodeReply> node_replies;
  std::vector<NodeInfo> failed_nodes;
};

// Decides where each command goes and executes it there. Commands with keys go to the master
// serving their slot, keys spanning several slots are handed to CrossSlotDecomposer, explicit
// routes win over keys and keyless commands use the channel default node.
class CommandRouter {
 public:
  CommandRouter(ExecutionChannel* channel, TopologyCache* cache);
  ~CommandRouter();

  CommandRouter(const CommandRouter&) = delete;
  CommandRouter& operator=(const CommandRouter&) = delete;

  facade::OpResult<TopologyPtr> GetTopology();

  // Master serving the slot of the key. UNRESOLVABLE_KEY if the slot is not served.
  facade::OpResult<NodeInfo> ResolveNodeForKey(std::string_view key);

  // Master first, then replicas.
  facade::OpResult<std::vector<NodeInfo>> ResolveNodesForSlot(SlotId slot);

  // Fails with UNRESOLVABLE_KEY unless every key resolves.
  facade::OpResult<NodeKeyMap> BuildNodeKeyMap(facade::CmdArgList keys);

  // Finds a node of the current topology by address, or by id when no address is set.
  facade::OpResult<NodeInfo> LookupNode(const NodeInfo& node);

  facade::OpResult<RoutePlan> Plan(facade::CmdArgList argv, facade::CmdArgList keys,
                                   const std::optional<Route>& route);

  // `argv` is the full command, `keys` the key arguments the command touches.
  facade::OpResult<RoutedReply> Execute(facade::CmdArgList argv, facade::CmdArgList keys = {},
                                        const std::optional<Route>& route = std::nullopt);

  // Runs the command on `node` without looking at keys or topology.
  facade::OpResult<facade::RespExpr> ExecuteOnNode(const NodeInfo& node, facade::CmdArgList argv);

  // Runs the command on the master serving the key.
  facade::OpResult<facade::RespExpr> ExecuteOnKeyNode(std::string_view key,
                                                      facade::CmdArgList argv);

  // Dispatches all requests in parallel.
  FanOutResult FanOut(std::vector<NodeRequest> requests, FanOutMode mode);

  CrossSlotDecomposer* decomposer() {
    return decomposer_.get();
  }

  TopologyCache* cache() {
    return cache_;
  }

 private:
  facade::OpStatus CheckSupported(facade::CmdArgList argv, bool has_route) const;
  facade::OpResult<RoutePlan> PlanExplicit(const Route& route);
  facade::OpResult<RoutedReply> ExecutePlan(const RoutePlan& plan, facade::CmdArgList argv);
  facade::OpResult<RoutedReply> ExecuteBroadcast(const std::vector<NodeInfo>& targets,
                                                 facade::CmdArgList argv);

  ExecutionChannel* channel_;
  TopologyCache* cache_;
  std::unique_ptr<CrossSlotDecomposer> decomposer_;
};

// True for transport failures and error replies.
inline bool IsNodeFailure(const facade::OpResult<facade::RespExpr>& res) {
  return !res || res->IsError();
}

}  // namespace kvr::cluster
