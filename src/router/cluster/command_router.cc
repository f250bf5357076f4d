// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/command_router.h"

#include <absl/container/flat_hash_map.h>
#include <absl/random/random.h>
#include <absl/strings/match.h>
#include <absl/synchronization/mutex.h>
#include <glog/logging.h>

#include "router/cluster/cross_slot_decomposer.h"
#include "router/cluster/topology_cache.h"
#include "router/command_spec.h"
#include "router/error.h"

using namespace std;
using facade::CmdArgList;
using facade::RespExpr;
using facade::RespVec;

namespace kvr::cluster {

namespace {

const NodeInfo* PickRandom(const vector<const NodeInfo*>& nodes) {
  if (nodes.empty())
    return nullptr;

  thread_local absl::InsecureBitGen bitgen;
  return nodes[absl::Uniform<size_t>(bitgen, 0, nodes.size())];
}

// Error replies end the race too.
bool IsWinningReply(const OpResult<RespExpr>& res) {
  return res && !res->IsNil();
}

vector<NodeInfo> CopyNodes(const vector<const NodeInfo*>& nodes) {
  vector<NodeInfo> res;
  res.reserve(nodes.size());
  for (const NodeInfo* node : nodes)
    res.push_back(*node);
  return res;
}

}  // namespace

CommandRouter::CommandRouter(ExecutionChannel* channel, TopologyCache* cache)
    : channel_(channel), cache_(cache), decomposer_(make_unique<CrossSlotDecomposer>(this)) {
}

CommandRouter::~CommandRouter() = default;

OpResult<TopologyPtr> CommandRouter::GetTopology() {
  return cache_->Get();
}

OpResult<NodeInfo> CommandRouter::ResolveNodeForKey(string_view key) {
  OpResult<TopologyPtr> topology = cache_->Get();
  RETURN_ON_BAD_STATUS(topology);

  SlotId slot = KeySlot(key);
  const NodeInfo* node = (*topology)->NodeForSlot(slot);
  if (!node) {
    LOG(WARNING) << "No node serves slot " << slot << " of key " << key;
    return OpStatus::UNRESOLVABLE_KEY;
  }
  return *node;
}

OpResult<vector<NodeInfo>> CommandRouter::ResolveNodesForSlot(SlotId slot) {
  OpResult<TopologyPtr> topology = cache_->Get();
  RETURN_ON_BAD_STATUS(topology);

  vector<const NodeInfo*> nodes = (*topology)->GetSlotServingNodes(slot);
  if (nodes.empty()) {
    LOG(WARNING) << "No node serves slot " << slot;
    return OpStatus::UNRESOLVABLE_KEY;
  }
  return CopyNodes(nodes);
}

OpResult<NodeKeyMap> CommandRouter::BuildNodeKeyMap(CmdArgList keys) {
  OpResult<TopologyPtr> topology = cache_->Get();
  RETURN_ON_BAD_STATUS(topology);

  NodeKeyMap res;
  absl::flat_hash_map<string_view, size_t> index;

  for (string_view key : keys) {
    const NodeInfo* node = (*topology)->NodeForKey(key);
    if (!node) {
      LOG(WARNING) << "No node serves slot " << KeySlot(key) << " of key " << key;
      return OpStatus::UNRESOLVABLE_KEY;
    }

    auto [it, inserted] = index.emplace(node->id, res.size());
    if (inserted)
      res.push_back(NodeKeys{*node, {}});
    res[it->second].keys.emplace_back(key);
  }

  return res;
}

OpResult<NodeInfo> CommandRouter::LookupNode(const NodeInfo& node) {
  OpResult<TopologyPtr> topology = cache_->Get();
  RETURN_ON_BAD_STATUS(topology);

  const NodeInfo* found = (*topology)->nodes().Lookup(node);
  if (!found) {
    LOG(WARNING) << "Node " << node.id << "@" << node.address() << " is not in the topology";
    return OpStatus::NODE_NOT_FOUND;
  }
  return *found;
}

OpStatus CommandRouter::CheckSupported(CmdArgList argv, bool has_route) const {
  if (argv.empty())
    return OpStatus::SYNTAX_ERR;

  uint32_t opts = CommandOptions(argv);
  if (opts & CO::NO_CLUSTER) {
    LOG(WARNING) << argv[0] << " is not supported in cluster mode";
    return OpStatus::UNSUPPORTED_IN_CLUSTER;
  }

  if (absl::EqualsIgnoreCase(argv[0], "SELECT") && (argv.size() < 2 || argv[1] != "0")) {
    LOG(WARNING) << "Only database 0 exists in cluster mode";
    return OpStatus::UNSUPPORTED_IN_CLUSTER;
  }

  if ((opts & CO::NODE_SCOPED) && !has_route) {
    LOG(WARNING) << argv[0] << " needs an explicit node route in cluster mode";
    return OpStatus::UNSUPPORTED_IN_CLUSTER;
  }

  return OpStatus::OK;
}

OpResult<RoutePlan> CommandRouter::PlanExplicit(const Route& route) {
  RoutePlan plan;
  plan.kind = RoutePlanKind::EXPLICIT_ROUTE;

  if (holds_alternative<DefaultRoute>(route)) {
    plan.kind = RoutePlanKind::DEFAULT_ROUTE;
    return plan;
  }

  if (const auto* addr_route = get_if<AddressRoute>(&route); addr_route) {
    const NodeAddress& addr = addr_route->address;
    NodeInfo node;
    node.host = addr.host;
    node.port = addr.port;

    // Address routes work without a topology, e.g. to reach a node that did not join yet.
    OpResult<TopologyPtr> topology = cache_->Get();
    const NodeInfo* known = topology ? (*topology)->nodes().LookupByAddress(addr.host, addr.port)
                                     : nullptr;
    if (known) {
      node = *known;
    } else {
      VLOG(1) << "Routing to " << addr << " which is not part of the topology";
      node.id = SynthesizeNodeId(addr.host, addr.port);
    }
    plan.targets.push_back(std::move(node));
    return plan;
  }

  OpResult<TopologyPtr> topology = cache_->Get();
  RETURN_ON_BAD_STATUS(topology);
  const Topology& topo = **topology;

  if (const auto* slot_route = get_if<SlotRoute>(&route); slot_route) {
    vector<const NodeInfo*> serving = topo.GetSlotServingNodes(slot_route->slot);
    if (serving.empty()) {
      LOG(WARNING) << "No node serves slot " << slot_route->slot;
      return OpStatus::UNRESOLVABLE_KEY;
    }

    const NodeInfo* target = serving.front();
    if (slot_route->replica && serving.size() > 1) {
      target = PickRandom(vector<const NodeInfo*>(serving.begin() + 1, serving.end()));
    }
    plan.targets.push_back(*target);
    return plan;
  }

  if (holds_alternative<RandomRoute>(route)) {
    const NodeInfo* target = PickRandom(topo.nodes().ActiveMasters());
    if (!target) {
      LOG(WARNING) << "Topology has no active masters";
      return OpStatus::NODE_NOT_FOUND;
    }
    plan.targets.push_back(*target);
    return plan;
  }

  const auto& broadcast = get<BroadcastRoute>(route);
  plan.broadcast = true;
  plan.targets = CopyNodes(broadcast.scope == BroadcastScope::ALL_PRIMARIES
                               ? topo.nodes().ActiveMasters()
                               : topo.nodes().ActiveNodes());
  if (plan.targets.empty()) {
    LOG(WARNING) << "Broadcast route " << RouteToString(route) << " matches no nodes";
    return OpStatus::NODE_NOT_FOUND;
  }
  return plan;
}

OpResult<RoutePlan> CommandRouter::Plan(CmdArgList argv, CmdArgList keys,
                                        const optional<Route>& route) {
  if (OpStatus st = CheckSupported(argv, route.has_value()); st != OpStatus::OK)
    return st;

  if (route)
    return PlanExplicit(*route);

  RoutePlan plan;
  if (keys.empty()) {
    plan.kind = RoutePlanKind::DEFAULT_ROUTE;
    return plan;
  }

  UniqueSlotChecker checker;
  for (string_view key : keys)
    checker.Add(key);

  optional<SlotId> slot = checker.GetUniqueSlotId();
  if (!slot) {
    plan.kind = RoutePlanKind::CROSS_SLOT;
    return plan;
  }

  OpResult<TopologyPtr> topology = cache_->Get();
  RETURN_ON_BAD_STATUS(topology);

  const NodeInfo* node = (*topology)->NodeForSlot(*slot);
  if (!node) {
    LOG(WARNING) << "No node serves slot " << *slot << " of key " << keys.front();
    return OpStatus::UNRESOLVABLE_KEY;
  }

  plan.kind = RoutePlanKind::SINGLE_NODE;
  plan.targets.push_back(*node);
  return plan;
}

OpResult<RoutedReply> CommandRouter::Execute(CmdArgList argv, CmdArgList keys,
                                             const optional<Route>& route) {
  OpResult<RoutePlan> plan = Plan(argv, keys, route);
  RETURN_ON_BAD_STATUS(plan);

  VLOG(1) << "Routing " << argv[0] << " plan " << int(plan->kind) << " to "
          << plan->targets.size() << " node(s)";

  OpResult<RoutedReply> res = ExecutePlan(*plan, argv);

  // Runs whether the command succeeded or not: a failed admin command may still have changed
  // the topology on some nodes.
  if (HasOpt(argv, CO::TOPOLOGY_MUTATING)) {
    cache_->Invalidate();
  }

  return res;
}

OpResult<RoutedReply> CommandRouter::ExecutePlan(const RoutePlan& plan, CmdArgList argv) {
  RoutedReply reply;
  reply.plan = plan.kind;

  switch (plan.kind) {
    case RoutePlanKind::DEFAULT_ROUTE: {
      OpResult<RespExpr> res = channel_->Execute(nullopt, argv);
      RETURN_ON_BAD_STATUS(res);
      reply.value = std::move(*res);
      return reply;
    }
    case RoutePlanKind::CROSS_SLOT: {
      OpResult<RespExpr> res = decomposer_->Execute(argv);
      RETURN_ON_BAD_STATUS(res);
      reply.value = std::move(*res);
      return reply;
    }
    case RoutePlanKind::SINGLE_NODE:
    case RoutePlanKind::EXPLICIT_ROUTE:
      break;
  }

  if (plan.broadcast)
    return ExecuteBroadcast(plan.targets, argv);

  DCHECK_EQ(plan.targets.size(), 1u);
  OpResult<RespExpr> res = ExecuteOnNode(plan.targets.front(), argv);
  RETURN_ON_BAD_STATUS(res);
  reply.value = std::move(*res);
  return reply;
}

OpResult<RoutedReply> CommandRouter::ExecuteBroadcast(const vector<NodeInfo>& targets,
                                                      CmdArgList argv) {
  vector<NodeRequest> requests;
  requests.reserve(targets.size());
  for (const NodeInfo& node : targets) {
    requests.push_back(NodeRequest{node, facade::ToOwned(argv)});
  }

  FanOutResult fan_out = FanOut(std::move(requests), FanOutMode::ALL);

  RoutedReply reply;
  reply.plan = RoutePlanKind::EXPLICIT_ROUTE;
  OpStatus first_failure = OpStatus::OK;

  for (size_t i = 0; i < targets.size(); ++i) {
    auto& res = fan_out.replies[i];
    if (IsNodeFailure(res)) {
      OpStatus st = res ? OpStatus::NODE_ERROR : res.status();
      LOG(WARNING) << argv[0] << " failed on " << targets[i].address() << ": "
                   << (res ? res->GetString() : string(facade::StatusToMsg(st)));
      if (first_failure == OpStatus::OK)
        first_failure = st;
      reply.failed_nodes.push_back(targets[i]);
      continue;
    }
    reply.node_replies.push_back(NodeReply{targets[i], std::move(*res)});
  }

  if (reply.node_replies.empty())
    return first_failure;

  bool read_aggregate = HasOpt(argv, CO::READ_AGGREGATE);
  if (!reply.failed_nodes.empty()) {
    if (!read_aggregate) {
      LOG(WARNING) << argv[0] << " failed on " << reply.failed_nodes.size() << " of "
                   << targets.size() << " nodes";
      return OpStatus::PARTIAL_FAILURE;
    }
    reply.outcome = Outcome::PARTIAL_FAILURE;
  }

  if (read_aggregate) {
    RespVec values;
    values.reserve(reply.node_replies.size());
    for (const auto& nr : reply.node_replies)
      values.push_back(nr.reply);
    reply.value = RespExpr::Array(std::move(values));
  } else {
    reply.value = reply.node_replies.front().reply;
  }

  return reply;
}

OpResult<RespExpr> CommandRouter::ExecuteOnNode(const NodeInfo& node, CmdArgList argv) {
  VLOG(2) << "Executing " << argv[0] << " on " << node.address();
  return channel_->Execute(node.address(), argv);
}

OpResult<RespExpr> CommandRouter::ExecuteOnKeyNode(string_view key, CmdArgList argv) {
  OpResult<NodeInfo> node = ResolveNodeForKey(key);
  RETURN_ON_BAD_STATUS(node);
  return ExecuteOnNode(*node, argv);
}

FanOutResult CommandRouter::FanOut(vector<NodeRequest> requests, FanOutMode mode) {
  struct State {
    absl::Mutex mu;
    vector<optional<OpResult<RespExpr>>> replies;
    vector<CancellationPtr> cancels;
    size_t pending = 0;
    optional<size_t> winner;
    bool done = false;
  };

  FanOutResult result;
  if (requests.empty())
    return result;

  auto state = make_shared<State>();
  state->replies.resize(requests.size());
  state->pending = requests.size();
  for (size_t i = 0; i < requests.size(); ++i) {
    state->cancels.push_back(make_shared<Cancellation>());
  }

  for (size_t i = 0; i < requests.size(); ++i) {
    auto cb = [state, i, mode](OpResult<RespExpr> res) {
      absl::MutexLock lk(&state->mu);
      --state->pending;

      if (mode == FanOutMode::FIRST_WINS && !state->winner && IsWinningReply(res)) {
        state->winner = i;
        for (size_t j = 0; j < state->cancels.size(); ++j) {
          if (j != i)
            state->cancels[j]->Cancel();
        }
        VLOG(2) << "Request " << i << " won, cancelled " << state->pending << " pending";
      }

      state->replies[i] = std::move(res);
      state->done = state->pending == 0 || state->winner.has_value();
    };

    channel_->Dispatch(requests[i].node.address(), std::move(requests[i].args), state->cancels[i],
                       std::move(cb));
  }

  absl::MutexLock lk(&state->mu);
  state->mu.Await(absl::Condition(&state->done));

  result.winner = state->winner;
  result.replies.reserve(state->replies.size());
  for (auto& reply : state->replies) {
    if (reply) {
      result.replies.push_back(std::move(*reply));
    } else {
      result.replies.push_back(OpStatus::CANCELLED);
    }
  }
  return result;
}

}  // namespace kvr::cluster
