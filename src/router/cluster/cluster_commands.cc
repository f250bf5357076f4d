// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/cluster_commands.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <glog/logging.h>

#include "router/cluster/topology_cache.h"
#include "router/error.h"

using namespace std;
using facade::CmdArgList;
using facade::CmdArgVec;
using facade::OwnedArgs;
using facade::RespExpr;
using facade::RespVec;

namespace kvr::cluster {

namespace {

constexpr string_view kSetSlotModes[] = {"IMPORTING", "MIGRATING", "NODE", "STABLE"};

OpResult<vector<string>> ReplyToStrings(const OpResult<RespExpr>& reply) {
  RETURN_ON_BAD_STATUS(reply);
  if (reply->IsError()) {
    LOG(WARNING) << "Node replied " << reply->GetView();
    return OpStatus::NODE_ERROR;
  }

  vector<string> res;
  if (reply->IsNil())
    return res;

  if (reply->type != RespExpr::ARRAY)
    return OpStatus::INVALID_VALUE;

  for (const RespExpr& e : reply->GetVec()) {
    if (e.type != RespExpr::STRING)
      return OpStatus::INVALID_VALUE;
    res.push_back(e.GetString());
  }
  return res;
}

OpResult<int64_t> ReplyToInt(const OpResult<RespExpr>& reply) {
  RETURN_ON_BAD_STATUS(reply);
  if (reply->IsError()) {
    LOG(WARNING) << "Node replied " << reply->GetView();
    return OpStatus::NODE_ERROR;
  }

  optional<int64_t> val = reply->GetInt();
  if (!val)
    return OpStatus::INVALID_INT;
  return *val;
}

OpResult<StringMap> PairsToMap(const OpResult<RespExpr>& reply) {
  OpResult<vector<string>> items = ReplyToStrings(reply);
  RETURN_ON_BAD_STATUS(items);
  if (items->size() % 2 != 0)
    return OpStatus::INVALID_VALUE;

  StringMap res;
  for (size_t i = 0; i < items->size(); i += 2)
    res[(*items)[i]] = (*items)[i + 1];
  return res;
}

OpResult<StringMap> InfoToMap(const OpResult<RespExpr>& reply) {
  RETURN_ON_BAD_STATUS(reply);
  if (reply->type != RespExpr::STRING) {
    LOG(WARNING) << "Unexpected INFO reply " << *reply;
    return reply->IsError() ? OpStatus::NODE_ERROR : OpStatus::INVALID_VALUE;
  }
  return ParseInfoLines(reply->GetView());
}

// Converts a broadcast reply to per node maps prefixed with the node address.
OpResult<ClusterCommands::Aggregated> Aggregate(
    const OpResult<RoutedReply>& routed,
    OpResult<StringMap> (*convert)(const OpResult<RespExpr>&)) {
  RETURN_ON_BAD_STATUS(routed);

  ClusterCommands::Aggregated res;
  res.failed_nodes = routed->failed_nodes;

  for (const NodeReply& nr : routed->node_replies) {
    OpResult<StringMap> values = convert(nr.reply);
    if (!values) {
      LOG(WARNING) << "Failed to parse reply of " << nr.node.address();
      res.failed_nodes.push_back(nr.node);
      continue;
    }

    string prefix = nr.node.address().ToString();
    for (const auto& [k, v] : *values)
      res.values[absl::StrCat(prefix, ".", k)] = v;
  }
  return res;
}

}  // namespace

StringMap ParseInfoLines(string_view text) {
  StringMap res;
  for (string_view line : absl::StrSplit(text, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty() || line.front() == '#')
      continue;

    size_t pos = line.find(':');
    if (pos == string_view::npos)
      continue;
    res[string(line.substr(0, pos))] = string(line.substr(pos + 1));
  }
  return res;
}

OpResult<RespExpr> ClusterCommands::OnNode(const NodeInfo& node, CmdArgList argv) {
  OpResult<RoutedReply> res = router_->Execute(argv, {}, AddressRoute{node.address()});
  RETURN_ON_BAD_STATUS(res);
  return std::move(res->value);
}

OpResult<RespExpr> ClusterCommands::SlotsCommand(string_view subcmd, const NodeInfo& node,
                                                 vector<string> args) {
  CmdArgVec argv{"CLUSTER", subcmd};
  argv.insert(argv.end(), args.begin(), args.end());
  return OnNode(node, argv);
}

OpResult<RespExpr> ClusterCommands::AddSlots(const NodeInfo& node, absl::Span<const SlotId> slots) {
  vector<string> args;
  for (SlotId slot : slots)
    args.push_back(absl::StrCat(slot));
  return SlotsCommand("ADDSLOTS", node, std::move(args));
}

OpResult<RespExpr> ClusterCommands::AddSlotsInRange(const NodeInfo& node, const SlotRange& range) {
  return SlotsCommand("ADDSLOTSRANGE", node,
                      {absl::StrCat(range.start), absl::StrCat(range.end)});
}

OpResult<RespExpr> ClusterCommands::DeleteSlots(const NodeInfo& node,
                                                absl::Span<const SlotId> slots) {
  vector<string> args;
  for (SlotId slot : slots)
    args.push_back(absl::StrCat(slot));
  return SlotsCommand("DELSLOTS", node, std::move(args));
}

OpResult<RespExpr> ClusterCommands::DeleteSlotsInRange(const NodeInfo& node,
                                                       const SlotRange& range) {
  return SlotsCommand("DELSLOTSRANGE", node,
                      {absl::StrCat(range.start), absl::StrCat(range.end)});
}

OpResult<RespExpr> ClusterCommands::SetSlot(const NodeInfo& node, SlotId slot, SetSlotMode mode,
                                            const optional<NodeInfo>& target) {
  vector<string> args{absl::StrCat(slot), string(kSetSlotModes[int(mode)])};

  if (mode != SetSlotMode::STABLE) {
    if (!target) {
      LOG(WARNING) << "CLUSTER SETSLOT " << kSetSlotModes[int(mode)] << " needs a target node";
      return OpStatus::SYNTAX_ERR;
    }

    OpResult<NodeInfo> resolved = router_->LookupNode(*target);
    RETURN_ON_BAD_STATUS(resolved);
    args.push_back(resolved->id);
  }

  return SlotsCommand("SETSLOT", node, std::move(args));
}

OpResult<RespExpr> ClusterCommands::ForgetNode(const NodeInfo& node) {
  OpResult<NodeInfo> forgotten = router_->LookupNode(node);
  RETURN_ON_BAD_STATUS(forgotten);

  OpResult<TopologyPtr> topology = router_->GetTopology();
  RETURN_ON_BAD_STATUS(topology);

  vector<NodeRequest> requests;
  for (const NodeInfo* master : (*topology)->nodes().ActiveMasters()) {
    if (master->id == forgotten->id)
      continue;
    requests.push_back(NodeRequest{*master, {"CLUSTER", "FORGET", forgotten->id}});
  }

  if (requests.empty()) {
    LOG(WARNING) << "No masters left to forget " << forgotten->id;
    return OpStatus::NODE_NOT_FOUND;
  }

  size_t total = requests.size();
  FanOutResult fan_out = router_->FanOut(std::move(requests), FanOutMode::ALL);
  router_->cache()->Invalidate();

  size_t failed = 0;
  OpResult<RespExpr> first_failure = OpStatus::OK;
  for (auto& res : fan_out.replies) {
    if (IsNodeFailure(res)) {
      if (failed++ == 0)
        first_failure = std::move(res);
    }
  }

  if (failed == 0)
    return RespExpr::Ok();

  LOG(WARNING) << "CLUSTER FORGET " << forgotten->id << " failed on " << failed << " of " << total
               << " masters";
  if (failed < total)
    return OpStatus::PARTIAL_FAILURE;
  return first_failure;
}

OpResult<RespExpr> ClusterCommands::MeetNode(string_view host, uint16_t port) {
  string port_str = absl::StrCat(port);
  const string_view argv[] = {"CLUSTER", "MEET", host, port_str};
  OpResult<RoutedReply> res = router_->Execute(argv, {}, AllPrimaries());
  RETURN_ON_BAD_STATUS(res);
  return std::move(res->value);
}

OpResult<RespExpr> ClusterCommands::Replicate(const NodeInfo& master, const NodeInfo& replica) {
  OpResult<NodeInfo> resolved = router_->LookupNode(master);
  RETURN_ON_BAD_STATUS(resolved);
  return SlotsCommand("REPLICATE", replica, {resolved->id});
}

OpResult<NodeInfo> ClusterCommands::GetNodeForSlot(SlotId slot) {
  OpResult<vector<NodeInfo>> nodes = router_->ResolveNodesForSlot(slot);
  RETURN_ON_BAD_STATUS(nodes);
  return nodes->front();
}

OpResult<NodeInfo> ClusterCommands::GetNodeForKey(string_view key) {
  return router_->ResolveNodeForKey(key);
}

OpResult<vector<NodeInfo>> ClusterCommands::GetNodes() {
  OpResult<TopologyPtr> topology = router_->GetTopology();
  RETURN_ON_BAD_STATUS(topology);
  return (*topology)->nodes().AllNodes();
}

OpResult<vector<NodeInfo>> ClusterCommands::GetReplicas(const NodeInfo& master) {
  OpResult<TopologyPtr> topology = router_->GetTopology();
  RETURN_ON_BAD_STATUS(topology);

  const NodeInfo* found = (*topology)->nodes().Lookup(master);
  if (!found || !found->IsMaster()) {
    LOG(WARNING) << master.address() << " is not a master of the cluster";
    return OpStatus::NODE_NOT_FOUND;
  }

  vector<NodeInfo> res;
  for (const NodeInfo* replica : (*topology)->nodes().ReplicasOf(found->id))
    res.push_back(*replica);
  return res;
}

OpResult<vector<pair<NodeInfo, vector<NodeInfo>>>> ClusterCommands::GetMasterReplicaMap() {
  OpResult<TopologyPtr> topology = router_->GetTopology();
  RETURN_ON_BAD_STATUS(topology);

  const NodeRegistry& nodes = (*topology)->nodes();
  vector<pair<NodeInfo, vector<NodeInfo>>> res;
  for (const NodeInfo* master : nodes.Masters()) {
    vector<NodeInfo> replicas;
    for (const NodeInfo* replica : nodes.ReplicasOf(master->id))
      replicas.push_back(*replica);
    res.emplace_back(*master, std::move(replicas));
  }
  return res;
}

OpResult<int64_t> ClusterCommands::CountKeysInSlot(SlotId slot) {
  string slot_str = absl::StrCat(slot);
  const string_view argv[] = {"CLUSTER", "COUNTKEYSINSLOT", slot_str};
  OpResult<RoutedReply> res = router_->Execute(argv, {}, SlotRoute{slot});
  RETURN_ON_BAD_STATUS(res);
  return ReplyToInt(res->value);
}

OpResult<vector<string>> ClusterCommands::GetKeysInSlot(SlotId slot, uint32_t count) {
  string slot_str = absl::StrCat(slot);
  string count_str = absl::StrCat(count);
  const string_view argv[] = {"CLUSTER", "GETKEYSINSLOT", slot_str, count_str};
  OpResult<RoutedReply> res = router_->Execute(argv, {}, SlotRoute{slot});
  RETURN_ON_BAD_STATUS(res);
  return ReplyToStrings(res->value);
}

OpResult<StringMap> ClusterCommands::GetClusterInfo() {
  const string_view argv[] = {"CLUSTER", "INFO"};
  OpResult<RoutedReply> res = router_->Execute(argv, {}, RandomRoute{});
  RETURN_ON_BAD_STATUS(res);
  return InfoToMap(res->value);
}

OpResult<RespExpr> ClusterCommands::Ping(const NodeInfo& node) {
  const string_view argv[] = {"PING"};
  return OnNode(node, argv);
}

OpResult<vector<string>> ClusterCommands::Keys(const NodeInfo& node, string_view pattern) {
  const string_view argv[] = {"KEYS", pattern};
  return ReplyToStrings(OnNode(node, argv));
}

OpResult<ClusterCommands::ScanResult> ClusterCommands::Scan(const NodeInfo& node,
                                                            string_view cursor,
                                                            optional<string_view> match,
                                                            optional<uint32_t> count) {
  CmdArgVec argv{"SCAN", cursor};
  if (match) {
    argv.push_back("MATCH");
    argv.push_back(*match);
  }
  string count_str;
  if (count) {
    count_str = absl::StrCat(*count);
    argv.push_back("COUNT");
    argv.push_back(count_str);
  }

  OpResult<RespExpr> reply = OnNode(node, argv);
  RETURN_ON_BAD_STATUS(reply);
  if (reply->IsError())
    return OpStatus::NODE_ERROR;

  if (reply->type != RespExpr::ARRAY || reply->GetVec().size() != 2 ||
      reply->GetVec()[0].type != RespExpr::STRING) {
    LOG(WARNING) << "Unexpected SCAN reply " << *reply;
    return OpStatus::INVALID_VALUE;
  }

  ScanResult res;
  res.cursor = reply->GetVec()[0].GetString();
  OpResult<vector<string>> keys = ReplyToStrings(reply->GetVec()[1]);
  RETURN_ON_BAD_STATUS(keys);
  res.keys = std::move(*keys);
  return res;
}

OpResult<RespExpr> ClusterCommands::RandomKey(const NodeInfo& node) {
  const string_view argv[] = {"RANDOMKEY"};
  return OnNode(node, argv);
}

OpResult<int64_t> ClusterCommands::DbSize(const NodeInfo& node) {
  const string_view argv[] = {"DBSIZE"};
  return ReplyToInt(OnNode(node, argv));
}

OpResult<StringMap> ClusterCommands::Info(const NodeInfo& node, string_view section) {
  CmdArgVec argv{"INFO"};
  if (!section.empty())
    argv.push_back(section);
  return InfoToMap(OnNode(node, argv));
}

OpResult<StringMap> ClusterCommands::ConfigGet(const NodeInfo& node, string_view pattern) {
  const string_view argv[] = {"CONFIG", "GET", pattern};
  return PairsToMap(OnNode(node, argv));
}

OpResult<RespExpr> ClusterCommands::ConfigSet(const NodeInfo& node, string_view param,
                                              string_view value) {
  const string_view argv[] = {"CONFIG", "SET", param, value};
  return OnNode(node, argv);
}

OpResult<int64_t> ClusterCommands::DbSize() {
  const string_view argv[] = {"DBSIZE"};
  OpResult<RoutedReply> res = router_->Execute(argv, {}, AllPrimaries());
  RETURN_ON_BAD_STATUS(res);

  // A sum over part of the masters would be silently wrong.
  if (res->outcome == Outcome::PARTIAL_FAILURE)
    return OpStatus::PARTIAL_FAILURE;

  int64_t total = 0;
  for (const NodeReply& nr : res->node_replies) {
    OpResult<int64_t> size = ReplyToInt(nr.reply);
    RETURN_ON_BAD_STATUS(size);
    total += *size;
  }
  return total;
}

OpResult<ClusterCommands::Aggregated> ClusterCommands::Info(string_view section) {
  CmdArgVec argv{"INFO"};
  if (!section.empty())
    argv.push_back(section);
  return Aggregate(router_->Execute(argv, {}, AllNodes()), &InfoToMap);
}

OpResult<ClusterCommands::Aggregated> ClusterCommands::ConfigGet(string_view pattern) {
  const string_view argv[] = {"CONFIG", "GET", pattern};
  return Aggregate(router_->Execute(argv, {}, AllNodes()), &PairsToMap);
}

OpResult<RespExpr> ClusterCommands::ConfigSet(string_view param, string_view value) {
  const string_view argv[] = {"CONFIG", "SET", param, value};
  OpResult<RoutedReply> res = router_->Execute(argv, {}, AllNodes());
  RETURN_ON_BAD_STATUS(res);
  return std::move(res->value);
}

OpResult<RespExpr> ClusterCommands::FlushAll() {
  const string_view argv[] = {"FLUSHALL"};
  OpResult<RoutedReply> res = router_->Execute(argv, {}, AllPrimaries());
  RETURN_ON_BAD_STATUS(res);
  return std::move(res->value);
}

OpResult<int64_t> ClusterCommands::LastSave() {
  const string_view argv[] = {"LASTSAVE"};
  OpResult<RoutedReply> res = router_->Execute(argv, {}, AllPrimaries());
  RETURN_ON_BAD_STATUS(res);

  // The missing master may have saved last.
  if (res->outcome == Outcome::PARTIAL_FAILURE)
    return OpStatus::PARTIAL_FAILURE;

  int64_t last = 0;
  for (const NodeReply& nr : res->node_replies) {
    OpResult<int64_t> ts = ReplyToInt(nr.reply);
    RETURN_ON_BAD_STATUS(ts);
    last = max(last, *ts);
  }
  return last;
}

}  // namespace kvr::cluster
