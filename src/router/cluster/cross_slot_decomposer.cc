// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/cross_slot_decomposer.h"

#include <absl/container/flat_hash_map.h>
#include <absl/container/flat_hash_set.h>
#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include "router/command_spec.h"
#include "router/error.h"

using namespace std;
using facade::CmdArgList;
using facade::CmdArgVec;
using facade::OwnedArgs;
using facade::RespExpr;
using facade::RespVec;

namespace kvr::cluster {

namespace {

OwnedArgs MakeArgs(string_view cmd, CmdArgList args) {
  OwnedArgs res;
  res.reserve(args.size() + 1);
  res.emplace_back(cmd);
  res.insert(res.end(), args.begin(), args.end());
  return res;
}

// Items of an array reply, NIL_ARRAY is an empty list and nil elements become empty strings.
optional<vector<string>> ToStrings(const RespExpr& reply) {
  vector<string> res;
  if (reply.type == RespExpr::NIL_ARRAY || reply.type == RespExpr::NIL)
    return res;
  if (reply.type != RespExpr::ARRAY)
    return nullopt;

  for (const RespExpr& e : reply.GetVec()) {
    if (e.type == RespExpr::STRING) {
      res.push_back(e.GetString());
    } else if (e.IsNil()) {
      res.emplace_back();
    } else {
      return nullopt;
    }
  }
  return res;
}

const RespExpr* FirstErrorReply(const RespVec& replies) {
  for (const RespExpr& reply : replies) {
    if (reply.IsError())
      return &reply;
  }
  return nullptr;
}

}  // namespace

bool CrossSlotDecomposer::Supports(string_view cmd) {
  static const absl::flat_hash_set<string_view> kSupported = {
      "RENAME", "RENAMENX", "SORT",   "RPOPLPUSH",   "BRPOPLPUSH",  "SMOVE",
      "BLPOP",  "BRPOP",    "MSET",   "MSETNX",      "MGET",        "DEL",
      "UNLINK", "EXISTS",   "TOUCH",  "SINTER",      "SUNION",      "SDIFF",
      "SINTERSTORE", "SUNIONSTORE", "SDIFFSTORE"};
  return kSupported.contains(absl::AsciiStrToUpper(cmd));
}

OpResult<RespExpr> CrossSlotDecomposer::Execute(CmdArgList argv) {
  if (argv.empty())
    return OpStatus::SYNTAX_ERR;

  string cmd = absl::AsciiStrToUpper(argv[0]);
  CmdArgList args = argv.subspan(1);

  if (!Supports(cmd)) {
    LOG(WARNING) << cmd << " keys span several slots, the command cannot be split";
    return OpStatus::UNSUPPORTED_IN_CLUSTER;
  }

  if (cmd == "RENAME" || cmd == "RENAMENX") {
    if (args.size() != 2)
      return OpStatus::SYNTAX_ERR;
    return Rename(args[0], args[1], cmd == "RENAMENX");
  }

  if (cmd == "SORT")
    return SortStore(argv);

  if (cmd == "RPOPLPUSH") {
    if (args.size() != 2)
      return OpStatus::SYNTAX_ERR;
    return PopPush(args[0], args[1], nullopt);
  }

  if (cmd == "BRPOPLPUSH") {
    if (args.size() != 3)
      return OpStatus::SYNTAX_ERR;
    return PopPush(args[0], args[1], args[2]);
  }

  if (cmd == "SMOVE") {
    if (args.size() != 3)
      return OpStatus::SYNTAX_ERR;
    return SMove(args[0], args[1], args[2]);
  }

  if (cmd == "BLPOP" || cmd == "BRPOP") {
    if (args.size() < 2)
      return OpStatus::SYNTAX_ERR;
    return BlockingPop(cmd, args.subspan(0, args.size() - 1), args.back());
  }

  if (cmd == "MSET" || cmd == "MSETNX") {
    if (args.empty() || args.size() % 2 != 0)
      return OpStatus::SYNTAX_ERR;
    return MSet(args, cmd == "MSETNX");
  }

  if (args.empty())
    return OpStatus::AT_LEAST_ONE_KEY;

  if (cmd == "MGET")
    return MGet(args);

  if (cmd == "DEL" || cmd == "UNLINK" || cmd == "EXISTS" || cmd == "TOUCH")
    return SumOverNodes(cmd, args);

  SetOpKind kind = SetOpKind::DIFF;
  if (absl::StartsWith(cmd, "SINTER")) {
    kind = SetOpKind::INTER;
  } else if (absl::StartsWith(cmd, "SUNION")) {
    kind = SetOpKind::UNION;
  }

  if (absl::EndsWith(cmd, "STORE")) {
    if (args.size() < 2)
      return OpStatus::SYNTAX_ERR;
    return SetOpStore(kind, args[0], args.subspan(1));
  }

  return SetOp(kind, args);
}

OpResult<RespExpr> CrossSlotDecomposer::Rename(string_view src, string_view dest, bool nx) {
  OpResult<NodeInfo> src_node = router_->ResolveNodeForKey(src);
  RETURN_ON_BAD_STATUS(src_node);
  OpResult<NodeInfo> dest_node = router_->ResolveNodeForKey(dest);
  RETURN_ON_BAD_STATUS(dest_node);

  // A missing source fails RENAMENX too, whether or not `dest` exists.
  const string_view dump_cmd[] = {"DUMP", src};
  OpResult<RespExpr> payload = router_->ExecuteOnNode(*src_node, dump_cmd);
  RETURN_ON_ERR_REPLY(payload);
  if (payload->IsNil())
    return OpStatus::KEY_NOTFOUND;

  if (nx) {
    const string_view exists_cmd[] = {"EXISTS", dest};
    OpResult<RespExpr> exists = router_->ExecuteOnNode(*dest_node, exists_cmd);
    RETURN_ON_ERR_REPLY(exists);
    if (exists->GetInt().value_or(0) > 0)
      return RespExpr::Int(0);
  }

  const string_view pttl_cmd[] = {"PTTL", src};
  OpResult<RespExpr> pttl = router_->ExecuteOnNode(*src_node, pttl_cmd);
  RETURN_ON_ERR_REPLY(pttl);

  int64_t ttl_ms = pttl->GetInt().value_or(-1);
  if (ttl_ms == -2)  // expired between DUMP and PTTL
    return OpStatus::KEY_NOTFOUND;

  string ttl = absl::StrCat(max<int64_t>(ttl_ms, 0));
  CmdArgVec restore_cmd = {"RESTORE", dest, ttl, payload->GetView()};
  if (!nx)
    restore_cmd.push_back("REPLACE");

  OpResult<RespExpr> restored = router_->ExecuteOnNode(*dest_node, restore_cmd);
  RETURN_ON_ERR_REPLY(restored);

  const string_view del_cmd[] = {"DEL", src};
  OpResult<RespExpr> deleted = router_->ExecuteOnNode(*src_node, del_cmd);
  if (IsNodeFailure(deleted)) {
    LOG(WARNING) << "Renamed " << src << " to " << dest << " but failed to delete the source key";
    RETURN_ON_ERR_REPLY(deleted);
  }

  return nx ? RespExpr::Int(1) : RespExpr::Ok();
}

OpResult<RespExpr> CrossSlotDecomposer::SortStore(CmdArgList argv) {
  if (argv.size() < 2)
    return OpStatus::SYNTAX_ERR;

  CmdArgVec sort_cmd;
  optional<string_view> dest;
  for (size_t i = 0; i < argv.size(); ++i) {
    if (i > 1 && absl::EqualsIgnoreCase(argv[i], "STORE") && i + 1 < argv.size()) {
      dest = argv[++i];
      continue;
    }
    sort_cmd.push_back(argv[i]);
  }

  if (!dest) {
    LOG(WARNING) << "SORT without STORE can not span several slots";
    return OpStatus::UNSUPPORTED_IN_CLUSTER;
  }

  OpResult<RespExpr> sorted = router_->ExecuteOnKeyNode(argv[1], sort_cmd);
  RETURN_ON_ERR_REPLY(sorted);

  optional<vector<string>> items = ToStrings(*sorted);
  if (!items) {
    LOG(WARNING) << "Unexpected SORT reply " << *sorted;
    return OpStatus::INVALID_VALUE;
  }

  return StoreItems(*dest, "RPUSH", *items);
}

OpResult<RespExpr> CrossSlotDecomposer::PopPush(string_view src, string_view dest,
                                                optional<string_view> timeout) {
  OpResult<NodeInfo> dest_node = router_->ResolveNodeForKey(dest);
  RETURN_ON_BAD_STATUS(dest_node);

  string value;
  if (timeout) {
    const string_view brpop_cmd[] = {"BRPOP", src, *timeout};
    OpResult<RespExpr> popped = router_->ExecuteOnKeyNode(src, brpop_cmd);
    RETURN_ON_ERR_REPLY(popped);
    if (popped->IsNil())
      return RespExpr::Nil();
    if (popped->type != RespExpr::ARRAY || popped->GetVec().size() != 2)
      return OpStatus::INVALID_VALUE;
    value = popped->GetVec()[1].GetString();
  } else {
    const string_view rpop_cmd[] = {"RPOP", src};
    OpResult<RespExpr> popped = router_->ExecuteOnKeyNode(src, rpop_cmd);
    RETURN_ON_ERR_REPLY(popped);
    if (popped->IsNil())
      return RespExpr::Nil();
    value = popped->GetString();
  }

  const string_view push_cmd[] = {"LPUSH", dest, value};
  OpResult<RespExpr> pushed = router_->ExecuteOnNode(*dest_node, push_cmd);
  if (IsNodeFailure(pushed)) {
    LOG(WARNING) << "Popped a value from " << src << " but failed to push it to " << dest;
    RETURN_ON_ERR_REPLY(pushed);
  }

  return RespExpr::String(value);
}

OpResult<RespExpr> CrossSlotDecomposer::SMove(string_view src, string_view dest,
                                              string_view member) {
  OpResult<NodeInfo> dest_node = router_->ResolveNodeForKey(dest);
  RETURN_ON_BAD_STATUS(dest_node);

  const string_view srem_cmd[] = {"SREM", src, member};
  OpResult<RespExpr> removed = router_->ExecuteOnKeyNode(src, srem_cmd);
  RETURN_ON_ERR_REPLY(removed);
  if (removed->GetInt().value_or(0) == 0)
    return RespExpr::Int(0);

  const string_view sadd_cmd[] = {"SADD", dest, member};
  OpResult<RespExpr> added = router_->ExecuteOnNode(*dest_node, sadd_cmd);
  if (IsNodeFailure(added)) {
    LOG(WARNING) << "Removed " << member << " from " << src << " but failed to add it to "
                 << dest;
    RETURN_ON_ERR_REPLY(added);
  }
  return RespExpr::Int(1);
}

OpResult<RespExpr> CrossSlotDecomposer::BlockingPop(string_view cmd, CmdArgList keys,
                                                    string_view timeout) {
  OpResult<vector<IndexGroup>> groups = GroupBySlot(keys);
  RETURN_ON_BAD_STATUS(groups);

  vector<NodeRequest> requests;
  for (auto& group : *groups) {
    OwnedArgs args{string(cmd)};
    for (size_t index : group.indices)
      args.emplace_back(keys[index]);
    args.emplace_back(timeout);
    requests.push_back(NodeRequest{std::move(group.node), std::move(args)});
  }

  // The winner is either a popped element or an error reply such as WRONGTYPE.
  FanOutResult fan_out = router_->FanOut(std::move(requests), FanOutMode::FIRST_WINS);
  if (fan_out.winner)
    return std::move(fan_out.replies[*fan_out.winner]);

  // Nobody won: every request timed out or failed.
  for (auto& res : fan_out.replies) {
    if (!res) {
      LOG(WARNING) << cmd << " failed on a node: " << res.status();
      return res.status();
    }
  }
  return RespExpr::NilArray();
}

OpResult<RespExpr> CrossSlotDecomposer::MSet(CmdArgList kv, bool nx) {
  CmdArgVec keys;
  for (size_t i = 0; i < kv.size(); i += 2)
    keys.push_back(kv[i]);

  OpResult<vector<IndexGroup>> groups = GroupBySlot(keys);
  RETURN_ON_BAD_STATUS(groups);

  string_view cmd = nx ? "MSETNX" : "MSET";
  vector<NodeRequest> requests;
  for (auto& group : *groups) {
    OwnedArgs args{string(cmd)};
    for (size_t index : group.indices) {
      args.emplace_back(kv[index * 2]);
      args.emplace_back(kv[index * 2 + 1]);
    }
    requests.push_back(NodeRequest{std::move(group.node), std::move(args)});
  }

  OpResult<RespVec> replies = CollectAll(cmd, std::move(requests));
  RETURN_ON_BAD_STATUS(replies);

  if (!nx)
    return RespExpr::Ok();

  size_t applied = 0;
  for (const RespExpr& reply : *replies) {
    if (reply.GetInt().value_or(0) == 1)
      ++applied;
  }

  if (applied == replies->size())
    return RespExpr::Int(1);

  if (applied > 0) {
    LOG(WARNING) << "MSETNX was applied on " << applied << " of " << replies->size() << " slots";
  }
  return RespExpr::Int(0);
}

OpResult<RespExpr> CrossSlotDecomposer::MGet(CmdArgList keys) {
  OpResult<vector<IndexGroup>> groups = GroupBySlot(keys);
  RETURN_ON_BAD_STATUS(groups);

  vector<NodeRequest> requests;
  for (const auto& group : *groups) {
    OwnedArgs args{"MGET"};
    for (size_t index : group.indices)
      args.emplace_back(keys[index]);
    requests.push_back(NodeRequest{group.node, std::move(args)});
  }

  OpResult<RespVec> replies = CollectAll("MGET", std::move(requests));
  RETURN_ON_BAD_STATUS(replies);
  if (const RespExpr* err = FirstErrorReply(*replies); err)
    return *err;

  RespVec values(keys.size(), RespExpr::Nil());
  for (size_t i = 0; i < groups->size(); ++i) {
    const auto& indices = (*groups)[i].indices;
    RespExpr& reply = (*replies)[i];
    if (reply.type != RespExpr::ARRAY || reply.GetVec().size() != indices.size()) {
      LOG(WARNING) << "Unexpected MGET reply " << reply;
      return OpStatus::INVALID_VALUE;
    }

    for (size_t j = 0; j < indices.size(); ++j)
      values[indices[j]] = std::move(reply.GetVec()[j]);
  }

  return RespExpr::Array(std::move(values));
}

OpResult<RespExpr> CrossSlotDecomposer::SumOverNodes(string_view cmd, CmdArgList keys) {
  OpResult<vector<IndexGroup>> groups = GroupBySlot(keys);
  RETURN_ON_BAD_STATUS(groups);

  vector<NodeRequest> requests;
  for (auto& group : *groups) {
    OwnedArgs args{string(cmd)};
    for (size_t index : group.indices)
      args.emplace_back(keys[index]);
    requests.push_back(NodeRequest{std::move(group.node), std::move(args)});
  }

  OpResult<RespVec> replies = CollectAll(cmd, std::move(requests));
  RETURN_ON_BAD_STATUS(replies);
  if (const RespExpr* err = FirstErrorReply(*replies); err)
    return *err;

  int64_t total = 0;
  for (const RespExpr& reply : *replies) {
    optional<int64_t> val = reply.GetInt();
    if (!val) {
      LOG(WARNING) << "Unexpected " << cmd << " reply " << reply;
      return OpStatus::INVALID_INT;
    }
    total += *val;
  }
  return RespExpr::Int(total);
}

OpResult<RespExpr> CrossSlotDecomposer::SetOp(SetOpKind kind, CmdArgList keys) {
  OpResult<vector<IndexGroup>> groups = GroupBySlot(keys);
  RETURN_ON_BAD_STATUS(groups);

  // One SMEMBERS per key, all in parallel.
  vector<NodeRequest> requests;
  vector<size_t> request_key;
  for (const auto& group : *groups) {
    for (size_t index : group.indices) {
      requests.push_back(NodeRequest{group.node, MakeArgs("SMEMBERS", {&keys[index], 1})});
      request_key.push_back(index);
    }
  }

  OpResult<RespVec> replies = CollectAll("SMEMBERS", std::move(requests));
  RETURN_ON_BAD_STATUS(replies);
  if (const RespExpr* err = FirstErrorReply(*replies); err)
    return *err;

  vector<vector<string>> sets(keys.size());
  for (size_t i = 0; i < replies->size(); ++i) {
    optional<vector<string>> members = ToStrings((*replies)[i]);
    if (!members) {
      LOG(WARNING) << "Unexpected SMEMBERS reply " << (*replies)[i];
      return OpStatus::INVALID_VALUE;
    }
    sets[request_key[i]] = std::move(*members);
  }

  vector<string> res;
  absl::flat_hash_set<string_view> seen;

  if (kind == SetOpKind::UNION) {
    for (const auto& set : sets) {
      for (const string& member : set) {
        if (seen.insert(member).second)
          res.push_back(member);
      }
    }
    return RespExpr::StringArray(res);
  }

  vector<absl::flat_hash_set<string_view>> others;
  for (size_t i = 1; i < sets.size(); ++i)
    others.emplace_back(sets[i].begin(), sets[i].end());

  for (const string& member : sets.front()) {
    if (!seen.insert(member).second)
      continue;

    bool keep = true;
    for (const auto& other : others) {
      bool found = other.contains(member);
      if ((kind == SetOpKind::INTER && !found) || (kind == SetOpKind::DIFF && found)) {
        keep = false;
        break;
      }
    }
    if (keep)
      res.push_back(member);
  }

  return RespExpr::StringArray(res);
}

OpResult<RespExpr> CrossSlotDecomposer::SetOpStore(SetOpKind kind, string_view dest,
                                                   CmdArgList keys) {
  OpResult<RespExpr> members = SetOp(kind, keys);
  RETURN_ON_ERR_REPLY(members);

  optional<vector<string>> items = ToStrings(*members);
  if (!items)
    return OpStatus::INVALID_VALUE;
  return StoreItems(dest, "SADD", *items);
}

OpResult<vector<CrossSlotDecomposer::IndexGroup>> CrossSlotDecomposer::GroupBySlot(
    CmdArgList keys) {
  OpResult<TopologyPtr> topology = router_->GetTopology();
  RETURN_ON_BAD_STATUS(topology);

  vector<IndexGroup> groups;
  absl::flat_hash_map<SlotId, size_t> group_index;

  for (size_t i = 0; i < keys.size(); ++i) {
    SlotId slot = KeySlot(keys[i]);
    auto [it, inserted] = group_index.emplace(slot, groups.size());
    if (inserted) {
      const NodeInfo* node = (*topology)->NodeForSlot(slot);
      if (!node) {
        LOG(WARNING) << "No node serves slot " << slot << " of key " << keys[i];
        return OpStatus::UNRESOLVABLE_KEY;
      }
      groups.push_back(IndexGroup{*node, slot, {}});
    }
    groups[it->second].indices.push_back(i);
  }

  return groups;
}

OpResult<RespVec> CrossSlotDecomposer::CollectAll(string_view cmd, vector<NodeRequest> requests) {
  const string_view cmd_arg[] = {cmd};
  bool write = HasOpt(cmd_arg, CO::WRITE);

  vector<NodeInfo> nodes;
  for (const auto& req : requests)
    nodes.push_back(req.node);

  FanOutResult fan_out = router_->FanOut(std::move(requests), FanOutMode::ALL);

  RespVec replies;
  OpStatus first_failure = OpStatus::OK;
  size_t failed = 0;

  for (size_t i = 0; i < fan_out.replies.size(); ++i) {
    auto& res = fan_out.replies[i];
    if (!res || (write && res->IsError())) {
      OpStatus st = res ? OpStatus::NODE_ERROR : res.status();
      LOG(WARNING) << cmd << " failed on " << nodes[i].address() << ": "
                   << (res ? res->GetString() : string(facade::StatusToMsg(st)));
      if (first_failure == OpStatus::OK)
        first_failure = st;
      ++failed;
      continue;
    }
    replies.push_back(std::move(*res));
  }

  if (failed == 0)
    return replies;

  return failed < fan_out.replies.size() ? OpStatus::PARTIAL_FAILURE : first_failure;
}

OpResult<RespExpr> CrossSlotDecomposer::StoreItems(string_view dest, string_view push_cmd,
                                                   const vector<string>& items) {
  OpResult<NodeInfo> dest_node = router_->ResolveNodeForKey(dest);
  RETURN_ON_BAD_STATUS(dest_node);

  const string_view del_cmd[] = {"DEL", dest};
  OpResult<RespExpr> deleted = router_->ExecuteOnNode(*dest_node, del_cmd);
  RETURN_ON_ERR_REPLY(deleted);

  if (!items.empty()) {
    CmdArgVec args{push_cmd, dest};
    args.insert(args.end(), items.begin(), items.end());
    OpResult<RespExpr> stored = router_->ExecuteOnNode(*dest_node, args);
    RETURN_ON_ERR_REPLY(stored);
  }

  return RespExpr::Int(int64_t(items.size()));
}

}  // namespace kvr::cluster
