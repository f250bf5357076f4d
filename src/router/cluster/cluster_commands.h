// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/container/flat_hash_map.h>
#include <absl/types/span.h>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "facade/resp_expr.h"
#include "router/cluster/command_router.h"

namespace kvr::cluster {

enum class SetSlotMode : uint8_t { IMPORTING, MIGRATING, NODE, STABLE };

using StringMap = absl::flat_hash_map<std::string, std::string>;

// Administrative and introspection commands of a cluster connection.
class ClusterCommands {
 public:
  // Properties collected from several nodes, keyed "host:port.<property>".
  struct Aggregated {
    StringMap values;
    std::vector<NodeInfo> failed_nodes;

    bool partial() const {
      return !failed_nodes.empty();
    }
  };

  struct ScanResult {
    std::string cursor;
    std::vector<std::string> keys;
  };

  explicit ClusterCommands(CommandRouter* router) : router_(router) {
  }

  // Topology changing commands. All of them invalidate the cached topology.
  facade::OpResult<facade::RespExpr> AddSlots(const NodeInfo& node, absl::Span<const SlotId> slots);
  facade::OpResult<facade::RespExpr> AddSlotsInRange(const NodeInfo& node, const SlotRange& range);
  facade::OpResult<facade::RespExpr> DeleteSlots(const NodeInfo& node,
                                                 absl::Span<const SlotId> slots);
  facade::OpResult<facade::RespExpr> DeleteSlotsInRange(const NodeInfo& node,
                                                        const SlotRange& range);

  // Sent to `node`. IMPORTING, MIGRATING and NODE need `target`, whose id is taken from the
  // topology.
  facade::OpResult<facade::RespExpr> SetSlot(const NodeInfo& node, SlotId slot, SetSlotMode mode,
                                             const std::optional<NodeInfo>& target = std::nullopt);

  // Sent to every active master except the forgotten node.
  facade::OpResult<facade::RespExpr> ForgetNode(const NodeInfo& node);

  // Sent to all masters.
  facade::OpResult<facade::RespExpr> MeetNode(std::string_view host, uint16_t port);

  // Makes `replica` replicate `master`.
  facade::OpResult<facade::RespExpr> Replicate(const NodeInfo& master, const NodeInfo& replica);

  // Topology queries.
  facade::OpResult<NodeInfo> GetNodeForSlot(SlotId slot);
  facade::OpResult<NodeInfo> GetNodeForKey(std::string_view key);

  static SlotId GetSlotForKey(std::string_view key) {
    return KeySlot(key);
  }

  facade::OpResult<std::vector<NodeInfo>> GetNodes();
  facade::OpResult<std::vector<NodeInfo>> GetReplicas(const NodeInfo& master);
  facade::OpResult<std::vector<std::pair<NodeInfo, std::vector<NodeInfo>>>> GetMasterReplicaMap();
  facade::OpResult<int64_t> CountKeysInSlot(SlotId slot);
  facade::OpResult<std::vector<std::string>> GetKeysInSlot(SlotId slot, uint32_t count);
  facade::OpResult<StringMap> GetClusterInfo();

  // Commands for one node.
  facade::OpResult<facade::RespExpr> Ping(const NodeInfo& node);
  facade::OpResult<std::vector<std::string>> Keys(const NodeInfo& node, std::string_view pattern);
  facade::OpResult<ScanResult> Scan(const NodeInfo& node, std::string_view cursor,
                                    std::optional<std::string_view> match = std::nullopt,
                                    std::optional<uint32_t> count = std::nullopt);

  // Nil reply if the node holds no keys.
  facade::OpResult<facade::RespExpr> RandomKey(const NodeInfo& node);
  facade::OpResult<int64_t> DbSize(const NodeInfo& node);
  facade::OpResult<StringMap> Info(const NodeInfo& node, std::string_view section = {});
  facade::OpResult<StringMap> ConfigGet(const NodeInfo& node, std::string_view pattern);
  facade::OpResult<facade::RespExpr> ConfigSet(const NodeInfo& node, std::string_view param,
                                               std::string_view value);

  // Cluster wide commands.
  facade::OpResult<int64_t> DbSize();
  facade::OpResult<Aggregated> Info(std::string_view section = {});
  facade::OpResult<Aggregated> ConfigGet(std::string_view pattern);
  facade::OpResult<facade::RespExpr> ConfigSet(std::string_view param, std::string_view value);
  facade::OpResult<facade::RespExpr> FlushAll();
  facade::OpResult<int64_t> LastSave();

 private:
  facade::OpResult<facade::RespExpr> OnNode(const NodeInfo& node, facade::CmdArgList argv);
  facade::OpResult<facade::RespExpr> SlotsCommand(std::string_view subcmd, const NodeInfo& node,
                                                  std::vector<std::string> args);

  CommandRouter* router_;
};

// Parses "key:value" lines of INFO and CLUSTER INFO replies. Comments and blank lines
// are skipped.
StringMap ParseInfoLines(std::string_view text);

}  // namespace kvr::cluster
