// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "facade/facade_types.h"
#include "facade/resp_expr.h"
#include "router/cluster/command_router.h"

namespace kvr::cluster {

// Runs commands whose keys hash to different slots. None of these are atomic: a failure
// between steps may leave a rename half done or a multi key write applied on some nodes only.
//
// Split and reassemble: RENAME, RENAMENX, SORT ... STORE, RPOPLPUSH, BRPOPLPUSH, SMOVE and the
// set *STORE commands run as a sequence of single node commands.
// Fan out: BLPOP/BRPOP (first reply wins), MSET/MSETNX (every slot must succeed), MGET, DEL,
// UNLINK, EXISTS, TOUCH and SINTER/SUNION/SDIFF send one request per slot or key in parallel.
// A node rejects a request whose keys span several slots, even when it owns all of them.
class CrossSlotDecomposer {
 public:
  enum class SetOpKind : uint8_t { INTER, UNION, DIFF };

  explicit CrossSlotDecomposer(CommandRouter* router) : router_(router) {
  }

  static bool Supports(std::string_view cmd);

  // Commands that are not supported fail with UNSUPPORTED_IN_CLUSTER.
  facade::OpResult<facade::RespExpr> Execute(facade::CmdArgList argv);

  // DUMP + RESTORE + DEL. The key keeps its expiry. KEY_NOTFOUND if `src` does not exist,
  // otherwise RENAMENX replies 0 if `dest` exists.
  facade::OpResult<facade::RespExpr> Rename(std::string_view src, std::string_view dest, bool nx);

  // `argv` is a SORT command with a STORE clause.
  facade::OpResult<facade::RespExpr> SortStore(facade::CmdArgList argv);

  // RPOPLPUSH, or BRPOPLPUSH when `timeout` is set.
  facade::OpResult<facade::RespExpr> PopPush(std::string_view src, std::string_view dest,
                                             std::optional<std::string_view> timeout);

  facade::OpResult<facade::RespExpr> SMove(std::string_view src, std::string_view dest,
                                           std::string_view member);

  // BLPOP/BRPOP with the server side timeout passed through unchanged. The first non-nil reply
  // wins, an error reply included.
  facade::OpResult<facade::RespExpr> BlockingPop(std::string_view cmd, facade::CmdArgList keys,
                                                 std::string_view timeout);

  // `kv` holds key value pairs.
  facade::OpResult<facade::RespExpr> MSet(facade::CmdArgList kv, bool nx);

  facade::OpResult<facade::RespExpr> MGet(facade::CmdArgList keys);

  // DEL, UNLINK, EXISTS, TOUCH: integer replies summed over slots.
  facade::OpResult<facade::RespExpr> SumOverNodes(std::string_view cmd, facade::CmdArgList keys);

  // The resulting members, or the first error reply of an SMEMBERS.
  facade::OpResult<facade::RespExpr> SetOp(SetOpKind kind, facade::CmdArgList keys);

  facade::OpResult<facade::RespExpr> SetOpStore(SetOpKind kind, std::string_view dest,
                                                facade::CmdArgList keys);

 private:
  // Key indices grouped by slot, with the master serving it.
  struct IndexGroup {
    NodeInfo node;
    SlotId slot = 0;
    std::vector<size_t> indices;
  };

  facade::OpResult<std::vector<IndexGroup>> GroupBySlot(facade::CmdArgList keys);

  // Replies aligned with `requests`. A transport failure, or an error reply to a write command,
  // fails the call with PARTIAL_FAILURE if some requests succeeded. Error replies to read
  // commands are kept for the caller to return.
  facade::OpResult<facade::RespVec> CollectAll(std::string_view cmd,
                                               std::vector<NodeRequest> requests);

  // Replaces `dest` with `items` on its node, using `push_cmd` (RPUSH or SADD).
  facade::OpResult<facade::RespExpr> StoreItems(std::string_view dest, std::string_view push_cmd,
                                                const std::vector<std::string>& items);

  CommandRouter* router_;
};

}  // namespace kvr::cluster
