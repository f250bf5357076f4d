// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "facade/facade_types.h"
#include "facade/op_status.h"
#include "facade/resp_expr.h"

struct redisReader;
struct redisReply;

namespace facade {

// Converts a hiredis reply tree to an owned RespExpr. Status replies become strings and
// RESP3 aggregates (map, set, push) become flat arrays. hiredis reports RESP2 null arrays as
// plain nil.
RespExpr FromRedisReply(const redisReply* reply);

// Encodes a command as a RESP array of bulk strings.
std::string SerializeCommand(CmdArgList args);

// Incremental reply parser on top of the hiredis reader.
class RESPParser {
 public:
  RESPParser();
  ~RESPParser();

  RESPParser(const RESPParser&) = delete;
  RESPParser& operator=(const RESPParser&) = delete;

  // Feeds `data` and returns the next complete reply, or nullopt if more input is needed.
  // Feeding empty data returns replies still buffered from earlier input.
  // A malformed stream returns INVALID_VALUE and leaves the parser unusable.
  OpResult<std::optional<RespExpr>> Feed(std::string_view data);

 private:
  redisReader* reader_;
};

}  // namespace facade
