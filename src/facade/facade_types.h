// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/types/span.h>

#include <string>
#include <string_view>
#include <vector>

#include "facade/op_status.h"

namespace facade {

using CmdArgList = absl::Span<const std::string_view>;
using CmdArgVec = std::vector<std::string_view>;

// Owned form of a command, used when a request outlives the caller's arguments.
using OwnedArgs = std::vector<std::string>;

inline std::string_view ArgS(CmdArgList args, size_t i) {
  return args[i];
}

inline OwnedArgs ToOwned(CmdArgList args) {
  return OwnedArgs(args.begin(), args.end());
}

inline CmdArgVec ToArgVec(const OwnedArgs& args) {
  return CmdArgVec(args.begin(), args.end());
}

}  // namespace facade
