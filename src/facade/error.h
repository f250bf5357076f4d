// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <string>
#include <string_view>

namespace facade {

inline constexpr char kSyntaxErr[] = "syntax error";
inline constexpr char kKeyExistsErr[] = "key already exists";
inline constexpr char kKeyNotFoundErr[] = "no such key";
inline constexpr char kInvalidValueErr[] = "invalid value";
inline constexpr char kInvalidIntErr[] = "value is not an integer or out of range";
inline constexpr char kIndexOutOfRange[] = "index out of range";
inline constexpr char kTimedOutErr[] = "operation timed out";
inline constexpr char kOperationCancelledErr[] = "operation was cancelled";
inline constexpr char kAtLeastOneKeyErr[] = "at least 1 input key is needed for this command";

inline constexpr char kTopologyParseErr[] = "malformed cluster topology response";
inline constexpr char kUnresolvableKeyErr[] = "no node serves the slot of the key";
inline constexpr char kPartialFailureErr[] = "command failed on some of the nodes";
inline constexpr char kUnsupportedInClusterErr[] = "command is not supported in cluster mode";
inline constexpr char kNodeNotFoundErr[] = "node is not part of the cluster topology";
inline constexpr char kNodeErr[] = "node replied with an error";
inline constexpr char kIoErr[] = "failed to communicate with node";

}  // namespace facade
