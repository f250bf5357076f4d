// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "facade/op_status.h"

#include <glog/logging.h>

#include "facade/error.h"

namespace facade {

const char* OpResultBase::DebugFormat() const {
  return StatusToMsg(st_).data();
}

std::string_view StatusToMsg(OpStatus status) {
  switch (status) {
    case OpStatus::OK:
      return "OK";
    case OpStatus::KEY_EXISTS:
      return kKeyExistsErr;
    case OpStatus::KEY_NOTFOUND:
      return kKeyNotFoundErr;
    case OpStatus::INVALID_VALUE:
      return kInvalidValueErr;
    case OpStatus::OUT_OF_RANGE:
      return kIndexOutOfRange;
    case OpStatus::INVALID_INT:
      return kInvalidIntErr;
    case OpStatus::SYNTAX_ERR:
      return kSyntaxErr;
    case OpStatus::TIMED_OUT:
      return kTimedOutErr;
    case OpStatus::CANCELLED:
      return kOperationCancelledErr;
    case OpStatus::AT_LEAST_ONE_KEY:
      return kAtLeastOneKeyErr;
    case OpStatus::TOPOLOGY_PARSE_ERROR:
      return kTopologyParseErr;
    case OpStatus::UNRESOLVABLE_KEY:
      return kUnresolvableKeyErr;
    case OpStatus::PARTIAL_FAILURE:
      return kPartialFailureErr;
    case OpStatus::UNSUPPORTED_IN_CLUSTER:
      return kUnsupportedInClusterErr;
    case OpStatus::NODE_NOT_FOUND:
      return kNodeNotFoundErr;
    case OpStatus::NODE_ERROR:
      return kNodeErr;
    case OpStatus::IO_ERROR:
      return kIoErr;
  }
  LOG(ERROR) << "Unsupported status " << static_cast<int>(status);
  return "Internal error";
}

}  // namespace facade
