// Copyright 2022, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include "facade/error.h"
#include "facade/op_status.h"

namespace kvr {

using facade::OpResult;
using facade::OpStatus;

#ifndef RETURN_ON_BAD_STATUS

#define RETURN_ON_BAD_STATUS(x)  \
  do {                           \
    OpStatus __s = (x).status(); \
    if (__s != OpStatus::OK) {   \
      return __s;                \
    }                            \
  } while (0)

#endif  // RETURN_ON_BAD_STATUS

// For OpResult<RespExpr> steps of a multi step command: a bad status is returned as is and an
// error reply from the node is returned to the caller as the command reply.
#ifndef RETURN_ON_ERR_REPLY

#define RETURN_ON_ERR_REPLY(x)   \
  do {                           \
    RETURN_ON_BAD_STATUS(x);     \
    if ((x)->IsError()) {        \
      return std::move(*(x));    \
    }                            \
  } while (0)

#endif  // RETURN_ON_ERR_REPLY

}  // namespace kvr
