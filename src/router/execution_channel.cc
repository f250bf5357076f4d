// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/execution_channel.h"

#include <absl/strings/str_cat.h>
#include <absl/synchronization/notification.h>

using namespace std;
using facade::OpResult;
using facade::RespExpr;

namespace kvr {

namespace {

struct RouteFormatter {
  string operator()(const DefaultRoute&) const {
    return "default";
  }

  string operator()(const AddressRoute& r) const {
    return r.address.ToString();
  }

  string operator()(const SlotRoute& r) const {
    return absl::StrCat("slot ", r.slot, r.replica ? " replica" : " master");
  }

  string operator()(const BroadcastRoute& r) const {
    return r.scope == BroadcastScope::ALL_PRIMARIES ? "all-primaries" : "all-nodes";
  }

  string operator()(const RandomRoute&) const {
    return "random";
  }
};

}  // namespace

string RouteToString(const Route& route) {
  return visit(RouteFormatter{}, route);
}

OpResult<RespExpr> ExecutionChannel::Execute(const optional<NodeAddress>& address,
                                             facade::CmdArgList args) {
  struct State {
    absl::Notification done;
    OpResult<RespExpr> result{facade::OpStatus::CANCELLED};
  };

  auto state = make_shared<State>();
  Dispatch(address, facade::ToOwned(args), make_shared<Cancellation>(),
           [state](OpResult<RespExpr> res) {
             state->result = std::move(res);
             state->done.Notify();
           });
  state->done.WaitForNotification();
  return std::move(state->result);
}

}  // namespace kvr
