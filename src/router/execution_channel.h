// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "facade/facade_types.h"
#include "facade/resp_expr.h"
#include "router/cluster/cluster_defs.h"

namespace kvr {

using cluster::NodeAddress;

// Shared flag telling a channel that the reply of a request is no longer wanted.
// Cancellation is best effort: a request already sent may still run on the server.
class Cancellation {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic_bool cancelled_{false};
};

using CancellationPtr = std::shared_ptr<Cancellation>;

// Explicit routing targets a caller can request.
struct DefaultRoute {};

struct AddressRoute {
  NodeAddress address;
};

// Master of a slot, or one of its replicas when `replica` is set.
struct SlotRoute {
  SlotId slot = 0;
  bool replica = false;
};

enum class BroadcastScope : uint8_t { ALL_PRIMARIES, ALL_NODES };

struct BroadcastRoute {
  BroadcastScope scope = BroadcastScope::ALL_PRIMARIES;
};

// Any single master.
struct RandomRoute {};

using Route = std::variant<DefaultRoute, AddressRoute, SlotRoute, BroadcastRoute, RandomRoute>;

inline Route ByAddress(std::string host, uint16_t port) {
  return AddressRoute{NodeAddress{std::move(host), port}};
}

inline Route AllPrimaries() {
  return BroadcastRoute{BroadcastScope::ALL_PRIMARIES};
}

inline Route AllNodes() {
  return BroadcastRoute{BroadcastScope::ALL_NODES};
}

std::string RouteToString(const Route& route);

// Node-addressed asynchronous transport. Implementations own connections and the wire codec.
class ExecutionChannel {
 public:
  using ReplyCb = std::function<void(facade::OpResult<facade::RespExpr>)>;

  virtual ~ExecutionChannel() = default;

  // Sends `args` to the node at `address`, or to the channel's default node when `address`
  // is not set. `cb` runs exactly once, possibly on another thread. Transport failures are
  // reported as IO_ERROR, server error replies as RespExpr::ERROR values. If `cancel` fires
  // before the reply arrives the reply is discarded and `cb` gets CANCELLED.
  virtual void Dispatch(const std::optional<NodeAddress>& address, facade::OwnedArgs args,
                        CancellationPtr cancel, ReplyCb cb) = 0;

  // Blocking helper on top of Dispatch.
  facade::OpResult<facade::RespExpr> Execute(const std::optional<NodeAddress>& address,
                                             facade::CmdArgList args);
};

}  // namespace kvr
