// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <optional>

#include "facade/facade_types.h"
#include "facade/resp_expr.h"
#include "router/cluster/cluster_commands.h"
#include "router/cluster/command_router.h"
#include "router/cluster/topology_cache.h"
#include "router/cluster/topology_fetcher.h"
#include "router/execution_channel.h"
#include "router/router_options.h"

namespace kvr {

// Command execution shared by standalone and cluster deployments.
class Connection {
 public:
  virtual ~Connection() = default;

  // `keys` are the key arguments of `argv`. Standalone connections ignore them.
  virtual facade::OpResult<facade::RespExpr> Execute(facade::CmdArgList argv,
                                                     facade::CmdArgList keys) = 0;

  virtual bool IsCluster() const = 0;
};

// Single server: every command goes to the channel default node.
class StandaloneConnection final : public Connection {
 public:
  explicit StandaloneConnection(ExecutionChannel* channel) : channel_(channel) {
  }

  facade::OpResult<facade::RespExpr> Execute(facade::CmdArgList argv,
                                             facade::CmdArgList keys) override;

  bool IsCluster() const override {
    return false;
  }

 private:
  ExecutionChannel* channel_;
};

// Sharded cluster. Owns the topology cache and the router built on top of the channel.
class ClusterConnection final : public Connection {
 public:
  ClusterConnection(ExecutionChannel* channel, const RouterOptions& options);

  // Broadcasts with failed nodes return PARTIAL_FAILURE here, use ExecuteRouted() to get the
  // replies of the nodes that succeeded.
  facade::OpResult<facade::RespExpr> Execute(facade::CmdArgList argv,
                                             facade::CmdArgList keys) override;

  facade::OpResult<cluster::RoutedReply> ExecuteRouted(facade::CmdArgList argv,
                                                       facade::CmdArgList keys,
                                                       const std::optional<Route>& route);

  bool IsCluster() const override {
    return true;
  }

  cluster::CommandRouter* router() {
    return &router_;
  }

  cluster::ClusterCommands* commands() {
    return &commands_;
  }

  cluster::TopologyCache* topology_cache() {
    return &cache_;
  }

  const RouterOptions& options() const {
    return options_;
  }

 private:
  RouterOptions options_;
  cluster::TopologyFetcher fetcher_;
  cluster::TopologyCache cache_;
  cluster::CommandRouter router_;
  cluster::ClusterCommands commands_;
};

}  // namespace kvr
