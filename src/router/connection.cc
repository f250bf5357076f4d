// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/connection.h"

#include <glog/logging.h>

#include "router/error.h"

using namespace std;
using facade::CmdArgList;
using facade::RespExpr;

namespace kvr {

OpResult<RespExpr> StandaloneConnection::Execute(CmdArgList argv, CmdArgList keys) {
  if (argv.empty())
    return OpStatus::SYNTAX_ERR;
  return channel_->Execute(nullopt, argv);
}

ClusterConnection::ClusterConnection(ExecutionChannel* channel, const RouterOptions& options)
    : options_(options),
      fetcher_(channel),
      cache_(&fetcher_, options.topology_ttl, options.single_flight_refresh),
      router_(channel, &cache_),
      commands_(&router_) {
  VLOG(1) << "Cluster connection with topology ttl " << options_.topology_ttl.count() << "ms";
}

OpResult<RespExpr> ClusterConnection::Execute(CmdArgList argv, CmdArgList keys) {
  OpResult<cluster::RoutedReply> res = router_.Execute(argv, keys);
  RETURN_ON_BAD_STATUS(res);
  if (res->outcome == cluster::Outcome::PARTIAL_FAILURE)
    return OpStatus::PARTIAL_FAILURE;
  return std::move(res->value);
}

OpResult<cluster::RoutedReply> ClusterConnection::ExecuteRouted(CmdArgList argv, CmdArgList keys,
                                                                const optional<Route>& route) {
  return router_.Execute(argv, keys, route);
}

}  // namespace kvr
