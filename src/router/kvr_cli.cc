// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/strings/numbers.h>
#include <glog/logging.h>

#include <cstdint>
#include <iostream>
#include <memory>

#include "router/command_spec.h"
#include "router/connection.h"
#include "router/hiredis_channel.h"

ABSL_FLAG(std::string, seed, "127.0.0.1:6379", "host:port of the node to connect to first.");
ABSL_FLAG(bool, cluster, false, "If true, route commands over the cluster topology.");
ABSL_FLAG(std::string, route, "",
          "Explicit route in cluster mode: all-primaries, all-nodes, random or host:port.");

using namespace std;
using absl::GetFlag;
using facade::OpResult;
using facade::OpStatus;
using facade::RespExpr;

namespace kvr {

namespace {

optional<NodeAddress> ParseAddress(string_view str) {
  size_t pos = str.rfind(':');
  if (pos == string_view::npos || pos == 0)
    return nullopt;

  uint32_t port = 0;
  if (!absl::SimpleAtoi(str.substr(pos + 1), &port) || port == 0 || port > UINT16_MAX)
    return nullopt;

  string_view host = str.substr(0, pos);
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  return NodeAddress{string(host), uint16_t(port)};
}

optional<Route> ParseRoute(string_view str) {
  if (str == "all-primaries")
    return AllPrimaries();
  if (str == "all-nodes")
    return AllNodes();
  if (str == "random")
    return RandomRoute{};
  if (auto addr = ParseAddress(str); addr)
    return AddressRoute{std::move(*addr)};
  return nullopt;
}

int PrintResult(const OpResult<RespExpr>& res) {
  if (!res) {
    cerr << "(error) " << res.status() << endl;
    return 1;
  }
  cout << *res << endl;
  return res->IsError() ? 1 : 0;
}

int RunCluster(ExecutionChannel* channel, facade::CmdArgList argv, facade::CmdArgList keys) {
  ClusterConnection conn(channel, RouterOptions::FromFlags());

  optional<Route> route;
  if (string route_str = GetFlag(FLAGS_route); !route_str.empty()) {
    route = ParseRoute(route_str);
    if (!route) {
      cerr << "Invalid route " << route_str << endl;
      return 2;
    }
  }

  OpResult<cluster::RoutedReply> res = conn.ExecuteRouted(argv, keys, route);
  if (!res)
    return PrintResult(res.status());

  for (const auto& node_reply : res->node_replies) {
    cout << node_reply.node.address << ": " << node_reply.reply << endl;
  }
  for (const auto& node : res->failed_nodes) {
    cerr << node.address << ": failed" << endl;
  }

  if (res->node_replies.empty())
    return PrintResult(res->value);
  return res->outcome == cluster::Outcome::SUCCESS ? 0 : 1;
}

}  // namespace

}  // namespace kvr

int main(int argc, char* argv[]) {
  absl::SetProgramUsageMessage("Usage: kvr_cli [--seed host:port] [--cluster] COMMAND [ARG...]");
  vector<char*> positional = absl::ParseCommandLine(argc, argv);
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();

  if (positional.size() < 2) {
    cerr << absl::ProgramUsageMessage() << endl;
    return 2;
  }

  optional<kvr::NodeAddress> seed = kvr::ParseAddress(GetFlag(FLAGS_seed));
  if (!seed) {
    LOG(ERROR) << "Invalid seed address " << GetFlag(FLAGS_seed);
    return 2;
  }

  facade::CmdArgVec cmd(positional.begin() + 1, positional.end());
  OpResult<facade::CmdArgVec> keys = kvr::DetermineKeys(cmd);
  if (!keys)
    return kvr::PrintResult(keys.status());

  kvr::HiredisChannel channel(*seed, kvr::HiredisChannel::Options::FromFlags());
  if (GetFlag(FLAGS_cluster))
    return kvr::RunCluster(&channel, cmd, *keys);

  kvr::StandaloneConnection conn(&channel);
  return kvr::PrintResult(conn.Execute(cmd, *keys));
}
