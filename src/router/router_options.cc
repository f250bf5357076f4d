// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/router_options.h"

#include <absl/flags/flag.h>

ABSL_FLAG(uint32_t, topology_cache_ttl_ms, 100,
          "How long a fetched cluster topology is served from cache, in milliseconds. "
          "0 refetches on every lookup.");

ABSL_FLAG(bool, topology_single_flight, true,
          "If true, concurrent cache misses wait for a single topology refresh.");

namespace kvr {

RouterOptions RouterOptions::FromFlags() {
  RouterOptions opts;
  opts.topology_ttl = std::chrono::milliseconds(absl::GetFlag(FLAGS_topology_cache_ttl_ms));
  opts.single_flight_refresh = absl::GetFlag(FLAGS_topology_single_flight);
  return opts;
}

}  // namespace kvr
