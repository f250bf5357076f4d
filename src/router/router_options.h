// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <chrono>

namespace kvr {

// Settings of one router instance. Owned by the component that creates the router and passed
// down explicitly.
struct RouterOptions {
  std::chrono::milliseconds topology_ttl{100};
  bool single_flight_refresh = true;

  // Reads the process wide defaults from the command line flags.
  static RouterOptions FromFlags();
};

}  // namespace kvr
