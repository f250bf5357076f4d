// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/synchronization/mutex.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>

#include "router/cluster/topology.h"

namespace kvr::cluster {

class TopologyFetcher;

// Time bounded cache of the cluster topology. The snapshot and its fetch time are replaced
// together with a single atomic store, so readers never see a mix of two fetches and the hit
// path takes no lock.
class TopologyCache {
 public:
  using Clock = std::chrono::steady_clock;
  using ClockFn = std::function<Clock::time_point()>;

  struct Stats {
    uint64_t fetches = 0;
    uint64_t fetch_errors = 0;
    uint64_t hits = 0;
    uint64_t invalidations = 0;
  };

  // With `single_flight` concurrent misses wait for one refresh instead of each fetching.
  TopologyCache(TopologyFetcher* fetcher, std::chrono::milliseconds ttl, bool single_flight,
                ClockFn clock = {});

  TopologyCache(const TopologyCache&) = delete;
  TopologyCache& operator=(const TopologyCache&) = delete;

  // Returns the cached snapshot if it is younger than the ttl, otherwise refetches
  // synchronously. A failed refetch is returned as is and the stale snapshot is kept.
  facade::OpResult<TopologyPtr> Get();

  // The next Get() refetches regardless of the snapshot age.
  void Invalidate();

  // Last fetched snapshot regardless of its age, null if nothing was fetched yet.
  TopologyPtr Peek() const;

  Stats GetStats() const;

  std::chrono::milliseconds ttl() const {
    return ttl_;
  }

 private:
  struct Entry {
    TopologyPtr topology;
    Clock::time_point fetched_at;
  };

  static constexpr Clock::time_point kNever = Clock::time_point::min();

  bool IsFresh(const Entry& entry, Clock::time_point now) const;
  facade::OpResult<TopologyPtr> Refresh();

  Clock::time_point Now() const {
    return clock_ ? clock_() : Clock::now();
  }

  TopologyFetcher* fetcher_;
  const std::chrono::milliseconds ttl_;
  const bool single_flight_;
  ClockFn clock_;

  std::atomic<std::shared_ptr<const Entry>> entry_;

  // Bumped by Invalidate(). A fetch that overlaps an invalidation is stored as stale.
  std::atomic<uint64_t> epoch_{0};
  absl::Mutex refresh_mu_;

  std::atomic<uint64_t> fetches_{0};
  std::atomic<uint64_t> fetch_errors_{0};
  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> invalidations_{0};
};

}  // namespace kvr::cluster
