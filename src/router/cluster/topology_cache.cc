// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/topology_cache.h"

#include <glog/logging.h>

#include "router/cluster/topology_fetcher.h"

using namespace std;
using facade::OpResult;

namespace kvr::cluster {

TopologyCache::TopologyCache(TopologyFetcher* fetcher, chrono::milliseconds ttl,
                             bool single_flight, ClockFn clock)
    : fetcher_(fetcher), ttl_(ttl), single_flight_(single_flight), clock_(std::move(clock)) {
}

bool TopologyCache::IsFresh(const Entry& entry, Clock::time_point now) const {
  if (entry.fetched_at == kNever || !entry.topology)
    return false;
  return now - entry.fetched_at <= ttl_;
}

OpResult<TopologyPtr> TopologyCache::Get() {
  shared_ptr<const Entry> entry = entry_.load(memory_order_acquire);
  if (entry && IsFresh(*entry, Now())) {
    hits_.fetch_add(1, memory_order_relaxed);
    return entry->topology;
  }

  if (!single_flight_)
    return Refresh();

  absl::MutexLock lk(&refresh_mu_);

  // Another caller may have refreshed while we were waiting.
  entry = entry_.load(memory_order_acquire);
  if (entry && IsFresh(*entry, Now())) {
    hits_.fetch_add(1, memory_order_relaxed);
    return entry->topology;
  }

  return Refresh();
}

OpResult<TopologyPtr> TopologyCache::Refresh() {
  uint64_t epoch = epoch_.load(memory_order_acquire);

  fetches_.fetch_add(1, memory_order_relaxed);
  OpResult<TopologyPtr> res = fetcher_->Fetch();
  if (!res) {
    fetch_errors_.fetch_add(1, memory_order_relaxed);
    LOG(WARNING) << "Topology refresh failed: " << res.status();
    return res;
  }

  Clock::time_point fetched_at = Now();
  if (epoch_.load(memory_order_acquire) != epoch) {
    VLOG(1) << "Topology was invalidated during refresh, storing it as stale";
    fetched_at = kNever;
  }

  entry_.store(make_shared<const Entry>(Entry{*res, fetched_at}), memory_order_release);
  VLOG(1) << "Topology refreshed, " << (*res)->nodes().size() << " nodes";
  return res;
}

void TopologyCache::Invalidate() {
  epoch_.fetch_add(1, memory_order_acq_rel);
  invalidations_.fetch_add(1, memory_order_relaxed);

  shared_ptr<const Entry> entry = entry_.load(memory_order_acquire);
  TopologyPtr topology = entry ? entry->topology : nullptr;
  entry_.store(make_shared<const Entry>(Entry{std::move(topology), kNever}),
               memory_order_release);
  VLOG(1) << "Topology cache invalidated";
}

TopologyPtr TopologyCache::Peek() const {
  shared_ptr<const Entry> entry = entry_.load(memory_order_acquire);
  return entry ? entry->topology : nullptr;
}

TopologyCache::Stats TopologyCache::GetStats() const {
  Stats stats;
  stats.fetches = fetches_.load(memory_order_relaxed);
  stats.fetch_errors = fetch_errors_.load(memory_order_relaxed);
  stats.hits = hits_.load(memory_order_relaxed);
  stats.invalidations = invalidations_.load(memory_order_relaxed);
  return stats;
}

}  // namespace kvr::cluster
