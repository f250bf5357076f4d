// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <absl/base/thread_annotations.h>
#include <absl/container/flat_hash_map.h>
#include <absl/synchronization/mutex.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <thread>
#include <vector>

#include "router/execution_channel.h"

struct redisContext;

namespace kvr {

// ExecutionChannel over plain TCP connections to the nodes, using the hiredis client.
// Regular requests run on a fixed pool of io threads, blocking commands get a thread of their
// own so that a long BLPOP can not starve the pool. Idle connections are kept per node.
class HiredisChannel final : public ExecutionChannel {
 public:
  struct Options {
    std::chrono::milliseconds connect_timeout{1000};
    unsigned io_threads = 4;

    static Options FromFlags();
  };

  HiredisChannel(NodeAddress seed, const Options& opts);
  ~HiredisChannel() override;

  void Dispatch(const std::optional<NodeAddress>& address, facade::OwnedArgs args,
                CancellationPtr cancel, ReplyCb cb) override;

  const NodeAddress& seed() const {
    return seed_;
  }

 private:
  struct Task {
    NodeAddress address;
    facade::OwnedArgs args;
    CancellationPtr cancel;
    ReplyCb cb;
  };

  struct ContextDeleter {
    void operator()(redisContext* ctx) const;
  };

  using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;

  void WorkerLoop();
  void RunTask(Task task);

  facade::OpResult<facade::RespExpr> Run(const Task& task);
  facade::OpResult<facade::RespExpr> ReadReply(redisContext* ctx, const Cancellation& cancel);

  ContextPtr Acquire(const NodeAddress& addr);
  void Release(const NodeAddress& addr, ContextPtr ctx);

  NodeAddress seed_;
  Options opts_;
  std::atomic_bool stopping_{false};

  absl::Mutex mu_;
  absl::CondVar queue_cv_;
  std::deque<Task> queue_ ABSL_GUARDED_BY(mu_);
  unsigned blocking_inflight_ ABSL_GUARDED_BY(mu_) = 0;
  std::vector<std::thread> workers_;

  absl::Mutex pool_mu_;
  absl::flat_hash_map<NodeAddress, std::vector<ContextPtr>> idle_ ABSL_GUARDED_BY(pool_mu_);
};

}  // namespace kvr
