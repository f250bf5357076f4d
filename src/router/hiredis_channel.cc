// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/hiredis_channel.h"

#include <absl/flags/flag.h>
#include <glog/logging.h>
#include <poll.h>
#include <sys/time.h>

#include <cerrno>
#include <cstring>

extern "C" {
#include <hiredis/hiredis.h>
}

#include "facade/resp_parser.h"
#include "router/command_spec.h"

ABSL_FLAG(uint32_t, hiredis_connect_timeout_ms, 1000,
          "Timeout for establishing a connection to a cluster node, in milliseconds.");

ABSL_FLAG(uint32_t, hiredis_io_threads, 4, "Number of threads running non blocking requests.");

using namespace std;
using facade::OpResult;
using facade::OpStatus;
using facade::OwnedArgs;
using facade::RespExpr;

namespace kvr {

namespace {

// How often a blocked read checks for cancellation.
constexpr int kPollIntervalMs = 5;

}  // namespace

HiredisChannel::Options HiredisChannel::Options::FromFlags() {
  Options opts;
  opts.connect_timeout = chrono::milliseconds(absl::GetFlag(FLAGS_hiredis_connect_timeout_ms));
  opts.io_threads = absl::GetFlag(FLAGS_hiredis_io_threads);
  return opts;
}

void HiredisChannel::ContextDeleter::operator()(redisContext* ctx) const {
  redisFree(ctx);
}

HiredisChannel::HiredisChannel(NodeAddress seed, const Options& opts)
    : seed_(std::move(seed)), opts_(opts) {
  unsigned num_threads = max(1u, opts_.io_threads);
  workers_.reserve(num_threads);
  for (unsigned i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this] { WorkerLoop(); });
  }
}

HiredisChannel::~HiredisChannel() {
  stopping_.store(true, memory_order_release);
  {
    absl::MutexLock lk(&mu_);
    queue_cv_.SignalAll();
  }

  for (auto& th : workers_)
    th.join();

  absl::MutexLock lk(&mu_);
  while (blocking_inflight_ > 0) {
    queue_cv_.Wait(&mu_);
  }
}

void HiredisChannel::Dispatch(const optional<NodeAddress>& address, OwnedArgs args,
                              CancellationPtr cancel, ReplyCb cb) {
  Task task{address.value_or(seed_), std::move(args), std::move(cancel), std::move(cb)};

  facade::CmdArgVec argv = facade::ToArgVec(task.args);
  if (HasOpt(argv, CO::BLOCKING)) {
    {
      absl::MutexLock lk(&mu_);
      ++blocking_inflight_;
    }
    thread([this, task = std::move(task)]() mutable {
      RunTask(std::move(task));
      absl::MutexLock lk(&mu_);
      --blocking_inflight_;
      queue_cv_.SignalAll();
    }).detach();
    return;
  }

  absl::MutexLock lk(&mu_);
  queue_.push_back(std::move(task));
  queue_cv_.Signal();
}

void HiredisChannel::WorkerLoop() {
  while (true) {
    Task task;
    {
      absl::MutexLock lk(&mu_);
      while (queue_.empty() && !stopping_.load(memory_order_acquire)) {
        queue_cv_.Wait(&mu_);
      }
      if (queue_.empty())
        return;
      task = std::move(queue_.front());
      queue_.pop_front();
    }
    RunTask(std::move(task));
  }
}

void HiredisChannel::RunTask(Task task) {
  OpResult<RespExpr> res = OpStatus::CANCELLED;
  if (!task.cancel->IsCancelled()) {
    res = Run(task);
  }
  task.cb(std::move(res));
}

OpResult<RespExpr> HiredisChannel::Run(const Task& task) {
  ContextPtr ctx = Acquire(task.address);
  if (!ctx)
    return OpStatus::IO_ERROR;

  vector<const char*> argv(task.args.size());
  vector<size_t> argv_len(task.args.size());
  for (size_t i = 0; i < task.args.size(); ++i) {
    argv[i] = task.args[i].data();
    argv_len[i] = task.args[i].size();
  }

  if (redisAppendCommandArgv(ctx.get(), argv.size(), argv.data(), argv_len.data()) != REDIS_OK) {
    LOG(WARNING) << "Could not encode request to " << task.address << ": " << ctx->errstr;
    return OpStatus::IO_ERROR;
  }

  int done = 0;
  while (!done) {
    if (redisBufferWrite(ctx.get(), &done) != REDIS_OK) {
      VLOG(1) << "Write to " << task.address << " failed: " << ctx->errstr;
      return OpStatus::IO_ERROR;
    }
  }

  OpResult<RespExpr> res = ReadReply(ctx.get(), *task.cancel);

  // A connection with a pending reply can not be reused. Dropping it also releases a
  // blocked command on the server.
  if (res)
    Release(task.address, std::move(ctx));
  return res;
}

OpResult<RespExpr> HiredisChannel::ReadReply(redisContext* ctx, const Cancellation& cancel) {
  void* reply = nullptr;
  while (true) {
    if (redisGetReplyFromReader(ctx, &reply) != REDIS_OK) {
      VLOG(1) << "Protocol error: " << ctx->errstr;
      return OpStatus::IO_ERROR;
    }
    if (reply)
      break;

    if (cancel.IsCancelled())
      return OpStatus::CANCELLED;
    if (stopping_.load(memory_order_acquire))
      return OpStatus::IO_ERROR;

    pollfd pfd{ctx->fd, POLLIN, 0};
    int res = poll(&pfd, 1, kPollIntervalMs);
    if (res < 0 && errno != EINTR) {
      VLOG(1) << "poll failed: " << strerror(errno);
      return OpStatus::IO_ERROR;
    }
    if (res > 0 && redisBufferRead(ctx) != REDIS_OK) {
      VLOG(1) << "Read failed: " << ctx->errstr;
      return OpStatus::IO_ERROR;
    }
  }

  RespExpr expr = facade::FromRedisReply(static_cast<redisReply*>(reply));
  freeReplyObject(reply);
  return expr;
}

HiredisChannel::ContextPtr HiredisChannel::Acquire(const NodeAddress& addr) {
  {
    absl::MutexLock lk(&pool_mu_);
    auto it = idle_.find(addr);
    if (it != idle_.end() && !it->second.empty()) {
      ContextPtr ctx = std::move(it->second.back());
      it->second.pop_back();
      return ctx;
    }
  }

  auto ms = opts_.connect_timeout.count();
  timeval tv{static_cast<time_t>(ms / 1000), static_cast<suseconds_t>((ms % 1000) * 1000)};
  ContextPtr ctx{redisConnectWithTimeout(addr.host.c_str(), addr.port, tv)};
  if (!ctx) {
    LOG(ERROR) << "Could not allocate a connection to " << addr;
    return nullptr;
  }

  if (ctx->err) {
    LOG(WARNING) << "Could not connect to " << addr << ": " << ctx->errstr;
    return nullptr;
  }

  VLOG(1) << "Connected to " << addr;
  return ctx;
}

void HiredisChannel::Release(const NodeAddress& addr, ContextPtr ctx) {
  absl::MutexLock lk(&pool_mu_);
  idle_[addr].push_back(std::move(ctx));
}

}  // namespace kvr
