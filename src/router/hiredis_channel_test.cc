// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/hiredis_channel.h"

#include <absl/synchronization/notification.h>
#include <arpa/inet.h>
#include <glog/logging.h>
#include <gmock/gmock.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "facade/facade_test.h"
#include "facade/resp_parser.h"

using namespace std;
using namespace testing;
using facade::CmdArgVec;
using facade::OpResult;
using facade::OpStatus;
using facade::RespExpr;

namespace kvr {

namespace {

// Accepts a single connection and answers every request it reads with `reply`. An empty
// reply means the server never answers.
class ScriptedServer {
 public:
  explicit ScriptedServer(string reply) : reply_(std::move(reply)) {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    CHECK_GE(listen_fd_, 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    CHECK_EQ(bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    CHECK_EQ(listen(listen_fd_, 4), 0);

    socklen_t len = sizeof(addr);
    CHECK_EQ(getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    port_ = ntohs(addr.sin_port);

    thread_ = thread([this] { Serve(); });
  }

  ~ScriptedServer() {
    shutdown(listen_fd_, SHUT_RDWR);
    close(listen_fd_);
    thread_.join();
  }

  NodeAddress address() const {
    return NodeAddress{"127.0.0.1", port_};
  }

  // Requests received so far.
  vector<RespExpr> requests() {
    absl::MutexLock lk(&mu_);
    return requests_;
  }

 private:
  void Serve() {
    int fd = accept(listen_fd_, nullptr, nullptr);
    if (fd < 0)
      return;

    facade::RESPParser parser;
    char buf[512];
    while (true) {
      ssize_t n = read(fd, buf, sizeof(buf));
      if (n <= 0)
        break;

      auto res = parser.Feed(string_view{buf, size_t(n)});
      while (res && res->has_value()) {
        {
          absl::MutexLock lk(&mu_);
          requests_.push_back(std::move(**res));
        }
        if (!reply_.empty())
          CHECK_EQ(write(fd, reply_.data(), reply_.size()), ssize_t(reply_.size()));
        res = parser.Feed("");
      }
    }
    close(fd);
  }

  string reply_;
  int listen_fd_ = -1;
  uint16_t port_ = 0;
  thread thread_;

  absl::Mutex mu_;
  vector<RespExpr> requests_ ABSL_GUARDED_BY(mu_);
};

HiredisChannel::Options TestOptions() {
  HiredisChannel::Options opts;
  opts.connect_timeout = 200ms;
  opts.io_threads = 2;
  return opts;
}

}  // namespace

TEST(HiredisChannelTest, Execute) {
  ScriptedServer server("+PONG\r\n");
  HiredisChannel channel(server.address(), TestOptions());

  const string_view ping[] = {"PING"};
  OpResult<RespExpr> res = channel.Execute(nullopt, ping);
  ASSERT_TRUE(res) << res.status();
  EXPECT_EQ(*res, "PONG");

  // The idle connection is reused.
  const string_view get[] = {"GET", "foo"};
  res = channel.Execute(server.address(), get);
  ASSERT_TRUE(res);
  EXPECT_THAT(server.requests(), ElementsAre(RespElementsAre("PING"),
                                             RespElementsAre("GET", "foo")));
}

TEST(HiredisChannelTest, ErrorReplyIsAValue) {
  ScriptedServer server("-MOVED 12182 127.0.0.1:7002\r\n");
  HiredisChannel channel(server.address(), TestOptions());

  const string_view get[] = {"GET", "foo"};
  OpResult<RespExpr> res = channel.Execute(nullopt, get);
  ASSERT_TRUE(res);
  EXPECT_THAT(*res, ErrArg("MOVED 12182"));
}

TEST(HiredisChannelTest, ConnectionRefused) {
  HiredisChannel channel(NodeAddress{"127.0.0.1", 1}, TestOptions());

  const string_view ping[] = {"PING"};
  EXPECT_EQ(channel.Execute(nullopt, ping).status(), OpStatus::IO_ERROR);
}

TEST(HiredisChannelTest, CancelBlockedRead) {
  ScriptedServer server("");
  HiredisChannel channel(server.address(), TestOptions());

  auto cancel = make_shared<Cancellation>();
  absl::Notification done;
  OpResult<RespExpr> res = OpStatus::OK;
  channel.Dispatch(nullopt, {"BLPOP", "list", "0"}, cancel, [&](OpResult<RespExpr> r) {
    res = std::move(r);
    done.Notify();
  });

  EXPECT_FALSE(done.WaitForNotificationWithTimeout(absl::Milliseconds(50)));
  cancel->Cancel();
  done.WaitForNotification();
  EXPECT_EQ(res.status(), OpStatus::CANCELLED);
}

TEST(HiredisChannelTest, CancelledBeforeSend) {
  HiredisChannel channel(NodeAddress{"127.0.0.1", 1}, TestOptions());

  auto cancel = make_shared<Cancellation>();
  cancel->Cancel();

  absl::Notification done;
  OpResult<RespExpr> res = OpStatus::OK;
  channel.Dispatch(nullopt, {"PING"}, cancel, [&](OpResult<RespExpr> r) {
    res = std::move(r);
    done.Notify();
  });
  done.WaitForNotification();
  EXPECT_EQ(res.status(), OpStatus::CANCELLED);
}

}  // namespace kvr
