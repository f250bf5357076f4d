// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/cluster_commands.h"

#include <absl/strings/str_cat.h>
#include <gmock/gmock.h>

#include "router/test_utils.h"

using namespace std;
using namespace testing;

namespace kvr::cluster {

class ClusterCommandsTest : public BaseClusterTest {
 protected:
  ClusterCommands* commands() {
    return conn_->commands();
  }

  // All keys of the "{b}" hash tag live in slot 3300, on m1.
  void FillM1(size_t count) {
    for (size_t i = 0; i < count; ++i)
      fake_.SetString(absl::StrCat("{b}", i), "v");
  }
};

TEST_F(ClusterCommandsTest, ParseInfoLines) {
  StringMap info = ParseInfoLines("# Server\r\nrun_id:abc\r\n\r\nnocolon\r\naddr:h:1\r\n");
  EXPECT_EQ(info.size(), 2u);
  EXPECT_EQ(info["run_id"], "abc");
  EXPECT_EQ(info["addr"], "h:1");
  EXPECT_TRUE(ParseInfoLines("").empty());
}

TEST_F(ClusterCommandsTest, SlotAssignment) {
  fake_.AddMaster("m3", 7005, {});
  NodeInfo m3 = fake_.Node("m3");

  ASSERT_TRUE(commands()->DeleteSlotsInRange(m2_, SlotRange{16000, kMaxSlotNum}));
  OpResult<NodeInfo> node = commands()->GetNodeForSlot(16100);
  EXPECT_EQ(node.status(), OpStatus::UNRESOLVABLE_KEY);

  OpResult<RespExpr> res = commands()->AddSlotsInRange(m3, SlotRange{16000, kMaxSlotNum});
  ASSERT_TRUE(res);
  EXPECT_EQ(*res, "OK");

  node = commands()->GetNodeForSlot(16100);
  ASSERT_TRUE(node);
  EXPECT_EQ(node->id, "m3");
  EXPECT_EQ(node->slot_ranges.ToString(), "[16000, 16383]");

  const SlotId slots[] = {100, 101};
  ASSERT_TRUE(commands()->DeleteSlots(m1_, slots));
  EXPECT_EQ(commands()->GetNodeForKey(KeyForSlot(101)).status(), OpStatus::UNRESOLVABLE_KEY);

  ASSERT_TRUE(commands()->AddSlots(m2_, slots));
  node = commands()->GetNodeForKey(KeyForSlot(101));
  ASSERT_TRUE(node);
  EXPECT_EQ(node->id, "m2");
}

TEST_F(ClusterCommandsTest, SlotAssignmentErrors) {
  const SlotId busy[] = {100};
  OpResult<RespExpr> res = commands()->AddSlots(m2_, busy);
  ASSERT_TRUE(res);
  EXPECT_THAT(*res, ErrArg("already busy"));

  res = commands()->AddSlots(r1_, busy);
  ASSERT_TRUE(res);
  EXPECT_THAT(*res, ErrArg("Only masters"));

  // Topology is unchanged.
  OpResult<NodeInfo> node = commands()->GetNodeForSlot(100);
  ASSERT_TRUE(node);
  EXPECT_EQ(node->id, "m1");
}

TEST_F(ClusterCommandsTest, SetSlot) {
  fake_.SetString("bar", "1");
  SlotId slot = ClusterCommands::GetSlotForKey("bar");
  EXPECT_EQ(slot, 5061u);

  OpResult<RespExpr> res = commands()->SetSlot(m1_, slot, SetSlotMode::STABLE);
  ASSERT_TRUE(res);
  EXPECT_EQ(*res, "OK");

  EXPECT_EQ(commands()->SetSlot(m1_, slot, SetSlotMode::NODE).status(), OpStatus::SYNTAX_ERR);

  ASSERT_TRUE(commands()->SetSlot(m2_, slot, SetSlotMode::IMPORTING, m1_));
  ASSERT_TRUE(commands()->SetSlot(m1_, slot, SetSlotMode::MIGRATING, m2_));

  // The target may be given by address only.
  NodeInfo target;
  target.host = m2_.host;
  target.port = m2_.port;
  res = commands()->SetSlot(m1_, slot, SetSlotMode::NODE, target);
  ASSERT_TRUE(res);
  EXPECT_EQ(*res, "OK");

  OpResult<NodeInfo> node = commands()->GetNodeForKey("bar");
  ASSERT_TRUE(node);
  EXPECT_EQ(node->id, "m2");
  EXPECT_EQ(Run({"GET", "bar"}, {"bar"}), "1");

  NodeInfo unknown;
  unknown.host = "10.9.9.9";
  unknown.port = 1;
  EXPECT_EQ(commands()->SetSlot(m1_, slot, SetSlotMode::NODE, unknown).status(),
            OpStatus::NODE_NOT_FOUND);
}

TEST_F(ClusterCommandsTest, ForgetAndMeet) {
  OpResult<vector<NodeInfo>> nodes = commands()->GetNodes();
  ASSERT_TRUE(nodes);
  EXPECT_EQ(nodes->size(), 4u);

  OpResult<RespExpr> res = commands()->ForgetNode(r2_);
  ASSERT_TRUE(res);
  EXPECT_EQ(*res, "OK");
  EXPECT_EQ(fake_.CallCount("CLUSTER FORGET"), 2u);

  nodes = commands()->GetNodes();
  ASSERT_TRUE(nodes);
  EXPECT_EQ(nodes->size(), 3u);
  EXPECT_EQ(commands()->ForgetNode(r2_).status(), OpStatus::NODE_NOT_FOUND);

  res = commands()->MeetNode(r2_.host, r2_.port);
  ASSERT_TRUE(res);
  EXPECT_EQ(*res, "OK");

  nodes = commands()->GetNodes();
  ASSERT_TRUE(nodes);
  EXPECT_EQ(nodes->size(), 4u);
}

TEST_F(ClusterCommandsTest, ForgetFailures) {
  fake_.SetNodeDown(m2_.address(), true);
  EXPECT_EQ(commands()->ForgetNode(r1_).status(), OpStatus::PARTIAL_FAILURE);

  fake_.SetNodeDown(m1_.address(), true);
  fake_.SetDefaultNode(r1_.address());
  EXPECT_EQ(commands()->ForgetNode(r2_).status(), OpStatus::IO_ERROR);
}

TEST_F(ClusterCommandsTest, Replicate) {
  fake_.AddMaster("m3", 7005, {});
  NodeInfo m3 = fake_.Node("m3");

  OpResult<RespExpr> res = commands()->Replicate(m1_, m3);
  ASSERT_TRUE(res);
  EXPECT_EQ(*res, "OK");

  OpResult<vector<NodeInfo>> replicas = commands()->GetReplicas(m1_);
  ASSERT_TRUE(replicas);
  EXPECT_EQ(replicas->size(), 2u);

  // A master with slots can not become a replica.
  res = commands()->Replicate(m1_, m2_);
  ASSERT_TRUE(res);
  EXPECT_THAT(*res, ErrArg("must be empty"));
}

TEST_F(ClusterCommandsTest, TopologyQueries) {
  OpResult<vector<NodeInfo>> replicas = commands()->GetReplicas(m2_);
  ASSERT_TRUE(replicas);
  ASSERT_EQ(replicas->size(), 1u);
  EXPECT_EQ((*replicas)[0].id, "r2");
  EXPECT_EQ(commands()->GetReplicas(r1_).status(), OpStatus::NODE_NOT_FOUND);

  auto pairs = commands()->GetMasterReplicaMap();
  ASSERT_TRUE(pairs);
  ASSERT_EQ(pairs->size(), 2u);
  EXPECT_EQ((*pairs)[0].first.id, "m1");
  ASSERT_EQ((*pairs)[0].second.size(), 1u);
  EXPECT_EQ((*pairs)[0].second[0].id, "r1");

  fake_.SetString("foo", "1");
  SlotId slot = ClusterCommands::GetSlotForKey("foo");
  OpResult<int64_t> count = commands()->CountKeysInSlot(slot);
  ASSERT_TRUE(count);
  EXPECT_EQ(*count, 1);

  OpResult<vector<string>> keys = commands()->GetKeysInSlot(slot, 10);
  ASSERT_TRUE(keys);
  EXPECT_THAT(*keys, ElementsAre("foo"));
  EXPECT_EQ(fake_.CallCount(m2_.address(), "CLUSTER GETKEYSINSLOT"), 1u);

  OpResult<StringMap> info = commands()->GetClusterInfo();
  ASSERT_TRUE(info);
  EXPECT_EQ((*info)["cluster_state"], "ok");
  EXPECT_EQ((*info)["cluster_known_nodes"], "4");
  EXPECT_EQ((*info)["cluster_size"], "2");
}

TEST_F(ClusterCommandsTest, NodeCommands) {
  OpResult<RespExpr> pong = commands()->Ping(r2_);
  ASSERT_TRUE(pong);
  EXPECT_EQ(*pong, "PONG");

  OpResult<RespExpr> random = commands()->RandomKey(m1_);
  ASSERT_TRUE(random);
  EXPECT_TRUE(random->IsNil());

  FillM1(3);
  fake_.SetString("foo", "1");

  random = commands()->RandomKey(m1_);
  ASSERT_TRUE(random);
  EXPECT_EQ(*random, "{b}0");

  OpResult<vector<string>> keys = commands()->Keys(m1_, "*");
  ASSERT_TRUE(keys);
  EXPECT_THAT(*keys, UnorderedElementsAre("{b}0", "{b}1", "{b}2"));

  keys = commands()->Keys(r2_, "f*");
  ASSERT_TRUE(keys);
  EXPECT_THAT(*keys, ElementsAre("foo"));

  OpResult<int64_t> size = commands()->DbSize(m1_);
  ASSERT_TRUE(size);
  EXPECT_EQ(*size, 3);

  OpResult<StringMap> info = commands()->Info(r1_);
  ASSERT_TRUE(info);
  EXPECT_EQ((*info)["run_id"], "r1");
  EXPECT_EQ((*info)["role"], "slave");

  fake_.SetNodeDown(m2_.address(), true);
  EXPECT_EQ(commands()->DbSize(m2_).status(), OpStatus::IO_ERROR);
}

TEST_F(ClusterCommandsTest, Scan) {
  FillM1(15);

  OpResult<ClusterCommands::ScanResult> page = commands()->Scan(m1_, "0", nullopt, 10);
  ASSERT_TRUE(page);
  EXPECT_EQ(page->keys.size(), 10u);
  EXPECT_NE(page->cursor, "0");

  vector<string> all = page->keys;
  page = commands()->Scan(m1_, page->cursor, nullopt, 10);
  ASSERT_TRUE(page);
  EXPECT_EQ(page->cursor, "0");
  all.insert(all.end(), page->keys.begin(), page->keys.end());
  EXPECT_EQ(all.size(), 15u);

  page = commands()->Scan(m1_, "0", "{b}1*", 100);
  ASSERT_TRUE(page);
  EXPECT_EQ(page->cursor, "0");
  EXPECT_THAT(page->keys,
              UnorderedElementsAre("{b}1", "{b}10", "{b}11", "{b}12", "{b}13", "{b}14"));

  page = commands()->Scan(m2_, "0");
  ASSERT_TRUE(page);
  EXPECT_THAT(page->keys, IsEmpty());

  EXPECT_EQ(commands()->Scan(m1_, "notanumber").status(), OpStatus::NODE_ERROR);
}

TEST_F(ClusterCommandsTest, Config) {
  OpResult<StringMap> config = commands()->ConfigGet(m1_, "max*");
  ASSERT_TRUE(config);
  EXPECT_THAT(*config, UnorderedElementsAre(Pair("maxmemory", "0")));

  OpResult<RespExpr> res = commands()->ConfigSet(m1_, "maxmemory", "1gb");
  ASSERT_TRUE(res);
  EXPECT_EQ(*res, "OK");

  config = commands()->ConfigGet(m1_, "maxmemory");
  ASSERT_TRUE(config);
  EXPECT_EQ((*config)["maxmemory"], "1gb");

  // Cluster wide.
  res = commands()->ConfigSet("timeout", "30");
  ASSERT_TRUE(res);
  EXPECT_EQ(*res, "OK");

  OpResult<ClusterCommands::Aggregated> all = commands()->ConfigGet("timeout");
  ASSERT_TRUE(all);
  EXPECT_FALSE(all->partial());
  EXPECT_EQ(all->values.size(), 4u);
  for (const NodeInfo* node : {&m1_, &m2_, &r1_, &r2_}) {
    EXPECT_EQ(all->values[absl::StrCat(node->address().ToString(), ".timeout")], "30");
  }

  fake_.SetNodeDown(r2_.address(), true);
  EXPECT_EQ(commands()->ConfigSet("timeout", "0").status(), OpStatus::PARTIAL_FAILURE);
}

TEST_F(ClusterCommandsTest, ClusterInfoAggregation) {
  OpResult<ClusterCommands::Aggregated> info = commands()->Info();
  ASSERT_TRUE(info);
  EXPECT_FALSE(info->partial());
  EXPECT_EQ(info->values["127.0.0.1:7001.run_id"], "m1");
  EXPECT_EQ(info->values["127.0.0.1:7004.role"], "slave");

  fake_.SetNodeDown(r2_.address(), true);
  info = commands()->Info("server");
  ASSERT_TRUE(info);
  EXPECT_TRUE(info->partial());
  ASSERT_EQ(info->failed_nodes.size(), 1u);
  EXPECT_EQ(info->failed_nodes[0].id, "r2");
  EXPECT_EQ(info->values.count("127.0.0.1:7004.run_id"), 0u);
}

TEST_F(ClusterCommandsTest, DbSizeFlushAllLastSave) {
  FillM1(2);
  fake_.SetString("foo", "1");

  OpResult<int64_t> size = commands()->DbSize();
  ASSERT_TRUE(size);
  EXPECT_EQ(*size, 3);

  OpResult<int64_t> last = commands()->LastSave();
  ASSERT_TRUE(last);
  EXPECT_EQ(*last, 1700000001);

  OpResult<RespExpr> res = commands()->FlushAll();
  ASSERT_TRUE(res);
  EXPECT_EQ(*res, "OK");

  size = commands()->DbSize();
  ASSERT_TRUE(size);
  EXPECT_EQ(*size, 0);

  // A partial count would be wrong, so it fails.
  fake_.SetNodeDown(m2_.address(), true);
  EXPECT_EQ(commands()->DbSize().status(), OpStatus::PARTIAL_FAILURE);
  EXPECT_EQ(commands()->LastSave().status(), OpStatus::PARTIAL_FAILURE);
  EXPECT_EQ(commands()->FlushAll().status(), OpStatus::PARTIAL_FAILURE);
}

}  // namespace kvr::cluster
