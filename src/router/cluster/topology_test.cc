// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/topology.h"

#include <gmock/gmock.h>

#include "router/cluster/slot_set.h"

using namespace std;
using namespace testing;
using facade::OpResult;
using facade::OpStatus;

namespace kvr::cluster {

MATCHER_P(NodeMatches, expected, "") {
  return arg.id == expected.id && arg.host == expected.host && arg.port == expected.port;
}

class TopologyTest : public ::testing::Test {
 protected:
  static NodeInfo MakeNode(string id, uint16_t port) {
    NodeInfo node;
    node.id = std::move(id);
    node.host = "10.0.0.1";
    node.port = port;
    return node;
  }

  static ClusterShardInfo MakeShard(SlotId start, SlotId end, NodeInfo master,
                                    vector<NodeInfo> replicas = {}) {
    return ClusterShardInfo{SlotRange{start, end}, std::move(master), std::move(replicas)};
  }

  const NodeInfo m1_ = MakeNode("m1", 7001);
  const NodeInfo m2_ = MakeNode("m2", 7002);
  const NodeInfo r1_ = MakeNode("r1", 7003);
  const NodeInfo r2_ = MakeNode("r2", 7004);
};

TEST(SlotRangeTest, Basic) {
  SlotRange range{10, 20};
  EXPECT_TRUE(range.IsValid());
  EXPECT_TRUE(range.Contains(10));
  EXPECT_TRUE(range.Contains(20));
  EXPECT_FALSE(range.Contains(21));
  EXPECT_EQ(range.ToString(), "[10, 20]");

  EXPECT_FALSE((SlotRange{5, 4}.IsValid()));
  EXPECT_FALSE((SlotRange{0, kNumSlots}.IsValid()));
}

TEST(SlotRangeTest, Merge) {
  SlotRanges ranges({{100, 200}, {0, 10}});
  EXPECT_EQ(ranges.ToString(), "[0, 10], [100, 200]");

  ranges.Merge(SlotRanges({{11, 99}, {150, 300}}));
  EXPECT_EQ(ranges.Size(), 1u);
  EXPECT_EQ(ranges.ToString(), "[0, 300]");
  EXPECT_TRUE(ranges.Contains(300));
  EXPECT_FALSE(ranges.Contains(301));
}

TEST(SlotSetTest, Ranges) {
  SlotSet slots;
  EXPECT_TRUE(slots.Empty());

  slots.Set(SlotRange{0, 99}, true);
  slots.Set(SlotRange{50, 59}, false);
  EXPECT_EQ(slots.Count(), 90u);
  EXPECT_TRUE(slots.Intersects(SlotRange{55, 60}));
  EXPECT_FALSE(slots.Intersects(SlotRange{50, 59}));
  EXPECT_EQ(slots.ToSlotRanges().ToString(), "[0, 49], [60, 99]");

  EXPECT_TRUE(SlotSet(true).All());
}

TEST(NodeAddressTest, ToString) {
  EXPECT_EQ((NodeAddress{"127.0.0.1", 6379}.ToString()), "127.0.0.1:6379");
  EXPECT_EQ((NodeAddress{"::1", 6379}.ToString()), "[::1]:6379");
  EXPECT_EQ(SynthesizeNodeId("host", 1), "host:1");
}

TEST_F(TopologyTest, Create) {
  OpResult<TopologyPtr> res =
      Topology::Create({MakeShard(0, 8191, m1_, {r1_}), MakeShard(8192, kMaxSlotNum, m2_, {r2_})});
  ASSERT_TRUE(res);

  const Topology& topology = **res;
  EXPECT_TRUE(topology.slots().IsComplete());
  EXPECT_EQ(topology.nodes().size(), 4u);
  EXPECT_THAT(topology.NodeForSlot(0), Pointee(NodeMatches(m1_)));
  EXPECT_THAT(topology.NodeForSlot(8192), Pointee(NodeMatches(m2_)));
  EXPECT_THAT(topology.NodeForKey("foo"), Pointee(NodeMatches(m2_)));  // slot 12182
  EXPECT_THAT(topology.NodeForKey("bar"), Pointee(NodeMatches(m1_)));  // slot 5061

  EXPECT_THAT(topology.GetSlotServingNodes(100),
              ElementsAre(Pointee(NodeMatches(m1_)), Pointee(NodeMatches(r1_))));

  const NodeInfo* replica = topology.nodes().LookupById("r2");
  ASSERT_TRUE(replica);
  EXPECT_FALSE(replica->IsMaster());
  EXPECT_EQ(replica->master_id, "m2");

  EXPECT_THAT(topology.nodes().Masters(),
              ElementsAre(Pointee(NodeMatches(m1_)), Pointee(NodeMatches(m2_))));
  EXPECT_THAT(topology.nodes().ReplicasOf("m1"), ElementsAre(Pointee(NodeMatches(r1_))));
}

TEST_F(TopologyTest, MasterWithSeveralRanges) {
  OpResult<TopologyPtr> res = Topology::Create(
      {MakeShard(0, 99, m1_, {r1_}), MakeShard(100, 199, m2_), MakeShard(200, 299, m1_, {r1_})});
  ASSERT_TRUE(res);

  const NodeInfo* master = (*res)->nodes().LookupById("m1");
  ASSERT_TRUE(master);
  EXPECT_EQ(master->slot_ranges.ToString(), "[0, 99], [200, 299]");
  EXPECT_EQ((*res)->nodes().size(), 3u);
  EXPECT_EQ((*res)->slots().CoveredCount(), 300u);
  EXPECT_EQ((*res)->slots().CoveredSlots().ToString(), "[0, 299]");
}

TEST_F(TopologyTest, PartialCoverage) {
  OpResult<TopologyPtr> res = Topology::Create({MakeShard(0, 99, m1_)});
  ASSERT_TRUE(res);
  EXPECT_FALSE((*res)->slots().IsComplete());
  EXPECT_EQ((*res)->NodeForSlot(100), nullptr);
  EXPECT_THAT((*res)->GetSlotServingNodes(100), IsEmpty());
}

TEST_F(TopologyTest, Empty) {
  OpResult<TopologyPtr> res = Topology::Create({});
  ASSERT_TRUE(res);
  EXPECT_TRUE((*res)->nodes().empty());
  EXPECT_EQ((*res)->slots().CoveredCount(), 0u);
}

TEST_F(TopologyTest, Overlap) {
  EXPECT_EQ(Topology::Create({MakeShard(0, 100, m1_), MakeShard(100, 200, m2_)}).status(),
            OpStatus::TOPOLOGY_PARSE_ERROR);
}

TEST_F(TopologyTest, InvalidRange) {
  EXPECT_EQ(Topology::Create({MakeShard(10, 5, m1_)}).status(), OpStatus::TOPOLOGY_PARSE_ERROR);
}

TEST_F(TopologyTest, ConflictingNodes) {
  // Same id, two addresses.
  NodeInfo moved = m1_;
  moved.port = 9000;
  EXPECT_EQ(Topology::Create({MakeShard(0, 10, m1_), MakeShard(11, 20, moved)}).status(),
            OpStatus::TOPOLOGY_PARSE_ERROR);

  // Same address, two ids.
  NodeInfo alias = m1_;
  alias.id = "alias";
  EXPECT_EQ(Topology::Create({MakeShard(0, 10, m1_), MakeShard(11, 20, alias)}).status(),
            OpStatus::TOPOLOGY_PARSE_ERROR);

  // A replica under two masters.
  EXPECT_EQ(
      Topology::Create({MakeShard(0, 10, m1_, {r1_}), MakeShard(11, 20, m2_, {r1_})}).status(),
      OpStatus::TOPOLOGY_PARSE_ERROR);

  // A master listed as a replica.
  EXPECT_EQ(Topology::Create({MakeShard(0, 10, m1_), MakeShard(11, 20, m2_, {m1_})}).status(),
            OpStatus::TOPOLOGY_PARSE_ERROR);
}

TEST_F(TopologyTest, Lookup) {
  OpResult<TopologyPtr> res = Topology::Create({MakeShard(0, kMaxSlotNum, m1_, {r1_})});
  ASSERT_TRUE(res);
  const NodeRegistry& nodes = (*res)->nodes();

  EXPECT_THAT(nodes.LookupByAddress("10.0.0.1", 7003), Pointee(NodeMatches(r1_)));
  EXPECT_EQ(nodes.LookupByAddress("10.0.0.1", 1), nullptr);

  NodeInfo by_id;
  by_id.id = "r1";
  EXPECT_THAT(nodes.Lookup(by_id), Pointee(NodeMatches(r1_)));

  NodeInfo by_address = r1_;
  by_address.id = "whatever";
  EXPECT_THAT(nodes.Lookup(by_address), Pointee(NodeMatches(r1_)));
  EXPECT_EQ(nodes.IndexOf("missing"), nodes.size());
  EXPECT_THAT(nodes.ActiveMasters(), ElementsAre(Pointee(NodeMatches(m1_))));
}

}  // namespace kvr::cluster
