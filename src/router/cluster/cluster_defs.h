// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "router/cluster_support.h"

namespace kvr::cluster {

struct SlotRange {
  static constexpr SlotId kMaxSlotId = 0x3FFF;
  SlotId start = 0;
  SlotId end = 0;

  bool operator==(const SlotRange& r) const noexcept {
    return start == r.start && end == r.end;
  }

  bool operator<(const SlotRange& r) const noexcept {
    return start < r.start || (start == r.start && end < r.end);
  }

  bool IsValid() const noexcept {
    return start <= end && start <= kMaxSlotId && end <= kMaxSlotId;
  }

  bool Contains(SlotId id) const noexcept {
    return id >= start && id <= end;
  }

  std::string ToString() const;
};

class SlotRanges {
 public:
  SlotRanges() = default;
  explicit SlotRanges(std::vector<SlotRange> ranges);

  bool Contains(SlotId id) const noexcept {
    for (const auto& sr : ranges_) {
      if (sr.Contains(id))
        return true;
    }
    return false;
  }

  size_t Size() const noexcept {
    return ranges_.size();
  }

  bool Empty() const noexcept {
    return ranges_.empty();
  }

  void Merge(const SlotRanges& sr);

  bool operator==(const SlotRanges& r) const noexcept {
    return ranges_ == r.ranges_;
  }

  std::string ToString() const;

  auto begin() const noexcept {
    return ranges_.cbegin();
  }

  auto end() const noexcept {
    return ranges_.cend();
  }

 private:
  std::vector<SlotRange> ranges_;
};

// host:port pair a request can be dispatched to.
struct NodeAddress {
  std::string host;
  uint16_t port = 0;

  bool operator==(const NodeAddress& r) const noexcept {
    return port == r.port && host == r.host;
  }

  bool operator!=(const NodeAddress& r) const noexcept {
    return !(*this == r);
  }

  bool operator<(const NodeAddress& r) const noexcept {
    return host < r.host || (host == r.host && port < r.port);
  }

  // "host:port", or "[host]:port" for IPv6 literals.
  std::string ToString() const;

  template <typename H> friend H AbslHashValue(H h, const NodeAddress& addr) {
    return H::combine(std::move(h), addr.host, addr.port);
  }
};

enum class NodeRole : uint8_t { MASTER, REPLICA };

enum class LinkState : uint8_t { CONNECTED, DISCONNECTED };

struct NodeInfo {
  std::string id;
  std::string host;
  uint16_t port = 0;
  NodeRole role = NodeRole::MASTER;
  LinkState link_state = LinkState::CONNECTED;

  // Masters only.
  SlotRanges slot_ranges;
  // Replicas only: id of the master they replicate.
  std::string master_id;

  NodeAddress address() const {
    return NodeAddress{host, port};
  }

  bool IsMaster() const {
    return role == NodeRole::MASTER;
  }

  bool IsConnected() const {
    return link_state == LinkState::CONNECTED;
  }

  bool operator==(const NodeInfo& r) const noexcept {
    return port == r.port && host == r.host && id == r.id && role == r.role &&
           master_id == r.master_id && slot_ranges == r.slot_ranges;
  }

  bool operator<(const NodeInfo& r) const noexcept {
    return id < r.id;
  }
};

// One entry of a topology response: a slot range with the master serving it and its replicas.
struct ClusterShardInfo {
  SlotRange slot_range;
  NodeInfo master;
  std::vector<NodeInfo> replicas;
};

// Synthesized node id for nodes that do not report one.
std::string SynthesizeNodeId(std::string_view host, uint16_t port);

}  // namespace kvr::cluster

namespace std {

ostream& operator<<(ostream& os, const kvr::cluster::NodeAddress& addr);
ostream& operator<<(ostream& os, const kvr::cluster::NodeInfo& node);

}  // namespace std
