// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster/cluster_defs.h"

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include <algorithm>

#include "router/cluster/slot_set.h"

using namespace std;

namespace kvr::cluster {

std::string SlotRange::ToString() const {
  return absl::StrCat("[", start, ", ", end, "]");
}

SlotRanges::SlotRanges(std::vector<SlotRange> ranges) : ranges_(std::move(ranges)) {
  std::sort(ranges_.begin(), ranges_.end());
}

void SlotRanges::Merge(const SlotRanges& sr) {
  SlotSet slots(*this);
  slots.Set(sr, true);
  ranges_ = std::move(slots.ToSlotRanges().ranges_);
}

std::string SlotRanges::ToString() const {
  return absl::StrJoin(ranges_, ", ", [](std::string* out, SlotRange range) {
    absl::StrAppend(out, range.ToString());
  });
}

std::string NodeAddress::ToString() const {
  if (absl::StrContains(host, ':'))
    return absl::StrCat("[", host, "]:", port);
  return absl::StrCat(host, ":", port);
}

std::string SynthesizeNodeId(std::string_view host, uint16_t port) {
  return NodeAddress{string(host), port}.ToString();
}

}  // namespace kvr::cluster

namespace std {

ostream& operator<<(ostream& os, const kvr::cluster::NodeAddress& addr) {
  return os << addr.ToString();
}

ostream& operator<<(ostream& os, const kvr::cluster::NodeInfo& node) {
  os << node.id << "@" << node.address().ToString();
  if (node.IsMaster()) {
    os << " master " << node.slot_ranges.ToString();
  } else {
    os << " replica of " << node.master_id;
  }
  return os;
}

}  // namespace std
