// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <bitset>
#include <memory>
#include <vector>

#include "router/cluster/cluster_defs.h"

namespace kvr::cluster {

// Set of hash slots backed by a heap allocated bitset.
class SlotSet {
 public:
  static constexpr uint32_t kSlotsNumber = SlotRange::kMaxSlotId + 1;
  using TBitSet = std::bitset<kSlotsNumber>;

  SlotSet(bool full_house = false) : slots_(std::make_unique<TBitSet>()) {
    if (full_house)
      slots_->flip();
  }

  SlotSet(const SlotRanges& slot_ranges) : slots_(std::make_unique<TBitSet>()) {
    Set(slot_ranges, true);
  }

  SlotSet(const SlotSet& s) : slots_(std::make_unique<TBitSet>(*s.slots_)) {
  }

  SlotSet(SlotSet&& s) = default;

  bool Contains(SlotId slot) const {
    return slots_->test(slot);
  }

  // Returns true if any slot of the range is in the set.
  bool Intersects(const SlotRange& range) const {
    for (uint32_t i = range.start; i <= range.end; ++i) {
      if (slots_->test(i))
        return true;
    }
    return false;
  }

  void Set(const SlotRange& range, bool value) {
    for (uint32_t i = range.start; i <= range.end; ++i) {
      slots_->set(i, value);
    }
  }

  void Set(const SlotRanges& slot_ranges, bool value) {
    for (const auto& slot_range : slot_ranges) {
      Set(slot_range, value);
    }
  }

  void Set(SlotId slot, bool value) {
    slots_->set(slot, value);
  }

  bool Empty() const {
    return slots_->none();
  }

  size_t Count() const {
    return slots_->count();
  }

  bool All() const {
    return slots_->all();
  }

  SlotRanges ToSlotRanges() const {
    std::vector<SlotRange> res;

    for (uint32_t i = 0; i < kSlotsNumber; ++i) {
      if (!slots_->test(i))
        continue;

      SlotRange range{SlotId(i), SlotId(i)};
      while (i + 1 < kSlotsNumber && slots_->test(i + 1)) {
        range.end = SlotId(++i);
      }
      res.push_back(range);
    }

    return SlotRanges(std::move(res));
  }

 private:
  std::unique_ptr<TBitSet> slots_;
};

}  // namespace kvr::cluster
