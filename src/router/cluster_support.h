// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace kvr {

using SlotId = std::uint16_t;
constexpr SlotId kMaxSlotNum = 0x3FFF;
constexpr uint32_t kNumSlots = kMaxSlotNum + 1;

// A simple utility class that "aggregates" SlotId-s and can tell whether all inputs were the same.
class UniqueSlotChecker {
 public:
  void Add(std::string_view key);
  void Add(SlotId slot_id);

  std::optional<SlotId> GetUniqueSlotId() const;

  bool IsCrossSlot() const {
    return slot_id_ == kCrossSlot;
  }

  void Reset() {
    slot_id_ = kNoSlotId;
  }

 private:
  // kNoSlotId - if slot wasn't set at all
  static constexpr SlotId kNoSlotId = kMaxSlotNum + 1;
  // kCrossSlot - if several different slots were set
  static constexpr SlotId kCrossSlot = kNoSlotId + 1;

  SlotId slot_id_ = kNoSlotId;
};

// Returns the part of the key that is hashed: the content of the first non-empty {...} section,
// or the whole key.
std::string_view KeyTag(std::string_view key);

uint16_t Crc16(std::string_view data);

SlotId KeySlot(std::string_view key);

}  // namespace kvr
