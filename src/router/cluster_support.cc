// Copyright 2024, DragonflyDB authors.  All rights reserved.
// See LICENSE for licensing terms.
//

#include "router/cluster_support.h"

#include <array>

using namespace std;

namespace kvr {

namespace {

// CRC16-XMODEM: polynomial 0x1021, initial value 0.
constexpr array<uint16_t, 256> MakeCrc16Table() {
  array<uint16_t, 256> table{};
  for (uint16_t i = 0; i < 256; ++i) {
    uint16_t crc = i << 8;
    for (int j = 0; j < 8; ++j) {
      crc = (crc & 0x8000) ? (crc << 1) ^ 0x1021 : crc << 1;
    }
    table[i] = crc;
  }
  return table;
}

constexpr array<uint16_t, 256> kCrc16Table = MakeCrc16Table();

}  // namespace

void UniqueSlotChecker::Add(std::string_view key) {
  Add(KeySlot(key));
}

void UniqueSlotChecker::Add(SlotId slot_id) {
  if (slot_id_ == kNoSlotId) {
    slot_id_ = slot_id;
  } else if (slot_id_ != slot_id) {
    slot_id_ = kCrossSlot;
  }
}

optional<SlotId> UniqueSlotChecker::GetUniqueSlotId() const {
  return slot_id_ > kMaxSlotNum ? optional<SlotId>() : slot_id_;
}

string_view KeyTag(string_view key) {
  size_t start = key.find('{');
  if (start == string_view::npos)
    return key;

  size_t end = key.find('}', start + 1);
  if (end == string_view::npos || end == start + 1)
    return key;

  return key.substr(start + 1, end - start - 1);
}

uint16_t Crc16(string_view data) {
  uint16_t crc = 0;
  for (unsigned char c : data) {
    crc = (crc << 8) ^ kCrc16Table[((crc >> 8) ^ c) & 0xFF];
  }
  return crc;
}

SlotId KeySlot(string_view key) {
  return Crc16(KeyTag(key)) & kMaxSlotNum;
}

}  // namespace kvr
