#include "game_table/game_table.h"

#include "absl/strings/str_cat.h"

namespace game_table {
namespace {

uint32_t read_u32_le(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | static_cast<uint32_t>(p[1]) << 8 |
         static_cast<uint32_t>(p[2]) << 16 | static_cast<uint32_t>(p[3]) << 24;
}

void write_u32_le(uint8_t* p, uint32_t v) {
  p[0] = v & 0xff;
  p[1] = (v >> 8) & 0xff;
  p[2] = (v >> 16) & 0xff;
  p[3] = (v >> 24) & 0xff;
}

}  // namespace

GameTable GameTable::decode(const uint8_t* data) {
  GameTable table;
  for (size_t i = 0; i < kSlotCount; ++i) {
    const uint8_t* slot = data + i * kSlotSize;
    table.slots[i] = SlotStatus{
        .process_id = read_u32_le(slot + kProcessIdOffset),
        .connected = slot[kConnectedOffset] != 0,
        .last_keep_alive = read_u32_le(slot + kKeepAliveOffset),
    };
  }
  return table;
}

void GameTable::encode(uint8_t* data) const {
  for (size_t i = 0; i < kSlotCount; ++i) {
    uint8_t* slot = data + i * kSlotSize;
    for (size_t j = 0; j < kSlotSize; ++j) slot[j] = 0;
    write_u32_le(slot + kProcessIdOffset, slots[i].process_id);
    slot[kConnectedOffset] = slots[i].connected ? 1 : 0;
    write_u32_le(slot + kKeepAliveOffset, slots[i].last_keep_alive);
  }
}

size_t GameTable::connected_count() const {
  size_t count = 0;
  for (const SlotStatus& slot : slots) {
    if (slot.connected) count++;
  }
  return count;
}

bool GameTable::has_free_slot() const {
  for (const SlotStatus& slot : slots) {
    if (!slot.empty() && !slot.connected) return true;
  }
  return false;
}

bool GameTable::all_slots_filled() const {
  for (const SlotStatus& slot : slots) {
    if (!slot.empty() && !slot.connected) return false;
  }
  return true;
}

std::string GameTable::to_string() const {
  std::string out;
  for (size_t i = 0; i < kSlotCount; ++i) {
    const SlotStatus& slot = slots[i];
    absl::StrAppend(&out, "slot ", i, ": pid=", slot.process_id,
                    " connected=", slot.connected ? "yes" : "no",
                    " keep_alive=", slot.last_keep_alive, "\n");
  }
  return out;
}

}  // namespace game_table
