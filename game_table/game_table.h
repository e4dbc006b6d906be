// The BWAPI game table: a fixed array of 8 slots that every BWAPI server
// (one per running game instance) publishes its connection state into.
//
// The table lives in shared memory owned by the engine processes. We only
// ever observe it, without locks, so any snapshot may be torn or stale.

#ifndef GAME_TABLE_GAME_TABLE_H_
#define GAME_TABLE_GAME_TABLE_H_

#include <stddef.h>
#include <stdint.h>

#include <array>
#include <string>

#include "absl/status/statusor.h"

namespace game_table {

inline constexpr size_t kSlotCount = 8;

// Engine layout of one slot: a C struct of { u32 server_process_id;
// bool is_connected; u32 last_keep_alive_time; } with natural x86 alignment.
inline constexpr size_t kProcessIdOffset = 0;
inline constexpr size_t kConnectedOffset = 4;
inline constexpr size_t kKeepAliveOffset = 8;
inline constexpr size_t kSlotSize = 12;
inline constexpr size_t kTableSize = kSlotCount * kSlotSize;

inline constexpr char kDefaultSharedMemoryName[] =
    "/bwapi_shared_memory_game_list";

struct SlotStatus {
  // 0 marks an unused slot.
  uint32_t process_id = 0;
  bool connected = false;
  uint32_t last_keep_alive = 0;

  bool empty() const { return process_id == 0; }
};

struct GameTable {
  std::array<SlotStatus, kSlotCount> slots;

  // Decodes kTableSize bytes in the engine's layout.
  static GameTable decode(const uint8_t* data);

  // Writes the table in the engine's layout to kTableSize bytes at 'data'.
  void encode(uint8_t* data) const;

  // Number of slots with a connected client, empty or not.
  size_t connected_count() const;

  // True if some occupied slot has no client connected yet, i.e. an engine is
  // waiting for its client.
  bool has_free_slot() const;

  // True if every occupied slot has its client connected. Vacuously true for
  // an empty table.
  bool all_slots_filled() const;

  std::string to_string() const;
};

// Source of game table snapshots.
class GameTableReader {
 public:
  virtual ~GameTableReader() = default;

  // Returns a copy of the table as it is right now. Returns UNAVAILABLE when
  // no engine has published the table yet.
  virtual absl::StatusOr<GameTable> snapshot() = 0;
};

}  // namespace game_table

#endif
