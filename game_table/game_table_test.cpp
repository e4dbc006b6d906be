#include "game_table/game_table.h"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/mman.h>
#include <unistd.h>

#include <string>

#include "game_table/shared_game_table.h"
#include "util/status_gtest.h"

namespace game_table {
namespace {

int last_segment_num = 0;

std::string get_next_segment_name() {
  return "/skirmish_game_table_test_" + std::to_string(getpid()) + "_" +
         std::to_string(last_segment_num++);
}

// Plays the engine's part: creates and writes a game table segment.
class FakeEngineTable {
 public:
  explicit FakeEngineTable(const std::string& name, size_t size = kTableSize)
      : name_(name), size_(size) {
    int fd = shm_open(name_.c_str(), O_CREAT | O_RDWR, 0600);
    EXPECT_GE(fd, 0);
    EXPECT_EQ(ftruncate(fd, size_), 0);
    void* mapping =
        mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd, 0);
    EXPECT_NE(mapping, MAP_FAILED);
    data_ = static_cast<uint8_t*>(mapping);
    close(fd);
  }

  ~FakeEngineTable() {
    munmap(data_, size_);
    shm_unlink(name_.c_str());
  }

  void publish(const GameTable& table) { table.encode(data_); }

 private:
  std::string name_;
  size_t size_;
  uint8_t* data_ = nullptr;
};

GameTable table_with(std::initializer_list<SlotStatus> slots) {
  GameTable table;
  size_t i = 0;
  for (const SlotStatus& slot : slots) table.slots[i++] = slot;
  return table;
}

TEST(GameTable, DecodesEngineLayout) {
  uint8_t raw[kTableSize] = {};
  // Slot 0: pid 0x01020304, connected, keep alive 7.
  raw[0] = 0x04;
  raw[1] = 0x03;
  raw[2] = 0x02;
  raw[3] = 0x01;
  raw[4] = 1;
  raw[8] = 7;
  // Slot 7: pid 42, not connected. Padding bytes are ignored.
  raw[7 * kSlotSize] = 42;
  raw[7 * kSlotSize + 5] = 0xff;

  GameTable table = GameTable::decode(raw);

  EXPECT_EQ(table.slots[0].process_id, 0x01020304u);
  EXPECT_TRUE(table.slots[0].connected);
  EXPECT_EQ(table.slots[0].last_keep_alive, 7u);
  EXPECT_TRUE(table.slots[3].empty());
  EXPECT_EQ(table.slots[7].process_id, 42u);
  EXPECT_FALSE(table.slots[7].connected);
}

TEST(GameTable, LayoutSize) { EXPECT_EQ(kTableSize, 96u); }

TEST(GameTable, EmptyTable) {
  GameTable table;
  EXPECT_EQ(table.connected_count(), 0u);
  EXPECT_FALSE(table.has_free_slot());
  EXPECT_TRUE(table.all_slots_filled());
}

TEST(GameTable, HasFreeSlotNeedsOccupiedDisconnectedSlot) {
  EXPECT_TRUE(table_with({{.process_id = 10, .connected = false}})
                  .has_free_slot());
  EXPECT_FALSE(table_with({{.process_id = 10, .connected = true}})
                   .has_free_slot());
  // A connected flag on an empty slot doesn't make it free.
  EXPECT_FALSE(table_with({{.process_id = 0, .connected = false}})
                   .has_free_slot());
  EXPECT_TRUE(table_with({{.process_id = 10, .connected = true},
                          {.process_id = 11, .connected = false}})
                  .has_free_slot());
}

TEST(GameTable, AllSlotsFilledIgnoresEmptySlots) {
  EXPECT_TRUE(table_with({{.process_id = 10, .connected = true},
                          {.process_id = 0, .connected = false},
                          {.process_id = 12, .connected = true}})
                  .all_slots_filled());
  EXPECT_FALSE(table_with({{.process_id = 10, .connected = true},
                           {.process_id = 11, .connected = false}})
                   .all_slots_filled());
}

TEST(GameTable, CountsConnectedSlots) {
  GameTable table = table_with({{.process_id = 10, .connected = true},
                                {.process_id = 11, .connected = false},
                                {.process_id = 12, .connected = true}});
  EXPECT_EQ(table.connected_count(), 2u);
}

TEST(SharedGameTable, MissingSegmentIsUnavailable) {
  SharedGameTable reader(get_next_segment_name());

  for (int i = 0; i < 3; ++i) {
    absl::StatusOr<GameTable> table = reader.snapshot();
    EXPECT_EQ(table.status().code(), absl::StatusCode::kUnavailable);
  }
  EXPECT_FALSE(reader.attached());
}

TEST(SharedGameTable, AttachesOnceSegmentAppears) {
  std::string name = get_next_segment_name();
  SharedGameTable reader(name);
  EXPECT_FALSE(reader.snapshot().ok());

  FakeEngineTable engine(name);
  engine.publish(table_with({{.process_id = 99, .connected = false}}));

  ASSERT_OK_AND_ASSIGN(GameTable table, reader.snapshot());
  EXPECT_TRUE(reader.attached());
  EXPECT_EQ(table.slots[0].process_id, 99u);
  EXPECT_TRUE(table.has_free_slot());
}

TEST(SharedGameTable, SnapshotsFollowEngineWrites) {
  std::string name = get_next_segment_name();
  FakeEngineTable engine(name);
  SharedGameTable reader(name);

  engine.publish(table_with({{.process_id = 99, .connected = false}}));
  ASSERT_OK_AND_ASSIGN(GameTable before, reader.snapshot());
  EXPECT_EQ(before.connected_count(), 0u);

  engine.publish(table_with({{.process_id = 99, .connected = true,
                              .last_keep_alive = 5}}));
  ASSERT_OK_AND_ASSIGN(GameTable after, reader.snapshot());
  EXPECT_EQ(after.connected_count(), 1u);
  EXPECT_EQ(after.slots[0].last_keep_alive, 5u);

  // The earlier snapshot is a copy.
  EXPECT_FALSE(before.slots[0].connected);
}

TEST(SharedGameTable, UndersizedSegmentIsUnavailable) {
  std::string name = get_next_segment_name();
  FakeEngineTable engine(name, /*size=*/kTableSize / 2);
  SharedGameTable reader(name);

  EXPECT_EQ(reader.snapshot().status().code(),
            absl::StatusCode::kUnavailable);
  EXPECT_FALSE(reader.attached());
}

}  // namespace
}  // namespace game_table
