#ifndef GAME_TABLE_SHARED_GAME_TABLE_H_
#define GAME_TABLE_SHARED_GAME_TABLE_H_

#include <stdint.h>

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "game_table/game_table.h"

namespace game_table {

// Reads the game table from the POSIX shared memory segment 'name'.
//
// The segment is attached lazily on the first snapshot() and the mapping is
// kept for the lifetime of this object. While the segment doesn't exist yet,
// every snapshot() retries the attach and returns UNAVAILABLE.
//
// One instance is created at startup and shared by reference.
class SharedGameTable : public GameTableReader {
 public:
  explicit SharedGameTable(std::string name = kDefaultSharedMemoryName)
      : name_(std::move(name)) {}
  ~SharedGameTable() override;

  // Delete copies and moves, since the mapping is owned.
  SharedGameTable(const SharedGameTable&) = delete;
  SharedGameTable& operator=(const SharedGameTable&) = delete;

  absl::StatusOr<GameTable> snapshot() override;

  bool attached() const { return mapping_ != nullptr; }
  const std::string& name() const { return name_; }

 private:
  absl::Status attach();

  std::string name_;
  const uint8_t* mapping_ = nullptr;
};

}  // namespace game_table

#endif
