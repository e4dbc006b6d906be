#include "game_table/shared_game_table.h"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include "process/fd.h"
#include "util/libc_error.h"

namespace game_table {

SharedGameTable::~SharedGameTable() {
  if (mapping_) {
    munmap(const_cast<uint8_t*>(mapping_), kTableSize);
  }
}

absl::Status SharedGameTable::attach() {
  Fd fd = Fd::take(shm_open(name_.c_str(), O_RDONLY, 0));
  if (!fd.valid()) {
    return absl::UnavailableError("Could not open game table '" + name_ +
                                  "': " + libc_error_name(errno));
  }

  // The engine may still be sizing the segment.
  struct stat st;
  if (fstat(*fd, &st) != 0) {
    return absl::UnavailableError("Could not stat game table '" + name_ +
                                  "': " + libc_error_name(errno));
  }
  if (static_cast<size_t>(st.st_size) < kTableSize) {
    return absl::UnavailableError(
        "Game table '" + name_ + "' is " + std::to_string(st.st_size) +
        " bytes, expected " + std::to_string(kTableSize));
  }

  void* mapping = mmap(nullptr, kTableSize, PROT_READ, MAP_SHARED, *fd, 0);
  if (mapping == MAP_FAILED) {
    return absl::UnavailableError("Could not map game table '" + name_ +
                                  "': " + libc_error_name(errno));
  }
  mapping_ = static_cast<const uint8_t*>(mapping);
  spdlog::debug("Attached to game table '{}'", name_);
  return absl::OkStatus();
}

absl::StatusOr<GameTable> SharedGameTable::snapshot() {
  if (!mapping_) {
    absl::Status s = attach();
    if (!s.ok()) {
      spdlog::debug("{}", s.ToString());
      return s;
    }
  }

  // No lock exists for the table. Copy it out first so decoding works on a
  // stable buffer, even if the copy itself is torn.
  uint8_t buf[kTableSize];
  memcpy(buf, mapping_, kTableSize);
  return GameTable::decode(buf);
}

}  // namespace game_table
