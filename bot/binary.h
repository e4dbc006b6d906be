#ifndef BOT_BINARY_H_
#define BOT_BINARY_H_

#include <filesystem>
#include <optional>
#include <string>

#include "absl/status/statusor.h"

namespace bot {

// The artifact a bot ships as.
struct Binary {
  enum class Kind {
    // AI module loaded by BWAPI inside the game process.
    DLL = 0,
    // Java client, run with 'java -jar'.
    JAR = 1,
    // Native client executable.
    EXE = 2,
  };

  Kind kind = Kind::DLL;
  std::filesystem::path path;

  // True if the bot runs as its own process that connects to BWAPI as a
  // client, rather than inside the game process.
  bool is_client() const { return kind != Kind::DLL; }

  // Classifies 'path' by its extension, case-insensitively. Returns nullopt
  // for unknown extensions. Doesn't touch the filesystem.
  static std::optional<Binary> from_path(const std::filesystem::path& path);

  // Finds the single bot artifact among the immediate entries of 'dir'.
  // EXE beats DLL beats JAR. Returns NOT_FOUND if 'dir' holds no artifact and
  // FAILED_PRECONDITION if more than one candidate of the winning kind exists.
  static absl::StatusOr<Binary> search(const std::filesystem::path& dir);
};

std::string to_string(Binary::Kind kind);

}  // namespace bot

#endif
