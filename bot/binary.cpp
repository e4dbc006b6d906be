#include "bot/binary.h"

#include <algorithm>
#include <system_error>
#include <vector>

#include "absl/strings/ascii.h"

namespace bot {

std::optional<Binary> Binary::from_path(const std::filesystem::path& path) {
  std::string ext = absl::AsciiStrToLower(path.extension().string());
  if (ext == ".dll") return Binary{.kind = Kind::DLL, .path = path};
  if (ext == ".jar") return Binary{.kind = Kind::JAR, .path = path};
  if (ext == ".exe") return Binary{.kind = Kind::EXE, .path = path};
  return std::nullopt;
}

absl::StatusOr<Binary> Binary::search(const std::filesystem::path& dir) {
  std::error_code error;
  std::vector<std::filesystem::path> entries;
  std::filesystem::directory_iterator it(dir, error);
  for (; !error && it != std::filesystem::directory_iterator();
       it.increment(error)) {
    entries.push_back(it->path());
  }
  if (error) {
    return absl::NotFoundError("Could not list bot binaries in '" +
                               dir.string() + "': " + error.message());
  }
  // Directory order isn't stable, so resolve in file name order.
  std::sort(entries.begin(), entries.end());

  std::optional<Binary> selected;
  bool ambiguous = false;
  for (const auto& path : entries) {
    std::optional<Binary> found = from_path(path);
    if (!found) continue;

    if (!selected) {
      selected = found;
      continue;
    }
    switch (selected->kind) {
      case Kind::EXE:
        // Executables win outright, unless there are several.
        if (found->kind == Kind::EXE) ambiguous = true;
        break;
      case Kind::DLL:
        if (found->kind == Kind::EXE) {
          selected = found;
          ambiguous = false;
        } else if (found->kind == Kind::DLL) {
          ambiguous = true;
        }
        break;
      case Kind::JAR:
        if (found->kind == Kind::EXE) {
          selected = found;
          ambiguous = false;
        } else {
          ambiguous = true;
        }
        break;
    }
    if (ambiguous && selected->kind == Kind::EXE) break;
  }

  if (!selected) {
    return absl::NotFoundError("No bot binary found in '" + dir.string() +
                               "'");
  }
  if (ambiguous) {
    return absl::FailedPreconditionError(
        "Found multiple binary candidates in '" + dir.string() +
        "', please select one explicitly");
  }
  return *selected;
}

std::string to_string(Binary::Kind kind) {
  switch (kind) {
    case Binary::Kind::DLL:
      return "dll";
    case Binary::Kind::JAR:
      return "jar";
    case Binary::Kind::EXE:
      return "exe";
  }
  return "unknown";
}

}  // namespace bot
