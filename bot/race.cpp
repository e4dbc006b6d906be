#include "bot/race.h"

#include "absl/strings/ascii.h"

namespace bot {

absl::StatusOr<Race> parse_race(const std::string& str) {
  std::string lower = absl::AsciiStrToLower(str);
  if (lower == "p" || lower == "protoss") return Race::PROTOSS;
  if (lower == "t" || lower == "terran") return Race::TERRAN;
  if (lower == "z" || lower == "zerg") return Race::ZERG;
  if (lower == "r" || lower == "random") return Race::RANDOM;
  return absl::InvalidArgumentError(
      "Invalid race '" + str +
      "', expected one of Zerg/Protoss/Terran/Random or z/p/t/r");
}

std::string to_string(Race race) {
  switch (race) {
    case Race::PROTOSS:
      return "Protoss";
    case Race::TERRAN:
      return "Terran";
    case Race::ZERG:
      return "Zerg";
    case Race::RANDOM:
      return "Random";
  }
  return "Random";
}

}  // namespace bot
