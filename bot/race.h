#ifndef BOT_RACE_H_
#define BOT_RACE_H_

#include <string>

#include "absl/status/statusor.h"

namespace bot {

enum class Race {
  PROTOSS = 0,
  TERRAN = 1,
  ZERG = 2,
  RANDOM = 3,
};

// Accepts full race names or their first letter, in any case.
absl::StatusOr<Race> parse_race(const std::string& str);

// Returns the name BWAPI expects, e.g. "Protoss".
std::string to_string(Race race);

}  // namespace bot

#endif
