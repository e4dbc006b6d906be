// BWAPI reads its settings from bwapi.ini when the game starts. We write a
// fresh one per bot before every launch, and point BWAPI at it with the
// BWAPI_CONFIG_INI environment variable.

#ifndef LAUNCH_BWAPI_INI_H_
#define LAUNCH_BWAPI_INI_H_

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>

#include "absl/status/status.h"
#include "bot/race.h"
#include "launch/connect_mode.h"

namespace launch {

inline constexpr char kReplayPath[] =
    "replays/$Y $b $d/%MAP%_%BOTRACE%%ALLYRACES%vs%ENEMYRACES%_$H$M$S.rep";

// Drives BWAPI's menus to host or join a LAN game without user input. Only
// used when the game is injected; bwheadless drives the menus itself.
struct AutoMenu {
  std::string name;
  bot::Race race = bot::Race::RANDOM;
  std::string game_name;
  ConnectMode connect_mode;
};

struct BwapiIni {
  // AI module DLL BWAPI loads into the game. Empty for client bots.
  std::string ai_module;
  std::string tournament_module;
  // 0 runs at full speed, -1 keeps the game's own (human) speed.
  int game_speed = 0;
  std::optional<AutoMenu> auto_menu;

  void write(std::ostream& out) const;

  // Writes the ini to 'path', replacing any existing file.
  absl::Status write_file(const std::filesystem::path& path) const;
};

}  // namespace launch

#endif
