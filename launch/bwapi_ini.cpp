#include "launch/bwapi_ini.h"

#include <fstream>

namespace launch {

void BwapiIni::write(std::ostream& out) const {
  out << "[ai]\n";
  out << "ai = " << ai_module << "\n";
  out << "tournament = " << tournament_module << "\n";
  out << "[auto_menu]\n";
  if (auto_menu) {
    out << "auto_menu=LAN\n";
    out << "lan_mode=Local PC\n";
    out << "character_name=" << auto_menu->name << "\n";
    out << "race=" << bot::to_string(auto_menu->race) << "\n";
    const ConnectMode& mode = auto_menu->connect_mode;
    if (mode.role == Role::HOST) {
      out << "map=" << mode.map << "\n";
      out << "wait_for_min_players=" << mode.player_count << "\n";
      out << "wait_for_max_players=" << mode.player_count << "\n";
    } else {
      out << "game=" << auto_menu->game_name << "\n";
    }
  }
  out << "save_replay = " << kReplayPath << "\n";
  out << "[starcraft]\n";
  out << "speed_override = " << game_speed << "\n";
  out << "sound = OFF\n";
}

absl::Status BwapiIni::write_file(const std::filesystem::path& path) const {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return absl::FailedPreconditionError("Could not write '" + path.string() +
                                         "'");
  }
  write(out);
  out.flush();
  if (!out) {
    return absl::InternalError("Error while writing '" + path.string() + "'");
  }
  return absl::OkStatus();
}

}  // namespace launch
