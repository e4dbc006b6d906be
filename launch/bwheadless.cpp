#include "launch/bwheadless.h"

#include "launch/bwapi_ini.h"
#include "util/status_macros.h"

namespace launch {

absl::StatusOr<LaunchPlan> BwHeadless::build(
    const bot::PreparedBot& bot, const LaunchContext& context) const {
  RETURN_IF_ERROR(internal::check_game_files(bot, context));
  std::filesystem::path bwheadless = context.tools_dir / kBwHeadlessExe;
  RETURN_IF_ERROR(internal::check_tool(bwheadless, context.tools_dir));

  std::filesystem::path ini = bot.bwapi_data() / "bwapi.ini";
  BwapiIni bwapi_ini{
      .ai_module = internal::ai_module_for(bot),
      .tournament_module = bot.tournament_module.value_or("").string(),
      .game_speed = context.game_speed,
  };
  RETURN_IF_ERROR(bwapi_ini.write_file(ini));

  LaunchPlan plan;
  plan.args = context.wrapper.wrap(bwheadless);
  auto add = [&plan](std::initializer_list<std::string> args) {
    plan.args.insert(plan.args.end(), args);
  };
  add({"-e", context.starcraft_exe.string()});
  if (!context.game_name.empty()) add({"-g", context.game_name});
  add({"-r", bot::to_string(bot.race)});
  add({"-l", bot.bwapi_dll().string()});
  add({"--installpath", bot.working_dir.string()});
  add({"-n", bot.name});
  if (context.latency_frames) {
    add({"-gs", std::to_string(*context.latency_frames)});
  }
  if (context.connect_mode.role == Role::HOST) {
    std::filesystem::path starcraft_dir = context.starcraft_exe.parent_path();
    add({"-m", (starcraft_dir / context.connect_mode.map).string()});
    add({"-h", std::to_string(context.connect_mode.player_count)});
  }

  internal::set_common_plan_fields(bot, context, ini, &plan);
  return plan;
}

}  // namespace launch
