#include "launch/injectory.h"

#include "launch/bwapi_ini.h"
#include "util/status_macros.h"

namespace launch {

absl::StatusOr<LaunchPlan> Injectory::build(
    const bot::PreparedBot& bot, const LaunchContext& context) const {
  RETURN_IF_ERROR(internal::check_game_files(bot, context));
  std::filesystem::path injectory = context.tools_dir / kInjectoryExe;
  RETURN_IF_ERROR(internal::check_tool(injectory, context.tools_dir));
  std::filesystem::path wmode = context.tools_dir / kWModeDll;
  if (context.wmode) {
    RETURN_IF_ERROR(internal::check_tool(wmode, context.tools_dir));
  }

  std::filesystem::path ini = bot.bwapi_data() / "bwapi.ini";
  BwapiIni bwapi_ini{
      .ai_module = internal::ai_module_for(bot),
      .tournament_module = bot.tournament_module.value_or("").string(),
      .game_speed = context.game_speed,
      .auto_menu = AutoMenu{.name = bot.name,
                            .race = bot.race,
                            .game_name = context.game_name,
                            .connect_mode = context.connect_mode},
  };
  RETURN_IF_ERROR(bwapi_ini.write_file(ini));

  LaunchPlan plan;
  plan.args = context.wrapper.wrap(injectory);
  plan.args.push_back("-l");
  plan.args.push_back(context.starcraft_exe.string());
  plan.args.push_back("-i");
  plan.args.push_back(bot.bwapi_dll().string());
  if (context.wmode) plan.args.push_back(wmode.string());
  plan.args.push_back("--wait-for-exit");
  plan.args.push_back("--kill-on-exit");

  internal::set_common_plan_fields(bot, context, ini, &plan);
  return plan;
}

}  // namespace launch
