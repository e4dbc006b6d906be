#ifndef LAUNCH_INJECTORY_H_
#define LAUNCH_INJECTORY_H_

#include "launch/launch_builder.h"

namespace launch {

inline constexpr char kInjectoryExe[] = "injectory_x86.exe";
inline constexpr char kWModeDll[] = "WMode.dll";

// Starts a normal, visible game and injects BWAPI into it with injectory.
// BWAPI's auto menu then hosts or joins the game as configured in bwapi.ini.
//
// Unlike bwheadless, injectory doesn't fake the install path in the registry,
// so bots built against BWAPI < 4 will most likely not work.
class Injectory : public LaunchBuilder {
 public:
  absl::StatusOr<LaunchPlan> build(const bot::PreparedBot& bot,
                                   const LaunchContext& context) const override;
};

}  // namespace launch

#endif
