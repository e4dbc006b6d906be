#ifndef LAUNCH_BWHEADLESS_H_
#define LAUNCH_BWHEADLESS_H_

#include "launch/launch_builder.h"

namespace launch {

inline constexpr char kBwHeadlessExe[] = "bwheadless.exe";

// Runs the game without a window through bwheadless, which injects BWAPI and
// drives the menus from its command line flags.
class BwHeadless : public LaunchBuilder {
 public:
  absl::StatusOr<LaunchPlan> build(const bot::PreparedBot& bot,
                                   const LaunchContext& context) const override;
};

}  // namespace launch

#endif
