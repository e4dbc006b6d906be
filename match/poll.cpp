#include "match/poll.h"

#include <thread>

#include "absl/time/time.h"
#include "util/status_macros.h"

namespace match {

absl::Status poll_until(const std::function<absl::StatusOr<bool>()>& check,
                        const PollBudget& budget, const std::string& what,
                        const absl::Notification* cancel) {
  for (int attempt = 0; attempt < budget.attempts; ++attempt) {
    ASSIGN_OR_RETURN(bool done, check());
    if (done) return absl::OkStatus();

    if (cancel) {
      if (cancel->WaitForNotificationWithTimeout(
              absl::FromChrono(budget.interval))) {
        return absl::CancelledError("Interrupted while waiting for " + what);
      }
    } else {
      std::this_thread::sleep_for(budget.interval);
    }
  }
  return absl::DeadlineExceededError(
      "Timed out waiting for " + what + " after " +
      std::to_string(budget.attempts) + " checks " +
      std::to_string(budget.interval.count()) + "ms apart");
}

}  // namespace match
