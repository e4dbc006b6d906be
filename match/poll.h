#ifndef MATCH_POLL_H_
#define MATCH_POLL_H_

#include <chrono>
#include <functional>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/notification.h"

namespace match {

struct PollBudget {
  std::chrono::milliseconds interval{100};
  int attempts = 100;
};

// Calls 'check' until it returns true, sleeping 'budget.interval' between
// calls. An error from 'check' stops polling and is returned as is.
//
// Returns DEADLINE_EXCEEDED naming 'what' once 'budget.attempts' checks have
// all returned false, and CANCELLED if 'cancel' is notified while sleeping.
absl::Status poll_until(const std::function<absl::StatusOr<bool>()>& check,
                        const PollBudget& budget, const std::string& what,
                        const absl::Notification* cancel = nullptr);

}  // namespace match

#endif
