#ifndef UTIL_STATUS_MACROS_H_
#define UTIL_STATUS_MACROS_H_

#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace status_internal {

inline absl::Status get_status(const absl::Status& status) { return status; }

template <typename T>
absl::Status get_status(const absl::StatusOr<T>& status_or) {
  return status_or.status();
}

}  // namespace status_internal

#define STATUS_MACROS_CAT_(a, b) a##b
#define STATUS_MACROS_CAT(a, b) STATUS_MACROS_CAT_(a, b)

// Returns early with the status of 'expr' if it isn't OK. Works with both
// absl::Status and absl::StatusOr<T>.
#define RETURN_IF_ERROR(expr)                               \
  do {                                                      \
    auto&& status_or = (expr);                              \
    if (!status_or.ok()) {                                  \
      return ::status_internal::get_status(status_or);      \
    }                                                       \
  } while (0)

// Evaluates 'rhs' (an absl::StatusOr<T>), returns its status if it isn't OK,
// and otherwise moves its value into 'lhs'. 'lhs' may be a declaration.
#define ASSIGN_OR_RETURN(lhs, rhs) \
  ASSIGN_OR_RETURN_IMPL_(STATUS_MACROS_CAT(status_or_, __LINE__), lhs, rhs)

#define ASSIGN_OR_RETURN_IMPL_(var, lhs, rhs) \
  auto var = (rhs);                           \
  if (!var.ok()) return var.status();         \
  lhs = std::move(var).value();

#endif
