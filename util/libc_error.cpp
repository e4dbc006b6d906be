#include "util/libc_error.h"

#include <string.h>

std::string libc_error_name(int err) {
  const char* name = strerrorname_np(err);
  if (!name) return "errno " + std::to_string(err);
  return std::string(name) + " (" + strerrordesc_np(err) + ")";
}
