#ifndef UTIL_LIBC_ERROR_H_
#define UTIL_LIBC_ERROR_H_

#include <string>

// Returns the symbolic name of a libc error number, e.g. "ENOENT". Falls back
// to the numeric value for errors glibc doesn't name.
std::string libc_error_name(int err);

#endif
