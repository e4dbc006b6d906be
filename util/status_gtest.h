#ifndef UTIL_STATUS_GTEST_H_
#define UTIL_STATUS_GTEST_H_

#include <gtest/gtest.h>

#include "util/status_macros.h"

#define ASSERT_OK(expr) ASSERT_TRUE((expr).ok())
#define EXPECT_OK(expr) EXPECT_TRUE((expr).ok())

#define ASSERT_OK_AND_ASSIGN(lhs, rhs) \
  ASSERT_OK_AND_ASSIGN_IMPL_(STATUS_MACROS_CAT(status_or_, __COUNTER__), lhs, \
                             rhs)

#define ASSERT_OK_AND_ASSIGN_IMPL_(var, lhs, rhs)   \
  auto var = (rhs);                                 \
  ASSERT_TRUE(var.ok()) << var.status().ToString(); \
  lhs = std::move(var).value();

#endif
