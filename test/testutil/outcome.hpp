/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"

#define PP_CAT(a, b) PP_CAT_I(a, b)
#define PP_CAT_I(a, b) PP_CAT_II(~, a##b)
#define PP_CAT_II(p, res) res

#define UNIQUE_NAME(base) PP_CAT(base, __LINE__)

#define EXPECT_OUTCOME_TRUE_void(var, expr)                   \
  auto &&(var) = expr;                                        \
  EXPECT_TRUE(var) << "Line " << __LINE__ << ": "             \
                   << (var).error().message();

#define EXPECT_OUTCOME_TRUE_name(var, val, expr)              \
  auto &&(var) = expr;                                        \
  EXPECT_TRUE(var) << "Line " << __LINE__ << ": "             \
                   << (var).error().message();                \
  auto &&(val) = (var).value();

#define EXPECT_OUTCOME_FALSE_void(var, expr) \
  auto &&(var) = expr;                       \
  EXPECT_FALSE(var) << "Line " << __LINE__;

#define EXPECT_OUTCOME_FALSE_name(var, val, expr) \
  auto &&(var) = expr;                            \
  EXPECT_FALSE(var) << "Line " << __LINE__;       \
  auto &&(val) = (var).error();

/**
 * Checks result has value and binds it to `val`
 */
#define EXPECT_OUTCOME_TRUE(val, expr) \
  EXPECT_OUTCOME_TRUE_name(UNIQUE_NAME(_r), val, expr)

/**
 * Checks result has error and binds it to `val`
 */
#define EXPECT_OUTCOME_FALSE(val, expr) \
  EXPECT_OUTCOME_FALSE_name(UNIQUE_NAME(_f), val, expr)

#define EXPECT_OUTCOME_TRUE_1(expr) \
  EXPECT_OUTCOME_TRUE_void(UNIQUE_NAME(_v), expr)

#define EXPECT_OUTCOME_FALSE_1(expr) \
  EXPECT_OUTCOME_FALSE_void(UNIQUE_NAME(_v), expr)

#define EXPECT_OUTCOME_EQ(expr, value) \
  {                                    \
    EXPECT_OUTCOME_TRUE(_value, expr); \
    EXPECT_EQ(_value, value);          \
  }

#define EXPECT_OUTCOME_ERROR(error, expr)                       \
  {                                                             \
    auto &&_r{expr};                                            \
    ASSERT_FALSE(_r) << "Line " << __LINE__;                    \
    EXPECT_EQ(_r.error(), make_error_code(error));              \
  }
