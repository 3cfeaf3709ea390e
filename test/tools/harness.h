#ifndef TESSERA_TEST_TOOLS_HARNESS_H
#define TESSERA_TEST_TOOLS_HARNESS_H

#include <gtest/gtest.h>
#include "tessera/status.h"

namespace Tessera {

#define ASSERT_OK(s) ASSERT_PRED_FORMAT1(check_status, s)
#define ASSERT_NOK(s) ASSERT_FALSE((s).is_ok())
#define EXPECT_OK(s) EXPECT_PRED_FORMAT1(check_status, s)
#define EXPECT_NOK(s) EXPECT_FALSE((s).is_ok())

// Assert that "s" has a particular code, e.g. ASSERT_CODE(s, SYNTAX_ERROR).
#define ASSERT_CODE(s, code) ASSERT_PRED_FORMAT2(check_status_code, s, Status::Code::code)
#define EXPECT_CODE(s, code) EXPECT_PRED_FORMAT2(check_status_code, s, Status::Code::code)

static constexpr auto EXPECTATION_MATCHER = "^expectation";

auto check_status(const char *expr, const Status &s) -> testing::AssertionResult;
auto check_status_code(const char *expr, const char *, const Status &s, Status::Code code) -> testing::AssertionResult;

} // namespace Tessera

#endif // TESSERA_TEST_TOOLS_HARNESS_H
