/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>
#include <string>

#include "Debug.h"
#include "RescTest.h"

namespace {

// The message of the exception `fn` throws, or "" if it returns.
template <typename Fn>
std::string failure_message(Fn fn) {
  try {
    fn();
  } catch (const RescException& e) {
    return e.what();
  }
  return "";
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

class AssertTest : public RescTest {};

TEST_F(AssertTest, passingChecksDoNothing) {
  always_assert(1 + 1 == 2);
  always_assert_log(true, "unused %d", 1);
  always_assert_type_log(true, INVALID_XML, "unused");
  assert_log(true, "unused");
}

TEST_F(AssertTest, debugOnlyChecks) {
  auto msg = failure_message([] { assert_log(false, "debug check"); });
  if (debug) {
    EXPECT_TRUE(contains(msg, "debug check")) << msg;
  } else {
    EXPECT_EQ(msg, "");
  }
}

TEST_F(AssertTest, messageCarriesExpressionAndLocation) {
  int size = 3;
  auto msg = failure_message([&] { always_assert(size == 4); });
  EXPECT_TRUE(contains(msg, "AssertTest.cpp")) << msg;
  EXPECT_TRUE(contains(msg, "assertion `size == 4' failed.")) << msg;
}

TEST_F(AssertTest, messageIsFormatted) {
  auto msg = failure_message([] {
    always_assert_type_log(false, RESOURCE_NOT_FOUND,
                           "failed to locate package %s/%u", "android", 1u);
  });
  EXPECT_TRUE(contains(msg, "RESOURCE_NOT_FOUND: ")) << msg;
  EXPECT_TRUE(contains(msg, "failed to locate package android/1")) << msg;
}

TEST_F(AssertTest, failIsTyped) {
  EXPECT_THROW(resc_fail(INVALID_XML, "line %d", 3),
               resc::InvalidXmlException);
  EXPECT_RESC_ERROR(not_reached(), INTERNAL_ERROR);
}
