/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "Debug.h"
#include "DebugUtils.h"
#include "RescTest.h"

class DebugTest : public RescTest {
 protected:
  ~DebugTest() override { resc::set_throw_typed_exception(m_old_val); }

  bool m_old_val{resc::throw_typed_exception()};
};

TEST_F(DebugTest, TypedByDefault) {
  EXPECT_TRUE(resc::throw_typed_exception());
}

TEST_F(DebugTest, UntypedExceptions) {
  resc::set_throw_typed_exception(false);

  EXPECT_THROW({ always_assert(false); }, RescException);

  EXPECT_THROW(
      { always_assert_type_log(false, INVALID_ZIP, "test"); }, RescException);
  try {
    always_assert_type_log(false, INVALID_ZIP, "test");
  } catch (const resc::InvalidZipException&) {
    EXPECT_TRUE(false) << "Got InvalidZipException";
  } catch (const RescException& e) {
    EXPECT_EQ(e.type, INVALID_ZIP);
  }
}

// This cannot be run in parallel in the same process.
TEST_F(DebugTest, TypedExceptions) {
  resc::set_throw_typed_exception(true);

  EXPECT_THROW({ always_assert(false); }, RescException);
  EXPECT_THROW(
      { always_assert_type_log(false, INVALID_ZIP, "test"); },
      resc::InvalidZipException);
  EXPECT_THROW(
      { always_assert_type_log(false, BUFFER_END_EXCEEDED, "test"); },
      resc::BufferEndExceededException);
  EXPECT_THROW(
      { always_assert_type_log(false, MALFORMED_CHUNK, "test"); },
      resc::MalformedChunkException);
  EXPECT_THROW(
      { always_assert_type_log(false, UNSUPPORTED_ATTRIBUTE, "test"); },
      resc::UnsupportedAttributeException);
  EXPECT_THROW(
      { always_assert_type_log(false, MALFORMED_ATTRIBUTE_VALUE, "test"); },
      resc::MalformedAttributeValueException);
  EXPECT_THROW(
      { always_assert_type_log(false, RESOURCE_NOT_FOUND, "test"); },
      resc::ResourceNotFoundException);
  EXPECT_THROW(
      { always_assert_type_log(false, INVALID_JAVA, "test"); },
      resc::InvalidJavaException);
  EXPECT_THROW(
      { always_assert_type_log(false, INVALID_XML, "test"); },
      resc::InvalidXmlException);
}

TEST_F(DebugTest, Format2String) {
  EXPECT_EQ(format2string("%s=0x%08x", "id", 0x7f010000u), "id=0x7f010000");
  std::string long_string(1000, 'a');
  EXPECT_EQ(format2string("%s", long_string.c_str()), long_string);
}
