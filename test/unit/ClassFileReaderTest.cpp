/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "ClassFileReader.h"
#include "RescTest.h"
#include "TestStructures.h"
#include "ZipReader.h"

namespace {

boost::optional<int32_t> find(const std::vector<char>& class_file,
                              const std::string& field) {
  return jar::find_static_int_field(
      reinterpret_cast<const uint8_t*>(class_file.data()), class_file.size(),
      field);
}

} // namespace

class ClassFileReaderTest : public RescTest {};

TEST_F(ClassFileReaderTest, findsConstantValue) {
  auto class_file = make_class_file("android/R$attr",
                                    "compileSdkVersionCodename", 0x01010573);
  auto value = find(class_file, "compileSdkVersionCodename");
  ASSERT_TRUE(value);
  EXPECT_EQ(*value, 0x01010573);
  EXPECT_EQ(find(class_file, "other"), 0x01010573);
  EXPECT_FALSE(find(class_file, "compileSdkVersion"));
}

TEST_F(ClassFileReaderTest, negativeValues) {
  auto class_file = make_class_file("Foo", "field", -2);
  EXPECT_EQ(find(class_file, "field"), -2);
}

TEST_F(ClassFileReaderTest, badMagic) {
  auto class_file = make_class_file("Foo", "field", 1);
  class_file[0] = 0;
  EXPECT_RESC_ERROR(find(class_file, "field"), INVALID_JAVA);
}

TEST_F(ClassFileReaderTest, truncated) {
  auto class_file = make_class_file("Foo", "field", 1);
  class_file.resize(class_file.size() / 2);
  EXPECT_RESC_ERROR(find(class_file, "field"), BUFFER_END_EXCEEDED);
}

TEST_F(ClassFileReaderTest, readFromJar) {
  auto class_file = make_class_file("android/R$attr", "compileSdkVersion",
                                    0x01010572);
  auto jar_bytes =
      make_zip({{"android/R.class", "junk"},
                {"android/R$attr.class",
                 std::string(class_file.begin(), class_file.end())}},
               /* deflate */ true);
  zip::ZipReader jar(reinterpret_cast<const uint8_t*>(jar_bytes.data()),
                     jar_bytes.size());
  EXPECT_EQ(
      jar::find_static_int_field(jar, "android/R$attr", "compileSdkVersion"),
      0x01010572);
  EXPECT_FALSE(
      jar::find_static_int_field(jar, "android/R$id", "compileSdkVersion"));
}
