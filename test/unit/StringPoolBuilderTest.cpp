/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <set>

#include "Attributes.h"
#include "RescTest.h"
#include "StringPoolBuilder.h"

using namespace bxml;

namespace {

const std::vector<XmlAttr> kAttributes = {
    {ANDROID_NS, "label", "Hello"},
    {ANDROID_NS, "name", ".Main"},
    {ANDROID_NS, "theme", "@android:style/Theme"},
    {"", "package", "com.example"},
};

void add_all(const std::vector<XmlAttr>& attrs, StringPoolBuilder* builder) {
  for (const auto& attr : attrs) {
    builder->add_attribute(attr);
  }
  builder->add_string("manifest");
  builder->add_string("android");
}

} // namespace

class StringPoolBuilderTest : public RescTest {};

TEST_F(StringPoolBuilderTest, layout) {
  StringPoolBuilder builder;
  add_all(kAttributes, &builder);
  builder.build();

  // Names with resource ids come first, in id order, then everything else
  // sorted.
  std::vector<std::string> expected = {"theme",
                                       "label",
                                       "name",
                                       ".Main",
                                       "Hello",
                                       "android",
                                       "com.example",
                                       ANDROID_NS,
                                       "manifest",
                                       "package"};
  EXPECT_EQ(builder.strings(), expected);
  EXPECT_THAT(builder.resource_map(),
              ::testing::ElementsAre(0x01010000, 0x01010001, 0x01010003));

  EXPECT_EQ(builder.pool_chunk().strings, expected);
  EXPECT_TRUE(builder.pool_chunk().styles.empty());
  EXPECT_EQ(builder.resource_map_chunk().ids, builder.resource_map());
}

TEST_F(StringPoolBuilderTest, idsAreABijection) {
  StringPoolBuilder builder;
  add_all(kAttributes, &builder);
  builder.build();
  std::set<int32_t> seen;
  for (const auto& s : builder.strings()) {
    auto id = builder.id(s);
    EXPECT_EQ(builder.strings()[id], s);
    EXPECT_TRUE(seen.insert(id).second) << s;
  }
  EXPECT_EQ(seen.size(), builder.strings().size());
}

TEST_F(StringPoolBuilderTest, noDuplicates) {
  StringPoolBuilder builder;
  builder.add_attribute({ANDROID_NS, "label", "label"});
  builder.add_attribute({ANDROID_NS, "label", "Other"});
  builder.add_string("label");
  builder.add_string(ANDROID_NS);
  builder.build();
  EXPECT_THAT(builder.strings(),
              ::testing::ElementsAre("label", "Other", ANDROID_NS));
  EXPECT_THAT(builder.resource_map(), ::testing::SizeIs(1));
}

TEST_F(StringPoolBuilderTest, deterministic) {
  auto reversed = kAttributes;
  std::reverse(reversed.begin(), reversed.end());
  StringPoolBuilder a;
  add_all(kAttributes, &a);
  a.build();
  StringPoolBuilder b;
  b.add_string("android");
  add_all(reversed, &b);
  b.build();
  EXPECT_EQ(a.strings(), b.strings());
  EXPECT_EQ(a.resource_map(), b.resource_map());
}

TEST_F(StringPoolBuilderTest, misuse) {
  StringPoolBuilder builder;
  builder.add_string("manifest");
  EXPECT_RESC_ERROR(builder.id("manifest"), GENERIC_ASSERTION_ERROR);
  XmlAttr bogus{"", "bogusAttribute", ""};
  EXPECT_RESC_ERROR(builder.add_attribute(bogus), UNSUPPORTED_ATTRIBUTE);
  builder.build();
  EXPECT_EQ(builder.id("manifest"), 0);
  EXPECT_RESC_ERROR(builder.id("application"), INTERNAL_ERROR);
  EXPECT_RESC_ERROR(builder.add_string("application"),
                    GENERIC_ASSERTION_ERROR);
  EXPECT_RESC_ERROR(builder.build(), GENERIC_ASSERTION_ERROR);
}
