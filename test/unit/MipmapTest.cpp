/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "Mipmap.h"
#include "RescTest.h"
#include "utils/Dump.h"
#include "utils/Serialize.h"
#include "utils/Table.h"

using namespace bxml;

class MipmapTest : public RescTest {};

TEST_F(MipmapTest, tableLayout) {
  auto mipmap = compile_mipmap("com.example.app", "icon");
  EXPECT_EQ(mipmap.id.value(), 0x7f010000);

  auto table = mipmap.table.get_if<arsc::TableChunk>();
  ASSERT_NE(table, nullptr);
  EXPECT_EQ(table->header.package_count, 1);
  ASSERT_EQ(table->children.size(), 2);

  auto global = table->children[0].get_if<arsc::StringPoolChunk>();
  ASSERT_NE(global, nullptr);
  std::vector<std::string> expected_paths = {
      "res/mipmap-mdpi/icon.png", "res/mipmap-hdpi/icon.png",
      "res/mipmap-xhdpi/icon.png", "res/mipmap-xxhdpi/icon.png",
      "res/mipmap-xxxhdpi/icon.png"};
  EXPECT_EQ(global->strings, expected_paths);

  auto package = table->children[1].get_if<arsc::TablePackageChunk>();
  ASSERT_NE(package, nullptr);
  EXPECT_EQ(package->header.id, 0x7f);
  EXPECT_EQ(package->header.name, "com.example.app");
  ASSERT_EQ(package->children.size(), 2 + 1 + 5);
  EXPECT_EQ(package->children[0].get_if<arsc::StringPoolChunk>()->strings,
            std::vector<std::string>{"mipmap"});
  EXPECT_EQ(package->children[1].get_if<arsc::StringPoolChunk>()->strings,
            std::vector<std::string>{"icon"});
  auto spec = package->children[2].get_if<arsc::TableTypeSpecChunk>();
  ASSERT_NE(spec, nullptr);
  EXPECT_EQ(spec->type_id, 1);
  ASSERT_EQ(spec->flags.size(), 1);

  const uint16_t densities[] = {160, 240, 320, 480, 640};
  for (size_t i = 0; i < 5; i++) {
    auto type = package->children[3 + i].get_if<arsc::TableTypeChunk>();
    ASSERT_NE(type, nullptr);
    EXPECT_EQ(type->type_id, 1);
    EXPECT_EQ(type->config.screen_type.density, densities[i]);
    ASSERT_EQ(type->entries.size(), 1);
    ASSERT_TRUE(type->entries[0]);
    EXPECT_EQ(type->entries[0]->key, 0);
    auto value = type->entries[0]->simple();
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(value->data_type, (uint8_t)arsc::ResValueType::String);
    EXPECT_EQ(value->data, i);
    EXPECT_EQ(global->strings[value->data],
              std::string("res/mipmap-") + MIPMAP_DENSITIES[i].bucket +
                  "/icon.png");
  }
}

TEST_F(MipmapTest, resolvesThroughTable) {
  auto mipmap = compile_mipmap("com.example.app", "icon");
  arsc::Table table;
  table.import_chunk(mipmap.table);
  EXPECT_EQ(table.entry_by_ref(arsc::Ref::parse("@mipmap/icon")).id(),
            mipmap.id);
  EXPECT_EQ(
      table.entry_by_ref(arsc::Ref::parse("@com.example.app:mipmap/icon")).id(),
      mipmap.id);
}

TEST_F(MipmapTest, writesAndParses) {
  auto mipmap = compile_mipmap("com.example.app", "ic_launcher");
  auto data = arsc::write_chunk(mipmap.table);
  EXPECT_EQ(arsc::parse_chunk(data), mipmap.table);
}
