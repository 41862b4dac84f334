/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fstream>
#include <gtest/gtest.h>

#include "RescTest.h"
#include "RescToolsCommon.h"

class RescToolsCommonTest : public RescTest {
 protected:
  std::string write(const std::string& name, const std::string& contents) {
    auto path = m_tmp.path + "/" + name;
    std::ofstream out(path, std::ios::binary);
    out << contents;
    return path;
  }

  resc::TempDir m_tmp = resc::make_tmp_dir("resc_tools_test_%%%%%%%%");
};

TEST_F(RescToolsCommonTest, parseConfig) {
  auto path = write("config.json", R"({
    "manifest": "AndroidManifest.xml",
    "android_jars": ["android.jar", "extra.jar"]
  })");
  auto config = resc::parse_config(path);
  EXPECT_EQ(resc::get_string(config, "manifest", ""), "AndroidManifest.xml");
  EXPECT_EQ(resc::get_string(config, "icon_package", "none"), "none");
  std::vector<std::string> jars = {"android.jar", "extra.jar"};
  EXPECT_EQ(resc::get_string_list(config, "android_jars"), jars);
  EXPECT_TRUE(resc::get_string_list(config, "missing").empty());
}

TEST_F(RescToolsCommonTest, configTypes) {
  auto config = resc::parse_config(
      write("config.json", R"({"manifest": 1, "android_jars": "a.jar"})"));
  EXPECT_RESC_ERROR(resc::get_string(config, "manifest", ""),
                    GENERIC_ASSERTION_ERROR);
  EXPECT_RESC_ERROR(resc::get_string_list(config, "android_jars"),
                    GENERIC_ASSERTION_ERROR);
  EXPECT_RESC_ERROR(resc::parse_config(write("list.json", "[1, 2]")),
                    GENERIC_ASSERTION_ERROR);
}

TEST_F(RescToolsCommonTest, readTextFile) {
  auto path = write("AndroidManifest.xml", "<manifest/>\n");
  EXPECT_EQ(resc::read_text_file(path), "<manifest/>\n");
  EXPECT_RESC_ERROR(resc::read_text_file(m_tmp.path + "/missing.xml"),
                    GENERIC_ASSERTION_ERROR);
}
