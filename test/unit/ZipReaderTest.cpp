/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include "RescTest.h"
#include "TestStructures.h"
#include "ZipReader.h"
#include "utils/Serialize.h"

namespace {

const uint8_t* bytes(const std::vector<char>& v) {
  return reinterpret_cast<const uint8_t*>(v.data());
}

std::string as_string(const std::vector<char>& v) {
  return std::string(v.begin(), v.end());
}

const std::vector<std::pair<std::string, std::string>> kFiles = {
    {"resources.arsc", std::string(300, 'x') + "tail"},
    {"AndroidManifest.xml", "<manifest/>"},
    {"empty", ""},
};

} // namespace

class ZipReaderTest : public RescTest {};

TEST_F(ZipReaderTest, readStoredEntries) {
  auto zip_bytes = make_zip(kFiles, /* deflate */ false);
  zip::ZipReader reader(bytes(zip_bytes), zip_bytes.size());
  ASSERT_EQ(reader.entries().size(), 3);
  EXPECT_EQ(reader.entries()[1].filename, "AndroidManifest.xml");
  EXPECT_EQ(reader.entries()[1].comp_method, 0);
  for (const auto& file : kFiles) {
    EXPECT_EQ(as_string(reader.extract(file.first)), file.second);
  }
}

TEST_F(ZipReaderTest, readDeflatedEntries) {
  auto zip_bytes = make_zip(kFiles, /* deflate */ true);
  zip::ZipReader reader(bytes(zip_bytes), zip_bytes.size());
  const auto* entry = reader.find_entry("resources.arsc");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->comp_method, 8);
  EXPECT_LT(entry->comp_size, entry->ucomp_size);
  EXPECT_EQ(as_string(reader.extract(*entry)), kFiles[0].second);
  EXPECT_EQ(as_string(reader.extract("empty")), "");
}

TEST_F(ZipReaderTest, missingEntry) {
  auto zip_bytes = make_zip(kFiles, false);
  zip::ZipReader reader(bytes(zip_bytes), zip_bytes.size());
  EXPECT_EQ(reader.find_entry("classes.dex"), nullptr);
  EXPECT_RESC_ERROR(reader.extract("classes.dex"), INVALID_ZIP);
}

TEST_F(ZipReaderTest, corruptContentsFailCrc) {
  auto zip_bytes = make_zip({{"a.txt", "hello"}}, false);
  // Local header (30 bytes) and name precede the data.
  zip_bytes[30 + 5] = 'j';
  zip::ZipReader reader(bytes(zip_bytes), zip_bytes.size());
  EXPECT_RESC_ERROR(reader.extract("a.txt"), INVALID_ZIP);
}

TEST_F(ZipReaderTest, notAZip) {
  std::vector<char> junk(64, 'z');
  EXPECT_RESC_ERROR(zip::ZipReader reader(bytes(junk), junk.size()),
                    INVALID_ZIP);
  std::vector<char> tiny(4, 0);
  EXPECT_RESC_ERROR(zip::ZipReader reader(bytes(tiny), tiny.size()),
                    INVALID_ZIP);
}

TEST_F(ZipReaderTest, extractFromFile) {
  auto tmp = resc::make_tmp_dir("resc_zip_test_%%%%%%%%");
  auto path = tmp.path + "/test.apk";
  arsc::write_bytes_to_file(make_zip(kFiles, true), path);
  EXPECT_EQ(as_string(zip::extract_zip_file(path, "AndroidManifest.xml")),
            "<manifest/>");
}

TEST_F(ZipReaderTest, unreadableFiles) {
  auto tmp = resc::make_tmp_dir("resc_zip_test_%%%%%%%%");
  EXPECT_RESC_ERROR(zip::ZipReader reader(tmp.path + "/missing.apk"),
                    INVALID_ZIP);
  auto empty = tmp.path + "/empty.apk";
  arsc::write_bytes_to_file({}, empty);
  EXPECT_RESC_ERROR(zip::ZipReader reader(empty), INVALID_ZIP);
}
