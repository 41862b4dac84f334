/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "RescMappedFile.h"

namespace zip {

struct ZipEntry {
  std::string filename;
  uint16_t comp_method;
  uint32_t crc32;
  uint32_t comp_size;
  uint32_t ucomp_size;
  // Offset of the local file header.
  uint32_t disk_offset;
};

/*
 * Reads entries out of a (non disk-spanning) zip archive such as an apk or
 * android.jar. Only the STORE and DEFLATE compression methods are supported.
 */
class ZipReader {
 public:
  explicit ZipReader(const std::string& path);
  // The buffer must outlive the reader.
  ZipReader(const uint8_t* data, size_t size);

  ZipReader(ZipReader&&) = default;
  ZipReader& operator=(ZipReader&&) = default;

  const std::vector<ZipEntry>& entries() const { return m_entries; }

  // Returns nullptr if the archive has no entry of that name.
  const ZipEntry* find_entry(const std::string& name) const;

  std::vector<char> extract(const ZipEntry& entry) const;
  // Throws if the archive has no entry of that name.
  std::vector<char> extract(const std::string& name) const;

 private:
  void read_central_directory();

  std::unique_ptr<RescMappedFile> m_file;
  const uint8_t* m_data;
  size_t m_size;
  std::vector<ZipEntry> m_entries;
};

std::vector<char> extract_zip_file(const std::string& path,
                                   const std::string& name);

} // namespace zip
