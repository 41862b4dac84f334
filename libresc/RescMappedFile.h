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

namespace boost {
namespace iostreams {
class mapped_file_source;
} // namespace iostreams
} // namespace boost

// Read-only memory mapping of an input file such as android.jar.
class RescMappedFile {
 public:
  // Throws INVALID_ZIP if the file cannot be mapped.
  static RescMappedFile open(const std::string& path);

  RescMappedFile(RescMappedFile&&) noexcept;
  RescMappedFile& operator=(RescMappedFile&&) noexcept;
  ~RescMappedFile();

  // nullptr for an empty file.
  const uint8_t* data() const;
  size_t size() const;
  const std::string& filename() const { return m_filename; }

 private:
  RescMappedFile(std::unique_ptr<boost::iostreams::mapped_file_source> file,
                 std::string filename);

  std::unique_ptr<boost::iostreams::mapped_file_source> m_file;
  std::string m_filename;
};
