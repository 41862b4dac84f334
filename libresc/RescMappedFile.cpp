/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "RescMappedFile.h"

#include <boost/filesystem.hpp>
#include <boost/iostreams/device/mapped_file.hpp>

#include "Debug.h"

RescMappedFile::RescMappedFile(
    std::unique_ptr<boost::iostreams::mapped_file_source> file,
    std::string filename)
    : m_file(std::move(file)), m_filename(std::move(filename)) {}

// Out of line, where mapped_file_source is complete.
RescMappedFile::RescMappedFile(RescMappedFile&&) noexcept = default;
RescMappedFile& RescMappedFile::operator=(RescMappedFile&&) noexcept = default;
RescMappedFile::~RescMappedFile() = default;

RescMappedFile RescMappedFile::open(const std::string& path) {
  boost::system::error_code ec;
  auto size = boost::filesystem::file_size(path, ec);
  always_assert_type_log(!ec, INVALID_ZIP, "Cannot open %s: %s", path.c_str(),
                         ec.message().c_str());
  auto map = std::make_unique<boost::iostreams::mapped_file_source>();
  // Mapping a zero-length file fails; leave such a file unmapped.
  if (size != 0) {
    map->open(path);
    always_assert_type_log(map->is_open(), INVALID_ZIP, "Could not map %s",
                           path.c_str());
  }
  return RescMappedFile(std::move(map), path);
}

const uint8_t* RescMappedFile::data() const {
  return m_file->is_open() ? reinterpret_cast<const uint8_t*>(m_file->data())
                           : nullptr;
}

size_t RescMappedFile::size() const {
  return m_file->is_open() ? m_file->size() : 0;
}
