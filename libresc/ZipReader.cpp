/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ZipReader.h"

#include <algorithm>
#include <cstring>
#include <string_view>
#include <zlib.h>

#include "Debug.h"
#include "Trace.h"

namespace zip {

namespace {

constexpr uint16_t kMethodStore = 0;
constexpr uint16_t kMethodDeflate = 8;

constexpr uint32_t kLocalFileSignature = 0x04034b50;
constexpr uint32_t kCentralFileSignature = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSignature = 0x06054b50;

// Fixed part of the end record, without its comment.
constexpr size_t kEndOfCentralDirSize = 22;
// The end record may be followed by a comment of up to 64k.
constexpr size_t kMaxCommentSize = 0xffff;

/*
 * Little-endian reads over a bounded window of the archive. Every read is
 * checked against the end of the archive.
 */
class Cursor {
 public:
  Cursor(const uint8_t* data, size_t size, size_t pos)
      : m_data(data), m_size(size), m_pos(pos) {}

  uint16_t u16() {
    need(2);
    uint16_t v = m_data[m_pos] | (m_data[m_pos + 1] << 8);
    m_pos += 2;
    return v;
  }

  uint32_t u32() {
    need(4);
    uint32_t v = (uint32_t)m_data[m_pos] | ((uint32_t)m_data[m_pos + 1] << 8) |
                 ((uint32_t)m_data[m_pos + 2] << 16) |
                 ((uint32_t)m_data[m_pos + 3] << 24);
    m_pos += 4;
    return v;
  }

  std::string_view bytes(size_t len) {
    need(len);
    std::string_view v(reinterpret_cast<const char*>(m_data + m_pos), len);
    m_pos += len;
    return v;
  }

  void skip(size_t len) {
    need(len);
    m_pos += len;
  }

  size_t pos() const { return m_pos; }

 private:
  void need(size_t len) const {
    always_assert_type_log(m_pos <= m_size && len <= m_size - m_pos,
                           RescError::INVALID_ZIP,
                           "Zip record at %zu exceeds the archive (%zu bytes)",
                           m_pos, m_size);
  }

  const uint8_t* m_data;
  size_t m_size;
  size_t m_pos;
};

struct EndOfCentralDir {
  uint16_t disk;
  uint16_t cd_disk;
  uint16_t disk_entries;
  uint16_t entries;
  uint32_t cd_size;
  uint32_t cd_offset;
};

// Scans backwards from the end of the archive for the end record.
EndOfCentralDir find_end_of_central_dir(const uint8_t* data, size_t size) {
  always_assert_type_log(size >= kEndOfCentralDirSize, RescError::INVALID_ZIP,
                         "Zip too small: %zu bytes", size);
  size_t last = size - kEndOfCentralDirSize;
  size_t first = last > kMaxCommentSize ? last - kMaxCommentSize : 0;
  for (size_t pos = last + 1; pos-- > first;) {
    Cursor c(data, size, pos);
    if (c.u32() != kEndOfCentralDirSignature) {
      continue;
    }
    EndOfCentralDir end;
    end.disk = c.u16();
    end.cd_disk = c.u16();
    end.disk_entries = c.u16();
    end.entries = c.u16();
    end.cd_size = c.u32();
    end.cd_offset = c.u32();
    // Multi-disk archives are not supported.
    always_assert_type_log(end.disk == 0 && end.cd_disk == 0 &&
                               end.entries == end.disk_entries,
                           RescError::INVALID_ZIP,
                           "Disk spanning is not supported");
    always_assert_type_log((size_t)end.cd_offset + end.cd_size <= pos,
                           RescError::INVALID_ZIP,
                           "Central directory overflows the archive");
    return end;
  }
  resc_fail(RescError::INVALID_ZIP,
            "End of central directory record not found");
}

ZipEntry read_central_file(Cursor& c) {
  always_assert_type_log(c.u32() == kCentralFileSignature,
                         RescError::INVALID_ZIP,
                         "Invalid central directory entry at %zu", c.pos() - 4);
  ZipEntry entry;
  c.skip(4); // version made by, version needed
  c.skip(2); // flags
  entry.comp_method = c.u16();
  c.skip(4); // time, date
  entry.crc32 = c.u32();
  entry.comp_size = c.u32();
  entry.ucomp_size = c.u32();
  uint16_t name_len = c.u16();
  uint16_t extra_len = c.u16();
  uint16_t comment_len = c.u16();
  c.skip(8); // disk, internal and external attributes
  entry.disk_offset = c.u32();
  entry.filename = std::string(c.bytes(name_len));
  c.skip(extra_len + comment_len);
  return entry;
}

void inflate_raw(const uint8_t* in, size_t in_size, std::vector<char>* out) {
  z_stream stream;
  memset(&stream, 0, sizeof(stream));
  int err = inflateInit2(&stream, -MAX_WBITS);
  always_assert_type_log(err == Z_OK, RescError::INVALID_ZIP,
                         "inflateInit2 failed: %d", err);
  stream.next_in = const_cast<Bytef*>(in);
  stream.avail_in = (uInt)in_size;
  stream.next_out = reinterpret_cast<Bytef*>(out->data());
  stream.avail_out = (uInt)out->size();
  err = inflate(&stream, Z_FINISH);
  auto produced = stream.total_out;
  inflateEnd(&stream);
  always_assert_type_log(err == Z_STREAM_END, RescError::INVALID_ZIP,
                         "Failed decompression: %d", err);
  always_assert_type_log(produced == out->size(), RescError::INVALID_ZIP,
                         "Inflated %lu bytes, expected %zu", produced,
                         out->size());
}

} // namespace

ZipReader::ZipReader(const std::string& path)
    : m_file(std::make_unique<RescMappedFile>(RescMappedFile::open(path))) {
  m_data = m_file->data();
  m_size = m_file->size();
  TRACE(ZIP, 2, "Reading zip %s (%zu bytes)", path.c_str(), m_size);
  read_central_directory();
}

ZipReader::ZipReader(const uint8_t* data, size_t size)
    : m_data(data), m_size(size) {
  read_central_directory();
}

void ZipReader::read_central_directory() {
  auto end = find_end_of_central_dir(m_data, m_size);
  Cursor c(m_data, m_size, end.cd_offset);
  m_entries.reserve(end.entries);
  for (uint16_t i = 0; i < end.entries; i++) {
    m_entries.push_back(read_central_file(c));
    const auto& entry = m_entries.back();
    TRACE(ZIP, 4, "  %s: method %u, %u -> %u bytes", entry.filename.c_str(),
          entry.comp_method, entry.comp_size, entry.ucomp_size);
  }
}

const ZipEntry* ZipReader::find_entry(const std::string& name) const {
  auto it = std::find_if(m_entries.begin(), m_entries.end(),
                         [&](const ZipEntry& e) { return e.filename == name; });
  return it == m_entries.end() ? nullptr : &*it;
}

std::vector<char> ZipReader::extract(const std::string& name) const {
  const auto* entry = find_entry(name);
  always_assert_type_log(entry != nullptr, RescError::INVALID_ZIP,
                         "No entry named %s in archive", name.c_str());
  return extract(*entry);
}

std::vector<char> ZipReader::extract(const ZipEntry& entry) const {
  always_assert_type_log(entry.comp_method == kMethodDeflate ||
                             entry.comp_method == kMethodStore,
                         RescError::INVALID_ZIP,
                         "Unknown compression method %u for %s",
                         entry.comp_method, entry.filename.c_str());

  Cursor c(m_data, m_size, entry.disk_offset);
  always_assert_type_log(c.u32() == kLocalFileSignature,
                         RescError::INVALID_ZIP, "Invalid local file entry %s",
                         entry.filename.c_str());
  c.skip(4); // version needed, flags
  uint16_t method = c.u16();
  c.skip(8); // time, date, crc
  uint32_t comp_size = c.u32();
  uint32_t ucomp_size = c.u32();
  uint16_t name_len = c.u16();
  uint16_t extra_len = c.u16();
  auto name = c.bytes(name_len);
  c.skip(extra_len);
  // Writers that stream their output leave the sizes to a data descriptor
  // after the contents; the central directory has the real values.
  if (comp_size == 0 && ucomp_size == 0) {
    comp_size = entry.comp_size;
    ucomp_size = entry.ucomp_size;
  }
  always_assert_type_log(name == entry.filename && method == entry.comp_method &&
                             comp_size == entry.comp_size &&
                             ucomp_size == entry.ucomp_size,
                         RescError::INVALID_ZIP,
                         "Local file header of %s disagrees with the central "
                         "directory",
                         entry.filename.c_str());
  auto contents = c.bytes(comp_size);
  const auto* in = reinterpret_cast<const uint8_t*>(contents.data());

  std::vector<char> out(ucomp_size);
  if (method == kMethodStore) {
    always_assert_type_log(comp_size == ucomp_size, RescError::INVALID_ZIP,
                           "STOREd entry %s has sizes %u and %u",
                           entry.filename.c_str(), comp_size, ucomp_size);
    std::copy(contents.begin(), contents.end(), out.begin());
  } else if (!out.empty()) {
    inflate_raw(in, comp_size, &out);
  }

  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(out.data()), out.size());
  always_assert_type_log(crc == entry.crc32, RescError::INVALID_ZIP,
                         "CRC mismatch for %s: 0x%lx vs 0x%x",
                         entry.filename.c_str(), crc, entry.crc32);
  return out;
}

std::vector<char> extract_zip_file(const std::string& path,
                                   const std::string& name) {
  ZipReader reader(path);
  return reader.extract(name);
}

} // namespace zip
