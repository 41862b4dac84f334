/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "utils/Chunk.h"

#include <algorithm>

#include "Debug.h"
#include "RescMappedFile.h"
#include "Trace.h"
#include "utils/Unicode.h"

namespace arsc {

namespace {

constexpr uint8_t TYPE_FLAG_SPARSE = 1 << 0;
constexpr uint8_t TYPE_FLAG_OFFSET16 = 1 << 1;
constexpr uint16_t NO_ENTRY16 = 0xffff;

/*
 * Little endian, bounds checked view over the bytes of one chunk. Positions
 * are relative to the start of the chunk.
 */
class ChunkReader {
 public:
  ChunkReader(const uint8_t* data, size_t size) : m_data(data), m_size(size) {}

  size_t pos() const { return m_pos; }
  size_t size() const { return m_size; }
  size_t remaining() const { return m_size - m_pos; }

  void seek(size_t pos) {
    always_assert_type_log(pos <= m_size, BUFFER_END_EXCEEDED,
                           "Seek to %zu past chunk end %zu", pos, m_size);
    m_pos = pos;
  }

  void skip(size_t count) { seek(m_pos + count); }

  // View of the bytes from the current position to the end.
  ChunkReader rest() const {
    return ChunkReader(m_data + m_pos, m_size - m_pos);
  }

  const uint8_t* take(size_t count) {
    always_assert_type_log(count <= remaining(), BUFFER_END_EXCEEDED,
                           "Reading %zu bytes at %zu exceeds chunk end %zu",
                           count, m_pos, m_size);
    const uint8_t* p = m_data + m_pos;
    m_pos += count;
    return p;
  }

  const uint8_t* at(size_t pos) const {
    always_assert_type_log(pos <= m_size, BUFFER_END_EXCEEDED,
                           "Offset %zu past chunk end %zu", pos, m_size);
    return m_data + pos;
  }
  const uint8_t* end() const { return m_data + m_size; }

  uint8_t u8() { return *take(1); }

  uint16_t u16() {
    const uint8_t* p = take(2);
    return (uint16_t)(p[0] | (p[1] << 8));
  }

  uint32_t u32() {
    const uint8_t* p = take(4);
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) |
           ((uint32_t)p[3] << 24);
  }

  int32_t i32() { return static_cast<int32_t>(u32()); }

 private:
  const uint8_t* m_data;
  size_t m_size;
  size_t m_pos{0};
};

Chunk parse_chunk_impl(ChunkReader& r, uint32_t* chunk_size);

std::vector<Chunk> parse_children(ChunkReader& c) {
  std::vector<Chunk> children;
  while (c.remaining() > 0) {
    auto rest = c.rest();
    uint32_t child_size;
    children.push_back(parse_chunk_impl(rest, &child_size));
    c.skip(child_size);
  }
  return children;
}

std::string read_string8(ChunkReader& c, size_t pos, uint32_t index) {
  const uint8_t* p = c.at(pos);
  decode_u8_length(p, c.end()); // length in UTF-16 code units
  size_t len = decode_u8_length(p, c.end());
  always_assert_type_log(len <= (size_t)(c.end() - p), BUFFER_END_EXCEEDED,
                         "String %u of length %zu exceeds the pool", index,
                         len);
  const char* s = reinterpret_cast<const char*>(p);
  if (!is_valid_utf8(s, len)) {
    // Some resource tables in the wild carry a few corrupt strings.
    TRACE(ARSC, 1, "Invalid UTF-8 in pool string %u, using empty string",
          index);
    return std::string();
  }
  return std::string(s, len);
}

std::string read_string16(ChunkReader& c, size_t pos, uint32_t index) {
  const uint8_t* p = c.at(pos);
  size_t len = decode_u16_length(p, c.end());
  std::u16string s;
  s.reserve(len);
  while (true) {
    always_assert_type_log(c.end() - p >= 2, BUFFER_END_EXCEEDED,
                           "Unterminated UTF-16 string %u", index);
    char16_t unit = (char16_t)(p[0] | (p[1] << 8));
    p += 2;
    if (unit == 0) {
      break;
    }
    s.push_back(unit);
  }
  auto utf8 = utf16_to_utf8(s);
  always_assert_type_log(utf8, MALFORMED_CHUNK,
                         "Invalid UTF-16 in pool string %u", index);
  return *utf8;
}

StringPoolChunk parse_string_pool(ChunkReader& c, uint16_t header_size) {
  ResStringPoolHeader header;
  header.string_count = c.u32();
  header.style_count = c.u32();
  header.flags = c.u32();
  header.strings_start = c.u32();
  header.styles_start = c.u32();
  always_assert_type_log(
      (header.flags & ~(ResStringPoolHeader::SORTED_FLAG |
                        ResStringPoolHeader::UTF8_FLAG)) == 0,
      MALFORMED_CHUNK, "Unrecognized string pool flags 0x%x", header.flags);
  TRACE(ARSC, 4, "String pool: %u strings, %u styles, flags 0x%x",
        header.string_count, header.style_count, header.flags);

  c.seek(header_size);
  always_assert_type_log(
      (uint64_t)header.string_count + header.style_count <= c.remaining() / 4,
      BUFFER_END_EXCEEDED,
      "String pool with %u strings and %u styles exceeds the chunk",
      header.string_count, header.style_count);
  std::vector<uint32_t> string_offsets(header.string_count);
  for (auto& offset : string_offsets) {
    offset = c.u32();
  }
  std::vector<uint32_t> style_offsets(header.style_count);
  for (auto& offset : style_offsets) {
    offset = c.u32();
  }

  StringPoolChunk pool;
  pool.strings.reserve(header.string_count);
  for (uint32_t i = 0; i < header.string_count; i++) {
    size_t pos = (size_t)header.strings_start + string_offsets[i];
    pool.strings.push_back(header.is_utf8() ? read_string8(c, pos, i)
                                            : read_string16(c, pos, i));
  }

  pool.styles.reserve(header.style_count);
  for (uint32_t i = 0; i < header.style_count; i++) {
    c.seek((size_t)header.styles_start + style_offsets[i]);
    std::vector<ResSpan> spans;
    while (true) {
      int32_t name = c.i32();
      if (name == ResSpan::END) {
        break;
      }
      ResSpan span;
      span.name = name;
      span.first_char = c.u32();
      span.last_char = c.u32();
      spans.push_back(span);
    }
    pool.styles.push_back(std::move(spans));
  }
  // Trailing padding and the style terminator are not significant.
  c.seek(c.size());
  return pool;
}

ResXmlNodeHeader parse_node_header(ChunkReader& c, uint16_t header_size) {
  ResXmlNodeHeader node;
  node.line_number = c.u32();
  node.comment = c.i32();
  c.seek(header_size);
  return node;
}

ResValue parse_value(ChunkReader& c) {
  ResValue value;
  value.size = c.u16();
  value.res0 = c.u8();
  value.data_type = c.u8();
  value.data = c.u32();
  return value;
}

XmlStartElementChunk parse_start_element(ChunkReader& c,
                                         uint16_t header_size) {
  XmlStartElementChunk chunk;
  chunk.node = parse_node_header(c, header_size);
  size_t ext_start = c.pos();
  auto& element = chunk.element;
  element.ns = c.i32();
  element.name = c.i32();
  element.attribute_start = c.u16();
  element.attribute_size = c.u16();
  element.attribute_count = c.u16();
  element.id_index = c.u16();
  element.class_index = c.u16();
  element.style_index = c.u16();
  always_assert_type_log(element.attribute_count == 0 ||
                             element.attribute_size >=
                                 ResXmlStartElement::DEFAULT_ATTRIBUTE_SIZE,
                         MALFORMED_CHUNK, "Attribute size %u is too small",
                         element.attribute_size);
  size_t attributes_start = ext_start + element.attribute_start;
  for (uint16_t i = 0; i < element.attribute_count; i++) {
    c.seek(attributes_start + (size_t)i * element.attribute_size);
    ResXmlAttribute attr;
    attr.ns = c.i32();
    attr.name = c.i32();
    attr.raw_value = c.i32();
    attr.typed_value = parse_value(c);
    chunk.attributes.push_back(attr);
  }
  c.seek(std::min(c.size(), attributes_start + (size_t)element.attribute_count *
                                                   element.attribute_size));
  return chunk;
}

ResTableConfig parse_config(ChunkReader& c) {
  ResTableConfig config;
  config.size = c.u32();
  always_assert_type_log(config.size >= ResTableConfig::KNOWN_SIZE,
                         MALFORMED_CHUNK, "Config size %u is too small",
                         config.size);
  config.imsi = c.u32();
  config.locale = c.u32();
  config.screen_type.orientation = c.u8();
  config.screen_type.touchscreen = c.u8();
  config.screen_type.density = c.u16();
  config.input = c.u32();
  config.screen_size = c.u32();
  config.version = c.u32();
  size_t tail = config.size - ResTableConfig::KNOWN_SIZE;
  const uint8_t* p = c.take(tail);
  config.unknown.assign(p, p + tail);
  return config;
}

ResTableEntry parse_entry(ChunkReader& c, size_t pos) {
  c.seek(pos);
  ResTableEntry entry;
  entry.size = c.u16();
  entry.flags = c.u16();
  entry.key = c.u32();
  always_assert_type_log(
      (entry.flags &
       ~(ResTableEntry::FLAG_COMPLEX | ResTableEntry::FLAG_PUBLIC |
         ResTableEntry::FLAG_WEAK)) == 0,
      MALFORMED_CHUNK, "Unrecognized entry flags 0x%x", entry.flags);
  if (entry.is_complex()) {
    always_assert_type_log(entry.size >= ResTableEntry::COMPLEX_SIZE,
                           MALFORMED_CHUNK, "Complex entry size %u too small",
                           entry.size);
    ResTableComplexValue complex;
    complex.header.parent = c.u32();
    complex.header.count = c.u32();
    c.seek(pos + entry.size);
    complex.entries.reserve(std::min<uint32_t>(complex.header.count, 1024));
    for (uint32_t i = 0; i < complex.header.count; i++) {
      ResTableMap map;
      map.name = c.u32();
      map.value = parse_value(c);
      complex.entries.push_back(map);
    }
    entry.value = std::move(complex);
  } else {
    always_assert_type_log(entry.size >= ResTableEntry::SIMPLE_SIZE,
                           MALFORMED_CHUNK, "Entry size %u too small",
                           entry.size);
    c.seek(pos + entry.size);
    entry.value = parse_value(c);
  }
  return entry;
}

TableTypeChunk parse_table_type(ChunkReader& c, uint16_t header_size) {
  TableTypeChunk chunk;
  chunk.type_id = c.u8();
  always_assert_type_log(chunk.type_id != 0, MALFORMED_CHUNK,
                         "Type id of 0 is invalid");
  uint8_t flags = c.u8();
  always_assert_type_log(
      (flags & ~(TYPE_FLAG_SPARSE | TYPE_FLAG_OFFSET16)) == 0, MALFORMED_CHUNK,
      "Unrecognized type flags 0x%x", flags);
  c.u16(); // reserved
  uint32_t entry_count = c.u32();
  uint32_t entries_start = c.u32();
  chunk.config = parse_config(c);

  bool sparse = (flags & TYPE_FLAG_SPARSE) != 0;
  bool offset16 = (flags & TYPE_FLAG_OFFSET16) != 0;
  auto offset_from16 = [](uint16_t offset) {
    return offset == NO_ENTRY16 ? NO_VALUE : (uint32_t)offset * 4;
  };

  // Read all offsets up front, entries are read by seeking.
  c.seek(header_size);
  size_t slot_size = sparse ? 4 : offset16 ? 2 : 4;
  always_assert_type_log(entry_count <= c.remaining() / slot_size,
                         BUFFER_END_EXCEEDED,
                         "Type with %u entries exceeds the chunk", entry_count);
  std::vector<std::pair<uint32_t, size_t>> offsets;
  offsets.reserve(entry_count);
  size_t high_idx = entry_count;
  for (uint32_t i = 0; i < entry_count; i++) {
    if (sparse) {
      uint16_t idx = c.u16();
      high_idx = std::max(high_idx, (size_t)idx + 1);
      offsets.emplace_back(offset_from16(c.u16()), idx);
    } else if (offset16) {
      offsets.emplace_back(offset_from16(c.u16()), i);
    } else {
      offsets.emplace_back(c.u32(), i);
    }
  }
  if (sparse) {
    TRACE(ARSC, 5, "Sparse type %u occupies %u of %zu entries", chunk.type_id,
          entry_count, high_idx);
  }

  chunk.entries.resize(sparse ? high_idx : entry_count);
  for (const auto& [offset, idx] : offsets) {
    if (offset == NO_VALUE) {
      continue;
    }
    chunk.entries[idx] = parse_entry(c, (size_t)entries_start + offset);
  }
  c.seek(c.size());
  return chunk;
}

TableTypeSpecChunk parse_table_type_spec(ChunkReader& c,
                                         uint16_t header_size) {
  TableTypeSpecChunk chunk;
  chunk.type_id = c.u8();
  always_assert_type_log(chunk.type_id != 0, MALFORMED_CHUNK,
                         "Type id of 0 is invalid");
  c.u8(); // reserved
  c.u16(); // types_count
  uint32_t entry_count = c.u32();
  c.seek(header_size);
  always_assert_type_log(entry_count <= c.remaining() / 4,
                         BUFFER_END_EXCEEDED,
                         "Type spec with %u entries exceeds the chunk",
                         entry_count);
  chunk.flags.reserve(entry_count);
  for (uint32_t i = 0; i < entry_count; i++) {
    chunk.flags.push_back(c.u32());
  }
  return chunk;
}

TablePackageChunk parse_package(ChunkReader& c, uint16_t header_size) {
  TablePackageChunk chunk;
  auto& header = chunk.header;
  header.id = c.u32();
  std::u16string name;
  bool terminated = false;
  for (uint32_t i = 0; i < PACKAGE_NAME_ARR_LENGTH; i++) {
    char16_t unit = c.u16();
    if (unit == 0) {
      terminated = true;
    } else if (!terminated) {
      name.push_back(unit);
    }
  }
  auto utf8_name = utf16_to_utf8(name);
  always_assert_type_log(utf8_name, MALFORMED_CHUNK,
                         "Invalid UTF-16 in package name");
  header.name = *utf8_name;
  header.type_strings = c.u32();
  header.last_public_type = c.u32();
  header.key_strings = c.u32();
  header.last_public_key = c.u32();
  if (header_size > ResTablePackageHeader::LEGACY_HEADER_SIZE) {
    header.type_id_offset = c.u32();
  }
  TRACE(ARSC, 3, "Package 0x%x %s", header.id, header.name.c_str());
  c.seek(header_size);
  chunk.children = parse_children(c);
  return chunk;
}

Chunk parse_chunk_impl(ChunkReader& r, uint32_t* chunk_size) {
  ResChunkHeader header;
  header.type = r.u16();
  header.header_size = r.u16();
  header.size = r.u32();
  always_assert_type_log(header.header_size >= CHUNK_HEADER_SIZE,
                         MALFORMED_CHUNK,
                         "Chunk header size %u is too small (type 0x%x)",
                         header.header_size, header.type);
  always_assert_type_log(header.size >= header.header_size, MALFORMED_CHUNK,
                         "Chunk size %u is smaller than its header size %u",
                         header.size, header.header_size);
  always_assert_type_log(header.size <= r.size(), BUFFER_END_EXCEEDED,
                         "Chunk of size %u exceeds the %zu available bytes",
                         header.size, r.size());
  auto type = chunk_type_from_u16(header.type);
  always_assert_type_log(type, MALFORMED_CHUNK,
                         "Unrecognized chunk type 0x%x", header.type);
  TRACE(ARSC, 5, "%s chunk: header %u, size %u", chunk_type_name(*type),
        header.header_size, header.size);

  ChunkReader c(r.at(0), header.size);
  c.seek(CHUNK_HEADER_SIZE);
  Chunk result;
  switch (*type) {
  case ChunkType::Null:
    c.seek(c.size());
    result = NullChunk{};
    break;
  case ChunkType::StringPool:
    result = parse_string_pool(c, header.header_size);
    break;
  case ChunkType::Table: {
    TableChunk table;
    table.header.package_count = c.u32();
    c.seek(header.header_size);
    table.children = parse_children(c);
    result = std::move(table);
    break;
  }
  case ChunkType::Xml: {
    XmlChunk xml;
    c.seek(header.header_size);
    xml.children = parse_children(c);
    result = std::move(xml);
    break;
  }
  case ChunkType::XmlStartNamespace: {
    XmlStartNamespaceChunk ns;
    ns.node = parse_node_header(c, header.header_size);
    ns.ns.prefix = c.i32();
    ns.ns.uri = c.i32();
    result = ns;
    break;
  }
  case ChunkType::XmlEndNamespace: {
    XmlEndNamespaceChunk ns;
    ns.node = parse_node_header(c, header.header_size);
    ns.ns.prefix = c.i32();
    ns.ns.uri = c.i32();
    result = ns;
    break;
  }
  case ChunkType::XmlStartElement:
    result = parse_start_element(c, header.header_size);
    break;
  case ChunkType::XmlEndElement: {
    XmlEndElementChunk end;
    end.node = parse_node_header(c, header.header_size);
    end.element.ns = c.i32();
    end.element.name = c.i32();
    result = end;
    break;
  }
  case ChunkType::XmlResourceMap: {
    c.seek(header.header_size);
    always_assert_type_log(c.remaining() % 4 == 0, MALFORMED_CHUNK,
                           "Resource map size %zu is not a multiple of 4",
                           c.remaining());
    XmlResourceMapChunk map;
    map.ids.reserve(c.remaining() / 4);
    while (c.remaining() > 0) {
      map.ids.push_back(c.u32());
    }
    result = std::move(map);
    break;
  }
  case ChunkType::TablePackage:
    result = parse_package(c, header.header_size);
    break;
  case ChunkType::TableType:
    result = parse_table_type(c, header.header_size);
    break;
  case ChunkType::TableTypeSpec:
    result = parse_table_type_spec(c, header.header_size);
    break;
  case ChunkType::Unknown:
    c.seek(c.size());
    result = UnknownChunk{};
    break;
  }

  always_assert_type_log(c.pos() == c.size(), MALFORMED_CHUNK,
                         "Did not read entire %s chunk: %zu of %u bytes",
                         chunk_type_name(*type), c.pos(), header.size);
  *chunk_size = header.size;
  return result;
}

} // namespace

size_t decode_u8_length(const uint8_t*& data, const uint8_t* end) {
  always_assert_type_log(data < end, BUFFER_END_EXCEEDED,
                         "Truncated string length");
  size_t len = *data++;
  if ((len & 0x80) != 0) {
    always_assert_type_log(data < end, BUFFER_END_EXCEEDED,
                           "Truncated string length");
    len = ((len & 0x7f) << 8) | *data++;
  }
  return len;
}

size_t decode_u16_length(const uint8_t*& data, const uint8_t* end) {
  auto read = [&]() {
    always_assert_type_log(end - data >= 2, BUFFER_END_EXCEEDED,
                           "Truncated string length");
    size_t unit = data[0] | (data[1] << 8);
    data += 2;
    return unit;
  };
  size_t len = read();
  if ((len & 0x8000) != 0) {
    len = ((len & 0x7fff) << 16) | read();
  }
  return len;
}

Chunk parse_chunk(const void* data, size_t size) {
  ChunkReader r(static_cast<const uint8_t*>(data), size);
  uint32_t chunk_size;
  auto chunk = parse_chunk_impl(r, &chunk_size);
  if (chunk_size < size) {
    TRACE(ARSC, 2, "Ignoring %zu bytes after the root chunk",
          size - chunk_size);
  }
  return chunk;
}

Chunk parse_chunk(const std::vector<char>& data) {
  return parse_chunk(data.data(), data.size());
}

Chunk parse_chunk_file(const std::string& path) {
  auto file = RescMappedFile::open(path);
  TRACE(ARSC, 1, "Parsing %s (%zu bytes)", path.c_str(), file.size());
  return parse_chunk(file.data(), file.size());
}

ChunkType Chunk::type() const {
  struct Visitor {
    ChunkType operator()(const NullChunk&) const { return ChunkType::Null; }
    ChunkType operator()(const StringPoolChunk&) const {
      return ChunkType::StringPool;
    }
    ChunkType operator()(const TableChunk&) const { return ChunkType::Table; }
    ChunkType operator()(const XmlChunk&) const { return ChunkType::Xml; }
    ChunkType operator()(const XmlStartNamespaceChunk&) const {
      return ChunkType::XmlStartNamespace;
    }
    ChunkType operator()(const XmlEndNamespaceChunk&) const {
      return ChunkType::XmlEndNamespace;
    }
    ChunkType operator()(const XmlStartElementChunk&) const {
      return ChunkType::XmlStartElement;
    }
    ChunkType operator()(const XmlEndElementChunk&) const {
      return ChunkType::XmlEndElement;
    }
    ChunkType operator()(const XmlResourceMapChunk&) const {
      return ChunkType::XmlResourceMap;
    }
    ChunkType operator()(const TablePackageChunk&) const {
      return ChunkType::TablePackage;
    }
    ChunkType operator()(const TableTypeChunk&) const {
      return ChunkType::TableType;
    }
    ChunkType operator()(const TableTypeSpecChunk&) const {
      return ChunkType::TableTypeSpec;
    }
    ChunkType operator()(const UnknownChunk&) const {
      return ChunkType::Unknown;
    }
  };
  return std::visit(Visitor(), value);
}

bool operator==(const NullChunk&, const NullChunk&) { return true; }

bool operator==(const StringPoolChunk& a, const StringPoolChunk& b) {
  return a.strings == b.strings && a.styles == b.styles;
}

bool operator==(const TableChunk& a, const TableChunk& b) {
  return a.header == b.header && a.children == b.children;
}

bool operator==(const XmlChunk& a, const XmlChunk& b) {
  return a.children == b.children;
}

bool operator==(const XmlStartNamespaceChunk& a,
                const XmlStartNamespaceChunk& b) {
  return a.node == b.node && a.ns == b.ns;
}

bool operator==(const XmlEndNamespaceChunk& a, const XmlEndNamespaceChunk& b) {
  return a.node == b.node && a.ns == b.ns;
}

bool operator==(const XmlStartElementChunk& a, const XmlStartElementChunk& b) {
  return a.node == b.node && a.element == b.element &&
         a.attributes == b.attributes;
}

bool operator==(const XmlEndElementChunk& a, const XmlEndElementChunk& b) {
  return a.node == b.node && a.element == b.element;
}

bool operator==(const XmlResourceMapChunk& a, const XmlResourceMapChunk& b) {
  return a.ids == b.ids;
}

bool operator==(const TablePackageChunk& a, const TablePackageChunk& b) {
  return a.header == b.header && a.children == b.children;
}

bool operator==(const TableTypeChunk& a, const TableTypeChunk& b) {
  return a.type_id == b.type_id && a.config == b.config &&
         a.entries == b.entries;
}

bool operator==(const TableTypeSpecChunk& a, const TableTypeSpecChunk& b) {
  return a.type_id == b.type_id && a.flags == b.flags;
}

bool operator==(const UnknownChunk&, const UnknownChunk&) { return true; }

bool operator==(const Chunk& a, const Chunk& b) { return a.value == b.value; }

bool operator!=(const Chunk& a, const Chunk& b) { return !(a == b); }

} // namespace arsc
