/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "utils/Serialize.h"

#include <fstream>

#include "Debug.h"
#include "Trace.h"
#include "utils/Unicode.h"

namespace arsc {

void align_vec(size_t s, std::vector<char>* vec) {
  size_t r = vec->size() % s;
  if (r > 0) {
    for (size_t i = s - r; i > 0; i--) {
      vec->push_back(0);
    }
  }
}

void push_short(uint16_t data, std::vector<char>* vec) {
  vec->push_back((char)data);
  vec->push_back((char)(data >> 8));
}

void push_long(uint32_t data, std::vector<char>* vec) {
  vec->push_back((char)data);
  vec->push_back((char)(data >> 8));
  vec->push_back((char)(data >> 16));
  vec->push_back((char)(data >> 24));
}

void push_u8_length(size_t len, std::vector<char>* vec) {
  // If len > 2^7-1, then set the most significant bit, then use a second byte
  // to describe the length (leaving 15 bits for the actual len).
  if (len >= 0x80) {
    const auto mask = 0x8000;
    always_assert_log(len < mask, "String length %zu too large", len);
    // Set the high bit, then push it in two pieces (can't just push short).
    uint16_t encoded = mask | len;
    vec->push_back((char)(encoded >> 8));
    vec->push_back((char)(encoded & 0xFF));
  } else {
    vec->push_back((char)len);
  }
}

void encode_string8(const std::string& s, std::vector<char>* vec) {
  // aapt2 writes both the utf16 length followed by utf8 length
  push_u8_length(utf8_to_utf16_length(s), vec);
  push_u8_length(s.size(), vec);
  vec->insert(vec->end(), s.begin(), s.end());
  vec->push_back('\0');
}

void write_short_at_pos(size_t index, uint16_t data, std::vector<char>* vec) {
  always_assert(index + 2 <= vec->size());
  (*vec)[index] = (char)data;
  (*vec)[index + 1] = (char)(data >> 8);
}

void write_long_at_pos(size_t index, uint32_t data, std::vector<char>* vec) {
  always_assert(index + 4 <= vec->size());
  (*vec)[index] = (char)data;
  (*vec)[index + 1] = (char)(data >> 8);
  (*vec)[index + 2] = (char)(data >> 16);
  (*vec)[index + 3] = (char)(data >> 24);
}

size_t start_chunk(ChunkType type, std::vector<char>* out) {
  size_t start = out->size();
  push_short(static_cast<uint16_t>(type), out);
  push_short(CHUNK_HEADER_SIZE, out);
  push_long(FILL_IN_LATER, out);
  return start;
}

void end_header(size_t chunk_start, std::vector<char>* out) {
  size_t header_size = out->size() - chunk_start;
  always_assert_log(header_size <= 0xffff, "Chunk header too large: %zu",
                    header_size);
  write_short_at_pos(chunk_start + 2, (uint16_t)header_size, out);
}

void end_chunk(size_t chunk_start, std::vector<char>* out) {
  write_long_at_pos(chunk_start + 4, out->size() - chunk_start, out);
}

namespace {

void write_children(const std::vector<Chunk>& children,
                    std::vector<char>* out) {
  for (const auto& child : children) {
    write_chunk(child, out);
  }
}

void write_value(const ResValue& value, std::vector<char>* out) {
  push_short(value.size, out);
  out->push_back((char)value.res0);
  out->push_back((char)value.data_type);
  push_long(value.data, out);
}

void write_node_header(const ResXmlNodeHeader& node, std::vector<char>* out) {
  push_long(node.line_number, out);
  push_long(node.comment, out);
}

void write_string_pool(const StringPoolChunk& pool, std::vector<char>* out) {
  always_assert_log(pool.styles.size() <= pool.strings.size(),
                    "%zu styles for %zu strings", pool.styles.size(),
                    pool.strings.size());
  // Strings and spans are laid out first so that the offsets are known.
  std::vector<uint32_t> string_idx;
  std::vector<char> serialized_strings;
  for (const auto& s : pool.strings) {
    string_idx.push_back(serialized_strings.size());
    encode_string8(s, &serialized_strings);
  }
  align_vec(4, &serialized_strings);

  std::vector<uint32_t> span_off;
  std::vector<char> serialized_spans;
  for (const auto& spans : pool.styles) {
    span_off.push_back(serialized_spans.size());
    for (const auto& span : spans) {
      push_long(span.name, &serialized_spans);
      push_long(span.first_char, &serialized_spans);
      push_long(span.last_char, &serialized_spans);
    }
    push_long(ResSpan::END, &serialized_spans);
  }

  auto start = start_chunk(ChunkType::StringPool, out);
  auto num_strings = pool.strings.size();
  auto num_styles = pool.styles.size();
  push_long(num_strings, out);
  push_long(num_styles, out);
  push_long(ResStringPoolHeader::UTF8_FLAG, out);
  auto strings_start_pos = out->size();
  push_long(FILL_IN_LATER, out);
  auto styles_start_pos = out->size();
  push_long(FILL_IN_LATER, out);
  end_header(start, out);

  for (uint32_t i : string_idx) {
    push_long(i, out);
  }
  for (uint32_t i : span_off) {
    push_long(i, out);
  }
  write_long_at_pos(strings_start_pos, out->size() - start, out);
  out->insert(out->end(), serialized_strings.begin(), serialized_strings.end());
  write_long_at_pos(styles_start_pos,
                    num_styles > 0 ? out->size() - start : 0, out);
  out->insert(out->end(), serialized_spans.begin(), serialized_spans.end());
  end_chunk(start, out);
}

void write_config(const ResTableConfig& config, std::vector<char>* out) {
  always_assert_log(
      config.size == ResTableConfig::KNOWN_SIZE + config.unknown.size(),
      "Config size %u does not match its %zu trailing bytes", config.size,
      config.unknown.size());
  push_long(config.size, out);
  push_long(config.imsi, out);
  push_long(config.locale, out);
  out->push_back((char)config.screen_type.orientation);
  out->push_back((char)config.screen_type.touchscreen);
  push_short(config.screen_type.density, out);
  push_long(config.input, out);
  push_long(config.screen_size, out);
  push_long(config.version, out);
  out->insert(out->end(), config.unknown.begin(), config.unknown.end());
}

void write_entry(const ResTableEntry& entry, std::vector<char>* out) {
  auto complex = entry.complex();
  always_assert_log(entry.is_complex() == (complex != nullptr),
                    "Entry %u flags 0x%x disagree with its value", entry.key,
                    entry.flags);
  auto entry_start = out->size();
  push_short(entry.size, out);
  push_short(entry.flags, out);
  push_long(entry.key, out);
  if (complex != nullptr) {
    always_assert_log(entry.size >= ResTableEntry::COMPLEX_SIZE,
                      "Complex entry size %u too small", entry.size);
    push_long(complex->header.parent, out);
    push_long(complex->entries.size(), out);
  } else {
    always_assert_log(entry.size >= ResTableEntry::SIMPLE_SIZE,
                      "Entry size %u too small", entry.size);
  }
  // Entries may declare a larger header than the fields known here.
  while (out->size() < entry_start + entry.size) {
    out->push_back(0);
  }
  if (complex != nullptr) {
    for (const auto& map : complex->entries) {
      push_long(map.name, out);
      write_value(map.value, out);
    }
  } else {
    write_value(*entry.simple(), out);
  }
}

void write_table_type(const TableTypeChunk& type, std::vector<char>* out) {
  always_assert_log(type.type_id != 0, "Type id of 0 is invalid");
  auto start = start_chunk(ChunkType::TableType, out);
  out->push_back((char)type.type_id);
  out->push_back(0); // flags, always written dense
  push_short(0, out);
  push_long(type.entries.size(), out);
  auto entries_start_pos = out->size();
  push_long(FILL_IN_LATER, out);
  write_config(type.config, out);
  end_header(start, out);

  std::vector<char> entry_data;
  for (const auto& entry : type.entries) {
    if (!entry) {
      push_long(NO_VALUE, out);
      continue;
    }
    push_long(entry_data.size(), out);
    write_entry(*entry, &entry_data);
  }
  write_long_at_pos(entries_start_pos, out->size() - start, out);
  out->insert(out->end(), entry_data.begin(), entry_data.end());
  end_chunk(start, out);
}

void write_package(const TablePackageChunk& package, std::vector<char>* out) {
  auto start = start_chunk(ChunkType::TablePackage, out);
  const auto& header = package.header;
  push_long(header.id, out);
  auto name = utf8_to_utf16(header.name);
  always_assert_log(name.size() < PACKAGE_NAME_ARR_LENGTH,
                    "Package name %s is too long", header.name.c_str());
  for (uint32_t i = 0; i < PACKAGE_NAME_ARR_LENGTH; i++) {
    push_short(i < name.size() ? name[i] : 0, out);
  }
  auto type_strings_pos = out->size();
  push_long(0, out);
  push_long(header.last_public_type, out);
  auto key_strings_pos = out->size();
  push_long(0, out);
  push_long(header.last_public_key, out);
  push_long(header.type_id_offset, out);
  end_header(start, out);

  // The first two children are the type and key name pools.
  for (size_t i = 0; i < package.children.size(); i++) {
    const auto& child = package.children[i];
    if (i < 2 && child.is<StringPoolChunk>()) {
      write_long_at_pos(i == 0 ? type_strings_pos : key_strings_pos,
                        out->size() - start, out);
    }
    write_chunk(child, out);
  }
  end_chunk(start, out);
}

void write_start_element(const XmlStartElementChunk& chunk,
                         std::vector<char>* out) {
  const auto& element = chunk.element;
  always_assert_log(
      element.attribute_start >= ResXmlStartElement::DEFAULT_ATTRIBUTE_START &&
          element.attribute_size >= ResXmlStartElement::DEFAULT_ATTRIBUTE_SIZE,
      "Attribute layout %u/%u is too small", element.attribute_start,
      element.attribute_size);
  always_assert_log(chunk.attributes.size() <= 0xffff, "Too many attributes");
  always_assert_log(element.attribute_count == chunk.attributes.size(),
                    "Element declares %u attributes but has %zu",
                    element.attribute_count, chunk.attributes.size());
  auto start = start_chunk(ChunkType::XmlStartElement, out);
  write_node_header(chunk.node, out);
  end_header(start, out);
  auto ext_start = out->size();
  push_long(element.ns, out);
  push_long(element.name, out);
  push_short(element.attribute_start, out);
  push_short(element.attribute_size, out);
  push_short((uint16_t)chunk.attributes.size(), out);
  push_short(element.id_index, out);
  push_short(element.class_index, out);
  push_short(element.style_index, out);
  for (size_t i = 0; i < chunk.attributes.size(); i++) {
    auto attr_start =
        ext_start + element.attribute_start + i * element.attribute_size;
    while (out->size() < attr_start) {
      out->push_back(0);
    }
    const auto& attr = chunk.attributes[i];
    push_long(attr.ns, out);
    push_long(attr.name, out);
    push_long(attr.raw_value, out);
    write_value(attr.typed_value, out);
  }
  if (!chunk.attributes.empty()) {
    auto attrs_end = ext_start + element.attribute_start +
                     chunk.attributes.size() * element.attribute_size;
    while (out->size() < attrs_end) {
      out->push_back(0);
    }
  }
  end_chunk(start, out);
}

} // namespace

void write_chunk(const Chunk& chunk, std::vector<char>* out) {
  auto type = chunk.type();
  TRACE(ARSC, 5, "Writing %s chunk at %zu", chunk_type_name(type),
        out->size());
  if (auto pool = chunk.get_if<StringPoolChunk>()) {
    write_string_pool(*pool, out);
  } else if (auto table = chunk.get_if<TableChunk>()) {
    auto start = start_chunk(type, out);
    push_long(table->header.package_count, out);
    end_header(start, out);
    write_children(table->children, out);
    end_chunk(start, out);
  } else if (auto xml = chunk.get_if<XmlChunk>()) {
    auto start = start_chunk(type, out);
    end_header(start, out);
    write_children(xml->children, out);
    end_chunk(start, out);
  } else if (auto ns = chunk.get_if<XmlStartNamespaceChunk>()) {
    auto start = start_chunk(type, out);
    write_node_header(ns->node, out);
    end_header(start, out);
    push_long(ns->ns.prefix, out);
    push_long(ns->ns.uri, out);
    end_chunk(start, out);
  } else if (auto end_ns = chunk.get_if<XmlEndNamespaceChunk>()) {
    auto start = start_chunk(type, out);
    write_node_header(end_ns->node, out);
    end_header(start, out);
    push_long(end_ns->ns.prefix, out);
    push_long(end_ns->ns.uri, out);
    end_chunk(start, out);
  } else if (auto element = chunk.get_if<XmlStartElementChunk>()) {
    write_start_element(*element, out);
  } else if (auto end = chunk.get_if<XmlEndElementChunk>()) {
    auto start = start_chunk(type, out);
    write_node_header(end->node, out);
    end_header(start, out);
    push_long(end->element.ns, out);
    push_long(end->element.name, out);
    end_chunk(start, out);
  } else if (auto map = chunk.get_if<XmlResourceMapChunk>()) {
    auto start = start_chunk(type, out);
    end_header(start, out);
    for (uint32_t id : map->ids) {
      push_long(id, out);
    }
    end_chunk(start, out);
  } else if (auto package = chunk.get_if<TablePackageChunk>()) {
    write_package(*package, out);
  } else if (auto table_type = chunk.get_if<TableTypeChunk>()) {
    write_table_type(*table_type, out);
  } else if (auto spec = chunk.get_if<TableTypeSpecChunk>()) {
    always_assert_log(spec->type_id != 0, "Type id of 0 is invalid");
    auto start = start_chunk(type, out);
    out->push_back((char)spec->type_id);
    out->push_back(0);
    push_short(0, out);
    push_long(spec->flags.size(), out);
    end_header(start, out);
    for (uint32_t flags : spec->flags) {
      push_long(flags, out);
    }
    end_chunk(start, out);
  } else {
    // Null and Unknown carry no body.
    auto start = start_chunk(type, out);
    end_header(start, out);
    end_chunk(start, out);
  }
}

std::vector<char> write_chunk(const Chunk& chunk) {
  std::vector<char> out;
  write_chunk(chunk, &out);
  return out;
}

void write_bytes_to_file(const std::vector<char>& data,
                         const std::string& filename) {
  std::ofstream ofs(filename,
                    std::ofstream::out | std::ofstream::trunc |
                        std::ofstream::binary);
  ofs.write(data.data(), data.size());
  ofs.close();
  always_assert_log(!ofs.fail(), "Unable to write to %s", filename.c_str());
}

} // namespace arsc
