/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "utils/ResTypes.h"

#include <utility>

namespace arsc {

boost::optional<ChunkType> chunk_type_from_u16(uint16_t type) {
  switch (static_cast<ChunkType>(type)) {
  case ChunkType::Null:
  case ChunkType::StringPool:
  case ChunkType::Table:
  case ChunkType::Xml:
  case ChunkType::XmlStartNamespace:
  case ChunkType::XmlEndNamespace:
  case ChunkType::XmlStartElement:
  case ChunkType::XmlEndElement:
  case ChunkType::XmlResourceMap:
  case ChunkType::TablePackage:
  case ChunkType::TableType:
  case ChunkType::TableTypeSpec:
  case ChunkType::Unknown:
    return static_cast<ChunkType>(type);
  }
  return boost::none;
}

const char* chunk_type_name(ChunkType type) {
  switch (type) {
  case ChunkType::Null:
    return "NULL";
  case ChunkType::StringPool:
    return "STRING_POOL";
  case ChunkType::Table:
    return "TABLE";
  case ChunkType::Xml:
    return "XML";
  case ChunkType::XmlStartNamespace:
    return "XML_START_NAMESPACE";
  case ChunkType::XmlEndNamespace:
    return "XML_END_NAMESPACE";
  case ChunkType::XmlStartElement:
    return "XML_START_ELEMENT";
  case ChunkType::XmlEndElement:
    return "XML_END_ELEMENT";
  case ChunkType::XmlResourceMap:
    return "XML_RESOURCE_MAP";
  case ChunkType::TablePackage:
    return "TABLE_PACKAGE";
  case ChunkType::TableType:
    return "TABLE_TYPE";
  case ChunkType::TableTypeSpec:
    return "TABLE_TYPE_SPEC";
  case ChunkType::Unknown:
    return "UNKNOWN";
  }
  return "?";
}

boost::optional<ResValueType> value_type_from_u8(uint8_t type) {
  switch (static_cast<ResValueType>(type)) {
  case ResValueType::Null:
  case ResValueType::Reference:
  case ResValueType::Attribute:
  case ResValueType::String:
  case ResValueType::Float:
  case ResValueType::Dimension:
  case ResValueType::Fraction:
  case ResValueType::IntDec:
  case ResValueType::IntHex:
  case ResValueType::IntBoolean:
  case ResValueType::IntColorArgb8:
  case ResValueType::IntColorRgb8:
  case ResValueType::IntColorArgb4:
  case ResValueType::IntColorRgb4:
    return static_cast<ResValueType>(type);
  }
  return boost::none;
}

const char* value_type_name(uint8_t type) {
  auto value_type = value_type_from_u8(type);
  if (!value_type) {
    return "?";
  }
  switch (*value_type) {
  case ResValueType::Null:
    return "null";
  case ResValueType::Reference:
    return "reference";
  case ResValueType::Attribute:
    return "attribute";
  case ResValueType::String:
    return "string";
  case ResValueType::Float:
    return "float";
  case ResValueType::Dimension:
    return "dimension";
  case ResValueType::Fraction:
    return "fraction";
  case ResValueType::IntDec:
    return "int_dec";
  case ResValueType::IntHex:
    return "int_hex";
  case ResValueType::IntBoolean:
    return "int_boolean";
  case ResValueType::IntColorArgb8:
    return "color_argb8";
  case ResValueType::IntColorRgb8:
    return "color_rgb8";
  case ResValueType::IntColorArgb4:
    return "color_argb4";
  case ResValueType::IntColorRgb4:
    return "color_rgb4";
  }
  return "?";
}

boost::optional<ResAttributeType> attribute_type_from_u32(uint32_t type) {
  switch (static_cast<ResAttributeType>(type)) {
  case ResAttributeType::Any:
  case ResAttributeType::Reference:
  case ResAttributeType::String:
  case ResAttributeType::Integer:
  case ResAttributeType::Boolean:
  case ResAttributeType::Color:
  case ResAttributeType::Float:
  case ResAttributeType::Dimension:
  case ResAttributeType::Fraction:
  case ResAttributeType::Enum:
  case ResAttributeType::Flags:
    return static_cast<ResAttributeType>(type);
  }
  return boost::none;
}

ResTableConfig ResTableConfig::with_density(uint16_t density) {
  ResTableConfig config;
  config.screen_type.density = density;
  return config;
}

ResTableEntry ResTableEntry::make_simple(uint32_t key, const ResValue& value) {
  ResTableEntry entry;
  entry.size = SIMPLE_SIZE;
  entry.key = key;
  entry.value = value;
  return entry;
}

ResTableEntry ResTableEntry::make_complex(uint32_t key,
                                          uint32_t parent,
                                          std::vector<ResTableMap> entries) {
  ResTableEntry entry;
  entry.size = COMPLEX_SIZE;
  entry.flags = FLAG_COMPLEX;
  entry.key = key;
  ResTableComplexValue complex;
  complex.header.parent = parent;
  complex.header.count = entries.size();
  complex.entries = std::move(entries);
  entry.value = std::move(complex);
  return entry;
}

bool operator==(const ResSpan& a, const ResSpan& b) {
  return a.name == b.name && a.first_char == b.first_char &&
         a.last_char == b.last_char;
}

bool operator==(const ResValue& a, const ResValue& b) {
  return a.size == b.size && a.res0 == b.res0 && a.data_type == b.data_type &&
         a.data == b.data;
}

bool operator==(const ResTableHeader& a, const ResTableHeader& b) {
  return a.package_count == b.package_count;
}

bool operator==(const ResXmlNodeHeader& a, const ResXmlNodeHeader& b) {
  return a.line_number == b.line_number && a.comment == b.comment;
}

bool operator==(const ResXmlNamespace& a, const ResXmlNamespace& b) {
  return a.prefix == b.prefix && a.uri == b.uri;
}

bool operator==(const ResXmlStartElement& a, const ResXmlStartElement& b) {
  return a.ns == b.ns && a.name == b.name &&
         a.attribute_start == b.attribute_start &&
         a.attribute_size == b.attribute_size &&
         a.attribute_count == b.attribute_count && a.id_index == b.id_index &&
         a.class_index == b.class_index && a.style_index == b.style_index;
}

bool operator==(const ResXmlAttribute& a, const ResXmlAttribute& b) {
  return a.ns == b.ns && a.name == b.name && a.raw_value == b.raw_value &&
         a.typed_value == b.typed_value;
}

bool operator==(const ResXmlEndElement& a, const ResXmlEndElement& b) {
  return a.ns == b.ns && a.name == b.name;
}

bool operator==(const ResTablePackageHeader& a,
                const ResTablePackageHeader& b) {
  return a.id == b.id && a.name == b.name &&
         a.last_public_type == b.last_public_type &&
         a.last_public_key == b.last_public_key &&
         a.type_id_offset == b.type_id_offset;
}

bool operator==(const ScreenType& a, const ScreenType& b) {
  return a.orientation == b.orientation && a.touchscreen == b.touchscreen &&
         a.density == b.density;
}

bool operator==(const ResTableConfig& a, const ResTableConfig& b) {
  return a.size == b.size && a.imsi == b.imsi && a.locale == b.locale &&
         a.screen_type == b.screen_type && a.input == b.input &&
         a.screen_size == b.screen_size && a.version == b.version &&
         a.unknown == b.unknown;
}

bool operator==(const ResTableMapEntry& a, const ResTableMapEntry& b) {
  return a.parent == b.parent && a.count == b.count;
}

bool operator==(const ResTableMap& a, const ResTableMap& b) {
  return a.name == b.name && a.value == b.value;
}

bool operator==(const ResTableComplexValue& a, const ResTableComplexValue& b) {
  return a.header == b.header && a.entries == b.entries;
}

bool operator==(const ResTableEntry& a, const ResTableEntry& b) {
  return a.size == b.size && a.flags == b.flags && a.key == b.key &&
         a.value == b.value;
}

} // namespace arsc
