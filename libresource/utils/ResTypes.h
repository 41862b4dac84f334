/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#ifndef _RESC_ARSC_RES_TYPES_H
#define _RESC_ARSC_RES_TYPES_H

#include <boost/optional.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace arsc {

// Type tag of the common 8 byte chunk header.
enum class ChunkType : uint16_t {
  Null = 0x0000,
  StringPool = 0x0001,
  Table = 0x0002,
  Xml = 0x0003,
  XmlStartNamespace = 0x0100,
  XmlEndNamespace = 0x0101,
  XmlStartElement = 0x0102,
  XmlEndElement = 0x0103,
  XmlResourceMap = 0x0180,
  TablePackage = 0x0200,
  TableType = 0x0201,
  TableTypeSpec = 0x0202,
  Unknown = 0x0206,
};

boost::optional<ChunkType> chunk_type_from_u16(uint16_t type);
const char* chunk_type_name(ChunkType type);

constexpr size_t CHUNK_HEADER_SIZE = 8;

// Used for things like offsets to denote no value.
constexpr uint32_t NO_VALUE = 0xFFFFFFFF;
// String references use -1 for "no string".
constexpr int32_t NO_STRING = -1;

constexpr uint32_t PACKAGE_NAME_ARR_LENGTH = 128;
// Implicit id of the application package.
constexpr uint8_t APP_PACKAGE_ID = 0x7f;

struct ResChunkHeader {
  uint16_t type;
  uint16_t header_size;
  uint32_t size;
};

struct ResStringPoolHeader {
  static constexpr uint32_t SORTED_FLAG = 1 << 0;
  static constexpr uint32_t UTF8_FLAG = 1 << 8;

  uint32_t string_count{0};
  uint32_t style_count{0};
  uint32_t flags{0};
  uint32_t strings_start{0};
  uint32_t styles_start{0};

  bool is_utf8() const { return (flags & UTF8_FLAG) != 0; }
};

// A rich text span over characters [first_char, last_char] of a pool string,
// named by the string at index `name`.
struct ResSpan {
  static constexpr int32_t END = -1;

  int32_t name;
  uint32_t first_char;
  uint32_t last_char;
};

enum class ResValueType : uint8_t {
  Null = 0x00,
  Reference = 0x01,
  Attribute = 0x02,
  String = 0x03,
  Float = 0x04,
  Dimension = 0x05,
  Fraction = 0x06,
  IntDec = 0x10,
  IntHex = 0x11,
  IntBoolean = 0x12,
  IntColorArgb8 = 0x1c,
  IntColorRgb8 = 0x1d,
  IntColorArgb4 = 0x1e,
  IntColorRgb4 = 0x1f,
};

boost::optional<ResValueType> value_type_from_u8(uint8_t type);
const char* value_type_name(uint8_t type);

// The declared format of an `attr` resource.
enum class ResAttributeType : uint32_t {
  Any = 0x0000ffff,
  Reference = 1 << 0,
  String = 1 << 1,
  Integer = 1 << 2,
  Boolean = 1 << 3,
  Color = 1 << 4,
  Float = 1 << 5,
  Dimension = 1 << 6,
  Fraction = 1 << 7,
  Enum = 1 << 16,
  Flags = 1 << 17,
};

boost::optional<ResAttributeType> attribute_type_from_u32(uint32_t type);

struct ResValue {
  static constexpr uint16_t SIZE = 8;

  uint16_t size{SIZE};
  uint8_t res0{0};
  uint8_t data_type{0};
  uint32_t data{0};

  ResValue() = default;
  ResValue(ResValueType type, uint32_t data)
      : data_type(static_cast<uint8_t>(type)), data(data) {}
};

// Packed (package << 24 | type << 16 | entry) resource identifier. Type ids
// are 1-based.
class ResTableRef {
 public:
  ResTableRef() = default;
  explicit ResTableRef(uint32_t id) : m_id(id) {}
  ResTableRef(uint8_t package, uint8_t type, uint16_t entry)
      : m_id(((uint32_t)package << 24) | ((uint32_t)type << 16) | entry) {}

  uint8_t package() const { return m_id >> 24; }
  uint8_t type() const { return (m_id >> 16) & 0xff; }
  uint16_t entry() const { return m_id & 0xffff; }
  uint32_t value() const { return m_id; }

  bool operator==(const ResTableRef& other) const {
    return m_id == other.m_id;
  }
  bool operator!=(const ResTableRef& other) const { return !(*this == other); }

 private:
  uint32_t m_id{0};
};

struct ResTableHeader {
  uint32_t package_count{0};
};

struct ResXmlNodeHeader {
  uint32_t line_number{1};
  int32_t comment{NO_STRING};
};

struct ResXmlNamespace {
  int32_t prefix{NO_STRING};
  int32_t uri{NO_STRING};
};

struct ResXmlStartElement {
  static constexpr uint16_t DEFAULT_ATTRIBUTE_START = 0x14;
  static constexpr uint16_t DEFAULT_ATTRIBUTE_SIZE = 0x14;

  int32_t ns{NO_STRING};
  int32_t name{NO_STRING};
  uint16_t attribute_start{DEFAULT_ATTRIBUTE_START};
  uint16_t attribute_size{DEFAULT_ATTRIBUTE_SIZE};
  uint16_t attribute_count{0};
  // 1-based positions of the attributes named id, class and style; 0 if the
  // element has none.
  uint16_t id_index{0};
  uint16_t class_index{0};
  uint16_t style_index{0};
};

struct ResXmlAttribute {
  int32_t ns{NO_STRING};
  int32_t name{NO_STRING};
  int32_t raw_value{NO_STRING};
  ResValue typed_value;
};

struct ResXmlEndElement {
  int32_t ns{NO_STRING};
  int32_t name{NO_STRING};
};

struct ResTablePackageHeader {
  // Size of the header without the type_id_offset field, as written by older
  // tools.
  static constexpr uint16_t LEGACY_HEADER_SIZE = 284;

  uint32_t id{0};
  std::string name;
  // Offsets of the type and key string pools, relative to the package chunk.
  // Recomputed when writing.
  uint32_t type_strings{0};
  uint32_t last_public_type{0};
  uint32_t key_strings{0};
  uint32_t last_public_key{0};
  uint32_t type_id_offset{0};
};

struct ScreenType {
  uint8_t orientation{0};
  uint8_t touchscreen{0};
  uint16_t density{0};
};

/*
 * The configuration a TableType applies to. Only the leading fields are
 * interpreted; whatever a newer producer appended is kept in `unknown` and
 * written back verbatim.
 */
struct ResTableConfig {
  // size, imsi, locale, screen_type, input, screen_size, version.
  static constexpr uint32_t KNOWN_SIZE = 28;
  // sizeof(ResTable_config) as written by current aapt2.
  static constexpr uint32_t DEFAULT_SIZE = 64;

  static constexpr uint16_t DENSITY_MEDIUM = 160;
  static constexpr uint16_t DENSITY_HIGH = 240;
  static constexpr uint16_t DENSITY_XHIGH = 320;
  static constexpr uint16_t DENSITY_XXHIGH = 480;
  static constexpr uint16_t DENSITY_XXXHIGH = 640;

  uint32_t size{DEFAULT_SIZE};
  uint32_t imsi{0};
  uint32_t locale{0};
  ScreenType screen_type;
  uint32_t input{0};
  uint32_t screen_size{0};
  uint32_t version{0};
  std::vector<uint8_t> unknown =
      std::vector<uint8_t>(DEFAULT_SIZE - KNOWN_SIZE, 0);

  // The default configuration, with only the density qualifier set.
  static ResTableConfig with_density(uint16_t density);
};

struct ResTableMapEntry {
  // Resource id of the parent bag, or 0.
  uint32_t parent{0};
  uint32_t count{0};
};

struct ResTableMap {
  uint32_t name{0};
  ResValue value;
};

// Value of a complex (bag) entry.
struct ResTableComplexValue {
  ResTableMapEntry header;
  std::vector<ResTableMap> entries;
};

struct ResTableEntry {
  static constexpr uint16_t FLAG_COMPLEX = 0x1;
  static constexpr uint16_t FLAG_PUBLIC = 0x2;
  static constexpr uint16_t FLAG_WEAK = 0x4;

  static constexpr uint16_t SIMPLE_SIZE = 8;
  static constexpr uint16_t COMPLEX_SIZE = 16;

  uint16_t size{SIMPLE_SIZE};
  uint16_t flags{0};
  // Index into the package's key string pool.
  uint32_t key{0};
  std::variant<ResValue, ResTableComplexValue> value;

  bool is_complex() const { return (flags & FLAG_COMPLEX) != 0; }
  const ResValue* simple() const { return std::get_if<ResValue>(&value); }
  const ResTableComplexValue* complex() const {
    return std::get_if<ResTableComplexValue>(&value);
  }

  static ResTableEntry make_simple(uint32_t key, const ResValue& value);
  static ResTableEntry make_complex(uint32_t key,
                                    uint32_t parent,
                                    std::vector<ResTableMap> entries);
};

bool operator==(const ResSpan& a, const ResSpan& b);
bool operator==(const ResValue& a, const ResValue& b);
bool operator==(const ResTableHeader& a, const ResTableHeader& b);
bool operator==(const ResXmlNodeHeader& a, const ResXmlNodeHeader& b);
bool operator==(const ResXmlNamespace& a, const ResXmlNamespace& b);
bool operator==(const ResXmlStartElement& a, const ResXmlStartElement& b);
bool operator==(const ResXmlAttribute& a, const ResXmlAttribute& b);
bool operator==(const ResXmlEndElement& a, const ResXmlEndElement& b);
// Ignores the string pool offsets, which only describe the serialized layout.
bool operator==(const ResTablePackageHeader& a, const ResTablePackageHeader& b);
bool operator==(const ScreenType& a, const ScreenType& b);
bool operator==(const ResTableConfig& a, const ResTableConfig& b);
bool operator==(const ResTableMapEntry& a, const ResTableMapEntry& b);
bool operator==(const ResTableMap& a, const ResTableMap& b);
bool operator==(const ResTableComplexValue& a, const ResTableComplexValue& b);
bool operator==(const ResTableEntry& a, const ResTableEntry& b);

} // namespace arsc

#endif
