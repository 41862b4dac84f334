/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#ifndef _RESC_ARSC_CHUNK_H
#define _RESC_ARSC_CHUNK_H

#include <boost/optional.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "utils/ResTypes.h"

namespace arsc {

struct Chunk;

struct NullChunk {};

struct StringPoolChunk {
  std::vector<std::string> strings;
  // One span list per styled string, parallel to the first strings.
  std::vector<std::vector<ResSpan>> styles;
};

struct TableChunk {
  ResTableHeader header;
  // The global string pool followed by the packages.
  std::vector<Chunk> children;
};

struct XmlChunk {
  std::vector<Chunk> children;
};

struct XmlStartNamespaceChunk {
  ResXmlNodeHeader node;
  ResXmlNamespace ns;
};

struct XmlEndNamespaceChunk {
  ResXmlNodeHeader node;
  ResXmlNamespace ns;
};

struct XmlStartElementChunk {
  ResXmlNodeHeader node;
  ResXmlStartElement element;
  std::vector<ResXmlAttribute> attributes;
};

struct XmlEndElementChunk {
  ResXmlNodeHeader node;
  ResXmlEndElement element;
};

struct XmlResourceMapChunk {
  // Resource id of the string with the same index in the document's pool.
  std::vector<uint32_t> ids;
};

struct TablePackageChunk {
  ResTablePackageHeader header;
  // The type name pool, the key name pool, then type specs and types.
  std::vector<Chunk> children;
};

struct TableTypeChunk {
  uint8_t type_id{0};
  ResTableConfig config;
  // Indexed by entry id; none if the entry has no value in this config.
  std::vector<boost::optional<ResTableEntry>> entries;
};

struct TableTypeSpecChunk {
  uint8_t type_id{0};
  // Per entry mask of the configuration qualifiers its values vary over.
  std::vector<uint32_t> flags;
};

// A chunk type this codec recognizes but does not interpret. Its body is
// skipped when reading.
struct UnknownChunk {};

/*
 * One node of the chunk tree that makes up a binary xml document or a
 * resource table. Consumers dispatch on the alternative held by `value`.
 */
struct Chunk {
  using Value = std::variant<NullChunk,
                             StringPoolChunk,
                             TableChunk,
                             XmlChunk,
                             XmlStartNamespaceChunk,
                             XmlEndNamespaceChunk,
                             XmlStartElementChunk,
                             XmlEndElementChunk,
                             XmlResourceMapChunk,
                             TablePackageChunk,
                             TableTypeChunk,
                             TableTypeSpecChunk,
                             UnknownChunk>;

  Value value;

  Chunk() = default;
  template <typename T,
            typename = std::enable_if_t<
                !std::is_same<std::decay_t<T>, Chunk>::value &&
                std::is_constructible<Value, T&&>::value>>
  Chunk(T&& t) : value(std::forward<T>(t)) {} // NOLINT

  ChunkType type() const;

  template <typename T>
  bool is() const {
    return std::holds_alternative<T>(value);
  }

  template <typename T>
  const T* get_if() const {
    return std::get_if<T>(&value);
  }

  template <typename T>
  T* get_if() {
    return std::get_if<T>(&value);
  }
};

bool operator==(const NullChunk&, const NullChunk&);
bool operator==(const StringPoolChunk& a, const StringPoolChunk& b);
bool operator==(const TableChunk& a, const TableChunk& b);
bool operator==(const XmlChunk& a, const XmlChunk& b);
bool operator==(const XmlStartNamespaceChunk& a,
                const XmlStartNamespaceChunk& b);
bool operator==(const XmlEndNamespaceChunk& a, const XmlEndNamespaceChunk& b);
bool operator==(const XmlStartElementChunk& a, const XmlStartElementChunk& b);
bool operator==(const XmlEndElementChunk& a, const XmlEndElementChunk& b);
bool operator==(const XmlResourceMapChunk& a, const XmlResourceMapChunk& b);
bool operator==(const TablePackageChunk& a, const TablePackageChunk& b);
bool operator==(const TableTypeChunk& a, const TableTypeChunk& b);
bool operator==(const TableTypeSpecChunk& a, const TableTypeSpecChunk& b);
bool operator==(const UnknownChunk&, const UnknownChunk&);
// Semantic equality: padding and layout offsets are not compared.
bool operator==(const Chunk& a, const Chunk& b);
bool operator!=(const Chunk& a, const Chunk& b);

/*
 * Parses the chunk starting at the beginning of `data`, including all of its
 * children. Throws a RescException (MALFORMED_CHUNK, BUFFER_END_EXCEEDED) if
 * the data is not a well formed chunk.
 */
Chunk parse_chunk(const void* data, size_t size);
Chunk parse_chunk(const std::vector<char>& data);
Chunk parse_chunk_file(const std::string& path);

// Reads the AAPT style variable width string length prefixes.
size_t decode_u8_length(const uint8_t*& data, const uint8_t* end);
size_t decode_u16_length(const uint8_t*& data, const uint8_t* end);

} // namespace arsc

#endif
