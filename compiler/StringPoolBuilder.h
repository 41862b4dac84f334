/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "Attributes.h"
#include "utils/Chunk.h"

namespace bxml {

/*
 * Collects the strings of a binary xml document. Attribute names that are
 * framework resources come first, ordered by resource id, so that the
 * resource map can describe them by position. All other strings follow in
 * sorted order.
 */
class StringPoolBuilder {
 public:
  // Registers the name (and, for string typed attributes, the value).
  void add_attribute(const XmlAttr& attr);
  void add_string(const std::string& s);

  // Freezes the pool. id() is only valid after this.
  void build();

  const std::vector<std::string>& strings() const { return m_strings; }
  const std::vector<uint32_t>& resource_map() const { return m_resource_map; }

  arsc::StringPoolChunk pool_chunk() const;
  arsc::XmlResourceMapChunk resource_map_chunk() const;

  // Index of a registered string.
  int32_t id(const std::string& s) const;

 private:
  std::map<uint32_t, std::string> m_attributes;
  std::set<std::string> m_strings_set;

  bool m_built{false};
  std::vector<std::string> m_strings;
  std::vector<uint32_t> m_resource_map;
};

} // namespace bxml
