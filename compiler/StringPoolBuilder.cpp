/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "StringPoolBuilder.h"

#include <algorithm>

#include "Debug.h"
#include "Trace.h"

namespace bxml {

void StringPoolBuilder::add_attribute(const XmlAttr& attr) {
  always_assert_log(!m_built, "String pool already built");
  const auto& info = get_attribute(attr.name);
  if (info.res_id) {
    m_attributes.emplace(*info.res_id, attr.name);
  } else {
    m_strings_set.insert(attr.name);
  }
  if (info.type == DataType::String) {
    m_strings_set.insert(attr.value);
  }
  if (!attr.ns.empty()) {
    m_strings_set.insert(attr.ns);
  }
}

void StringPoolBuilder::add_string(const std::string& s) {
  always_assert_log(!m_built, "String pool already built");
  m_strings_set.insert(s);
}

void StringPoolBuilder::build() {
  always_assert_log(!m_built, "String pool already built");
  m_strings.clear();
  m_resource_map.clear();
  for (const auto& [res_id, name] : m_attributes) {
    m_strings.push_back(name);
    m_resource_map.push_back(res_id);
  }
  for (const auto& s : m_strings_set) {
    if (m_attributes.empty() ||
        std::find(m_strings.begin(),
                  m_strings.begin() + m_attributes.size(),
                  s) == m_strings.begin() + m_attributes.size()) {
      m_strings.push_back(s);
    }
  }
  m_built = true;
  TRACE(BXML, 3, "String pool: %zu strings, %zu resource ids",
        m_strings.size(), m_resource_map.size());
}

arsc::StringPoolChunk StringPoolBuilder::pool_chunk() const {
  always_assert_log(m_built, "String pool not built");
  arsc::StringPoolChunk pool;
  pool.strings = m_strings;
  return pool;
}

arsc::XmlResourceMapChunk StringPoolBuilder::resource_map_chunk() const {
  always_assert_log(m_built, "String pool not built");
  arsc::XmlResourceMapChunk map;
  map.ids = m_resource_map;
  return map;
}

int32_t StringPoolBuilder::id(const std::string& s) const {
  always_assert_log(m_built, "String pool not built");
  auto it = std::find(m_strings.begin(), m_strings.end(), s);
  always_assert_type_log(it != m_strings.end(), INTERNAL_ERROR,
                         "String \"%s\" was never added to the pool",
                         s.c_str());
  return (int32_t)(it - m_strings.begin());
}

} // namespace bxml
