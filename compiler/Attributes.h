/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/optional.hpp>
#include <cstdint>
#include <string>
#include <vector>

#include "utils/ResTypes.h"
#include "utils/Table.h"

namespace bxml {

constexpr const char* ANDROID_NS = "http://schemas.android.com/apk/res/android";

// The value types a manifest attribute can be compiled to.
enum class DataType : uint8_t {
  Reference = 0x01,
  String = 0x03,
  IntDec = 0x10,
  IntHex = 0x11,
  IntBoolean = 0x12,
};

struct AttributeInfo {
  const char* name;
  // Public framework resource id, none for attributes that are not
  // resources (e.g. the manifest's package).
  boost::optional<uint32_t> res_id;
  DataType type;
};

// Every attribute the compiler understands, in a fixed order.
const std::vector<AttributeInfo>& attributes();

// Null if the name is not in the dictionary.
const AttributeInfo* find_attribute(const std::string& name);

// Like find_attribute, throwing UNSUPPORTED_ATTRIBUTE if it is unknown.
const AttributeInfo& get_attribute(const std::string& name);

// An attribute as it appears in the textual document.
struct XmlAttr {
  // Namespace uri, empty if the attribute has none.
  std::string ns;
  std::string name;
  std::string value;
};

class StringPoolBuilder;

/*
 * Types the attribute value according to the dictionary. Symbolic enum and
 * flag values are resolved through the attr resources of `table`. Throws
 * UNSUPPORTED_ATTRIBUTE or MALFORMED_ATTRIBUTE_VALUE.
 */
arsc::ResXmlAttribute compile_attr(const arsc::Table& table,
                                   const StringPoolBuilder& strings,
                                   const XmlAttr& attr);

} // namespace bxml
