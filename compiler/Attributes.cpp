/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Attributes.h"

#include <boost/algorithm/string.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>

#include "Debug.h"
#include "StringPoolBuilder.h"
#include "Trace.h"

namespace bxml {

namespace {

AttributeInfo attr(const char* name, uint32_t res_id, DataType type) {
  return AttributeInfo{name, res_id, type};
}

AttributeInfo local_attr(const char* name, DataType type) {
  return AttributeInfo{name, boost::none, type};
}

const char* data_type_name(DataType type) {
  switch (type) {
  case DataType::Reference:
    return "a reference";
  case DataType::String:
    return "a string";
  case DataType::IntDec:
    return "a decimal integer";
  case DataType::IntHex:
    return "a 0x prefixed hexadecimal integer";
  case DataType::IntBoolean:
    return "true or false";
  }
  not_reached();
}

// Strict unsigned parse: digits only, whole string, fits in 32 bits.
boost::optional<uint32_t> parse_u32(const std::string& s, int base) {
  if (s.empty() || !isxdigit((unsigned char)s[0])) {
    return boost::none;
  }
  char* end = nullptr;
  errno = 0;
  unsigned long long v = strtoull(s.c_str(), &end, base);
  if (errno != 0 || *end != '\0' || v > 0xffffffffULL) {
    return boost::none;
  }
  return (uint32_t)v;
}

boost::optional<uint32_t> parse_literal(const AttributeInfo& info,
                                        const std::string& value) {
  switch (info.type) {
  case DataType::IntDec:
  case DataType::Reference:
    return parse_u32(value, 10);
  case DataType::IntHex:
    if (!boost::starts_with(value, "0x")) {
      return boost::none;
    }
    return parse_u32(value.substr(2), 16);
  case DataType::IntBoolean:
    if (value == "true") {
      return uint32_t(0xffffffff);
    }
    if (value == "false") {
      return uint32_t(0);
    }
    return boost::none;
  case DataType::String:
    break;
  }
  not_reached();
}

/*
 * Resolves symbolic values like "orientation|keyboardHidden" through the
 * enum or flag items of the framework attr resource. None if the table does
 * not declare the attribute that way or lacks one of the symbols.
 */
boost::optional<uint32_t> resolve_symbols(const arsc::Table& table,
                                          const AttributeInfo& info,
                                          const std::string& value) {
  try {
    auto entry = table.entry_by_ref(arsc::Ref::attr(info.name));
    auto type = entry.attribute_type();
    if (!type || (*type != arsc::ResAttributeType::Enum &&
                  *type != arsc::ResAttributeType::Flags)) {
      return boost::none;
    }
    std::vector<std::string> symbols;
    boost::split(symbols, value, boost::is_any_of("|"));
    uint32_t data = 0;
    for (auto& symbol : symbols) {
      boost::trim(symbol);
      auto id = table.entry_by_ref(arsc::Ref::id(symbol)).id();
      auto item = entry.lookup_value(id);
      if (!item) {
        TRACE(BXML, 2, "%s has no value %s", info.name, symbol.c_str());
        return boost::none;
      }
      data |= item->data;
    }
    return data;
  } catch (const RescException& e) {
    if (e.type != RescError::RESOURCE_NOT_FOUND) {
      throw;
    }
    TRACE(BXML, 2, "Cannot resolve %s=\"%s\": %s", info.name, value.c_str(),
          e.what());
    return boost::none;
  }
}

} // namespace

const std::vector<AttributeInfo>& attributes() {
  static const std::vector<AttributeInfo> ATTRIBUTES = {
      // The ids of compileSdkVersion and compileSdkVersionCodename are taken
      // from the android.jar of API level 31.
      attr("compileSdkVersion", 0x01010572, DataType::IntDec),
      attr("compileSdkVersionCodename", 0x01010573, DataType::String),
      attr("minSdkVersion", 0x0101020c, DataType::IntDec),
      attr("targetSdkVersion", 0x01010270, DataType::IntDec),
      attr("name", 0x01010003, DataType::String),
      attr("label", 0x01010001, DataType::String),
      attr("debuggable", 0x0101000f, DataType::IntBoolean),
      attr("appComponentFactory", 0x0101057a, DataType::String),
      attr("exported", 0x01010010, DataType::IntBoolean),
      attr("launchMode", 0x0101001d, DataType::IntDec),
      attr("configChanges", 0x0101001f, DataType::IntHex),
      attr("windowSoftInputMode", 0x0101022b, DataType::IntHex),
      attr("hardwareAccelerated", 0x010102d3, DataType::IntBoolean),
      attr("value", 0x01010024, DataType::IntDec),
      local_attr("package", DataType::String),
      local_attr("platformBuildVersionCode", DataType::IntDec),
      local_attr("platformBuildVersionName", DataType::IntDec),
      attr("theme", 0x01010000, DataType::Reference),
      attr("icon", 0x01010002, DataType::Reference),
      attr("permission", 0x01010006, DataType::String),
      attr("hasCode", 0x0101000c, DataType::IntBoolean),
      attr("enabled", 0x0101000e, DataType::IntBoolean),
      attr("process", 0x01010011, DataType::String),
      attr("taskAffinity", 0x01010012, DataType::String),
      attr("screenOrientation", 0x0101001e, DataType::IntDec),
      attr("resource", 0x01010025, DataType::Reference),
      attr("mimeType", 0x01010026, DataType::String),
      attr("scheme", 0x01010027, DataType::String),
      attr("host", 0x01010028, DataType::String),
      attr("versionCode", 0x0101021b, DataType::IntDec),
      attr("versionName", 0x0101021c, DataType::String),
      attr("maxSdkVersion", 0x01010271, DataType::IntDec),
      attr("allowBackup", 0x01010280, DataType::IntBoolean),
      attr("glEsVersion", 0x01010281, DataType::IntHex),
      attr("required", 0x0101028e, DataType::IntBoolean),
      attr("installLocation", 0x010102b7, DataType::IntDec),
      attr("largeHeap", 0x0101035a, DataType::IntBoolean),
      attr("supportsRtl", 0x010103af, DataType::IntBoolean),
      attr("extractNativeLibs", 0x010104ea, DataType::IntBoolean),
      attr("roundIcon", 0x0101052c, DataType::Reference),
  };
  return ATTRIBUTES;
}

const AttributeInfo* find_attribute(const std::string& name) {
  for (const auto& info : attributes()) {
    if (name == info.name) {
      return &info;
    }
  }
  return nullptr;
}

const AttributeInfo& get_attribute(const std::string& name) {
  auto info = find_attribute(name);
  always_assert_type_log(info != nullptr, UNSUPPORTED_ATTRIBUTE,
                         "unsupported attribute %s", name.c_str());
  return *info;
}

arsc::ResXmlAttribute compile_attr(const arsc::Table& table,
                                   const StringPoolBuilder& strings,
                                   const XmlAttr& attr) {
  const auto& info = get_attribute(attr.name);
  uint32_t data;
  if (info.type == DataType::String) {
    data = strings.id(attr.value);
  } else if (info.type == DataType::Reference &&
             boost::starts_with(attr.value, "@")) {
    data = table.entry_by_ref(arsc::Ref::parse(attr.value)).id().value();
  } else {
    auto literal = parse_literal(info, attr.value);
    if (!literal && info.type != DataType::IntBoolean) {
      literal = resolve_symbols(table, info, attr.value);
    }
    always_assert_type_log(literal, MALFORMED_ATTRIBUTE_VALUE,
                           "invalid value \"%s\" for attribute %s: expected %s",
                           attr.value.c_str(), attr.name.c_str(),
                           data_type_name(info.type));
    data = *literal;
  }
  TRACE(BXML, 4, "%s=\"%s\" -> 0x%x", attr.name.c_str(), attr.value.c_str(),
        data);

  arsc::ResXmlAttribute result;
  result.ns = attr.ns.empty() ? arsc::NO_STRING : strings.id(attr.ns);
  result.name = strings.id(attr.name);
  result.raw_value = info.type == DataType::String ? strings.id(attr.value)
                                                   : arsc::NO_STRING;
  result.typed_value =
      arsc::ResValue(static_cast<arsc::ResValueType>(info.type), data);
  return result;
}

} // namespace bxml
