/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "utils/Table.h"

#include <algorithm>

#include "Debug.h"
#include "Trace.h"
#include "ZipReader.h"

namespace arsc {

namespace {

const std::vector<std::string>& package_pool(const TablePackageChunk& package,
                                             size_t index,
                                             const char* what) {
  const StringPoolChunk* pool = nullptr;
  if (package.children.size() > index) {
    pool = package.children[index].get_if<StringPoolChunk>();
  }
  always_assert_type_log(pool != nullptr, MALFORMED_CHUNK,
                         "Package %s has no %s string pool",
                         package.header.name.c_str(), what);
  return pool->strings;
}

// First TableType of the package carrying the given type id.
const TableTypeChunk* find_type(const TablePackageChunk& package,
                                uint8_t type_id) {
  for (const auto& chunk : package.children) {
    auto type = chunk.get_if<TableTypeChunk>();
    if (type != nullptr && type->type_id == type_id) {
      return type;
    }
  }
  return nullptr;
}

Entry lookup_entry(uint8_t package_id,
                   const TableTypeChunk& type,
                   uint16_t entry_id) {
  always_assert_type_log(entry_id < type.entries.size() &&
                             type.entries[entry_id],
                         RESOURCE_NOT_FOUND, "failed to lookup entry %u",
                         entry_id);
  return Entry(ResTableRef(package_id, type.type_id, entry_id),
               &*type.entries[entry_id]);
}

} // namespace

Ref Ref::attr(const std::string& name) {
  return Ref{std::string("android"), "attr", name};
}

Ref Ref::id(const std::string& name) {
  return Ref{std::string("android"), "id", name};
}

Ref Ref::parse(const std::string& s) {
  always_assert_type_log(!s.empty() && s[0] == '@', MALFORMED_ATTRIBUTE_VALUE,
                         "invalid reference %s: expected `@`", s.c_str());
  auto slash = s.find('/');
  always_assert_type_log(slash != std::string::npos, MALFORMED_ATTRIBUTE_VALUE,
                         "invalid reference %s: expected `/`", s.c_str());
  Ref ref;
  auto descr = s.substr(1, slash - 1);
  auto colon = descr.find(':');
  if (colon != std::string::npos) {
    ref.package = descr.substr(0, colon);
    ref.type = descr.substr(colon + 1);
  } else {
    ref.type = descr;
  }
  ref.name = s.substr(slash + 1);
  return ref;
}

std::string Ref::str() const {
  std::string s = "@";
  if (package) {
    s += *package + ":";
  }
  return s + type + "/" + name;
}

boost::optional<ResAttributeType> Entry::attribute_type() const {
  auto complex = m_entry->complex();
  if (complex == nullptr) {
    return boost::none;
  }
  always_assert_type_log(!complex->entries.empty(), INTERNAL_ERROR,
                         "Attribute 0x%08x has no format", m_id.value());
  auto data = complex->entries[0].value.data;
  // Android does not encode every combined format as a plain bitmask.
  if (data == 0b110) {
    return ResAttributeType::Integer;
  }
  if (data == 0b11 || data == 0b111110) {
    return ResAttributeType::String;
  }
  auto type = attribute_type_from_u32(data);
  always_assert_type_log(type, INTERNAL_ERROR,
                         "Unrecognized attribute format 0x%x of 0x%08x", data,
                         m_id.value());
  return type;
}

boost::optional<ResValue> Entry::lookup_value(ResTableRef id) const {
  auto complex = m_entry->complex();
  if (complex == nullptr) {
    return boost::none;
  }
  for (size_t i = 1; i < complex->entries.size(); i++) {
    if (complex->entries[i].name == id.value()) {
      return complex->entries[i].value;
    }
  }
  return boost::none;
}

void Table::import_apk(const std::string& path) {
  TRACE(TABLE, 1, "Parse resources.arsc chunk from %s", path.c_str());
  auto resources = zip::extract_zip_file(path, "resources.arsc");
  import_chunk(parse_chunk(resources));
}

void Table::import_chunk(const Chunk& chunk) {
  auto table = chunk.get_if<TableChunk>();
  if (table == nullptr) {
    TRACE(TABLE, 1, "Ignoring %s chunk, not a table",
          chunk_type_name(chunk.type()));
    return;
  }
  for (const auto& child : table->children) {
    if (auto package = child.get_if<TablePackageChunk>()) {
      TRACE(TABLE, 2, "Imported package 0x%x %s", package->header.id,
            package->header.name.c_str());
      m_packages.push_back(*package);
    }
  }
}

uint8_t Table::lookup_package_id(
    const boost::optional<std::string>& name) const {
  if (!name) {
    return APP_PACKAGE_ID;
  }
  for (const auto& package : m_packages) {
    if (package.header.name == *name) {
      return (uint8_t)package.header.id;
    }
  }
  resc_fail(RESOURCE_NOT_FOUND, "failed to locate package %s", name->c_str());
}

const TablePackageChunk& Table::lookup_package(uint8_t id) const {
  for (const auto& package : m_packages) {
    if (package.header.id == id) {
      return package;
    }
  }
  resc_fail(RESOURCE_NOT_FOUND, "failed to locate package %u", id);
}

Entry Table::entry_by_ref(const Ref& ref) const {
  TRACE(TABLE, 3, "Looking up %s", ref.str().c_str());
  auto package_id = lookup_package_id(ref.package);
  const auto& package = lookup_package(package_id);

  const auto& types = package_pool(package, 0, "type");
  auto type_it = std::find(types.begin(), types.end(), ref.type);
  always_assert_type_log(type_it != types.end(), RESOURCE_NOT_FOUND,
                         "failed to locate type id %s", ref.type.c_str());
  auto type_index = type_it - types.begin();
  always_assert_type_log(type_index < 0xff, RESOURCE_NOT_FOUND,
                         "failed to locate type id %s", ref.type.c_str());
  uint8_t type_id = type_index + 1;
  auto type = find_type(package, type_id);
  always_assert_type_log(type != nullptr, RESOURCE_NOT_FOUND,
                         "failed to locate type %u", type_id);

  const auto& keys = package_pool(package, 1, "key");
  auto key_it = std::find(keys.begin(), keys.end(), ref.name);
  always_assert_type_log(key_it != keys.end(), RESOURCE_NOT_FOUND,
                         "failed to locate key id %s", ref.name.c_str());
  uint32_t key = key_it - keys.begin();

  for (size_t i = 0; i < type->entries.size(); i++) {
    const auto& entry = type->entries[i];
    if (entry && entry->key == key) {
      auto result = lookup_entry(package_id, *type, (uint16_t)i);
      TRACE(TABLE, 3, "%s is 0x%08x", ref.str().c_str(), result.id().value());
      return result;
    }
  }
  resc_fail(RESOURCE_NOT_FOUND, "failed to lookup entry id %u", key);
}

Entry Table::entry_by_id(ResTableRef id) const {
  const auto& package = lookup_package(id.package());
  auto type = find_type(package, id.type());
  always_assert_type_log(type != nullptr, RESOURCE_NOT_FOUND,
                         "failed to locate type %u", id.type());
  return lookup_entry(id.package(), *type, id.entry());
}

} // namespace arsc
