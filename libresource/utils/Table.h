/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#ifndef _RESC_ARSC_TABLE_H
#define _RESC_ARSC_TABLE_H

#include <boost/optional.hpp>
#include <string>
#include <vector>

#include "utils/Chunk.h"
#include "utils/ResTypes.h"

namespace arsc {

// A resource named by package, type and entry name, like @android:attr/label.
struct Ref {
  // None means the application package.
  boost::optional<std::string> package;
  std::string type;
  std::string name;

  static Ref attr(const std::string& name);
  static Ref id(const std::string& name);
  // Parses "@[package:]type/name".
  static Ref parse(const std::string& s);

  std::string str() const;
};

// A resolved entry. Only valid as long as the Table it came from.
class Entry {
 public:
  Entry(ResTableRef id, const ResTableEntry* entry) : m_id(id), m_entry(entry) {}

  ResTableRef id() const { return m_id; }
  const ResTableEntry& entry() const { return *m_entry; }

  /*
   * The format of an attr resource, decoded from the first value of its map.
   * None for entries that are not maps.
   */
  boost::optional<ResAttributeType> attribute_type() const;

  // Value of the map item named by `id`, skipping the format item.
  boost::optional<ResValue> lookup_value(ResTableRef id) const;

 private:
  ResTableRef m_id;
  const ResTableEntry* m_entry;
};

/*
 * Name based lookups over the packages of one or more resource tables. Once
 * imported, the table is never mutated by lookups.
 */
class Table {
 public:
  // Imports the resources.arsc of an apk (or android.jar).
  void import_apk(const std::string& path);
  // Appends the packages of a Table chunk. Other chunks are ignored.
  void import_chunk(const Chunk& chunk);

  Entry entry_by_ref(const Ref& ref) const;
  Entry entry_by_id(ResTableRef id) const;

  const std::vector<TablePackageChunk>& packages() const { return m_packages; }

 private:
  uint8_t lookup_package_id(const boost::optional<std::string>& name) const;
  const TablePackageChunk& lookup_package(uint8_t id) const;

  std::vector<TablePackageChunk> m_packages;
};

} // namespace arsc

#endif
