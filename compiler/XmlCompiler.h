/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/optional.hpp>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "Attributes.h"
#include "utils/Chunk.h"
#include "utils/Table.h"

namespace bxml {

// Element node of a parsed textual document. Text and comments are dropped.
struct XmlElement {
  // Namespace uri, empty if none.
  std::string ns;
  std::string name;
  uint32_t line_number{1};
  std::vector<XmlAttr> attributes;
  // (prefix, uri) pairs declared on this element; the default namespace has
  // an empty prefix.
  std::vector<std::pair<std::string, std::string>> namespaces;
  std::vector<std::unique_ptr<XmlElement>> children;
};

// Throws INVALID_XML with the parser's message and line.
std::unique_ptr<XmlElement> parse_xml(const std::string& xml);

/*
 * Compiles a textual document (usually AndroidManifest.xml) into its binary
 * form. `table` resolves references and symbolic attribute values.
 */
arsc::Chunk compile_xml(const std::string& xml, const arsc::Table& table);

struct CompiledManifest {
  arsc::Chunk manifest;
  // The resource table holding the launcher icon, if one was requested.
  boost::optional<arsc::Chunk> resources;
  boost::optional<arsc::ResTableRef> icon;
};

/*
 * Compiles the manifest and, given an icon package, the mipmap table for
 * its launcher icon. The mipmap table is visible to the manifest, so
 * android:icon="@mipmap/icon" resolves.
 */
CompiledManifest compile_manifest(
    const std::string& xml,
    const arsc::Table& table,
    const boost::optional<std::string>& icon_package);

} // namespace bxml
