/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Mipmap.h"

#include "Trace.h"

namespace bxml {

const MipmapDensity MIPMAP_DENSITIES[5] = {
    {"mdpi", arsc::ResTableConfig::DENSITY_MEDIUM},
    {"hdpi", arsc::ResTableConfig::DENSITY_HIGH},
    {"xhdpi", arsc::ResTableConfig::DENSITY_XHIGH},
    {"xxhdpi", arsc::ResTableConfig::DENSITY_XXHIGH},
    {"xxxhdpi", arsc::ResTableConfig::DENSITY_XXXHIGH},
};

namespace {

// Type spec flag: the values of the entry differ by density.
constexpr uint32_t SPEC_DENSITY = 0x0100;
constexpr uint8_t MIPMAP_TYPE_ID = 1;

} // namespace

MipmapTable compile_mipmap(const std::string& package_name,
                           const std::string& name) {
  arsc::StringPoolChunk global_strings;
  for (const auto& density : MIPMAP_DENSITIES) {
    global_strings.strings.push_back(std::string("res/mipmap-") +
                                     density.bucket + "/" + name + ".png");
  }

  arsc::TablePackageChunk package;
  package.header.id = arsc::APP_PACKAGE_ID;
  package.header.name = package_name;
  arsc::StringPoolChunk types;
  types.strings.push_back("mipmap");
  arsc::StringPoolChunk keys;
  keys.strings.push_back(name);
  package.children.emplace_back(std::move(types));
  package.children.emplace_back(std::move(keys));

  arsc::TableTypeSpecChunk spec;
  spec.type_id = MIPMAP_TYPE_ID;
  spec.flags.push_back(SPEC_DENSITY);
  package.children.emplace_back(std::move(spec));

  for (size_t i = 0; i < 5; i++) {
    arsc::TableTypeChunk type;
    type.type_id = MIPMAP_TYPE_ID;
    type.config =
        arsc::ResTableConfig::with_density(MIPMAP_DENSITIES[i].density);
    type.entries.emplace_back(arsc::ResTableEntry::make_simple(
        0, arsc::ResValue(arsc::ResValueType::String, i)));
    package.children.emplace_back(std::move(type));
  }

  arsc::TableChunk table;
  table.header.package_count = 1;
  table.children.emplace_back(std::move(global_strings));
  table.children.emplace_back(std::move(package));

  MipmapTable result;
  result.table = std::move(table);
  result.id = arsc::ResTableRef(arsc::APP_PACKAGE_ID, MIPMAP_TYPE_ID, 0);
  TRACE(BXML, 2, "mipmap/%s of %s is 0x%08x", name.c_str(),
        package_name.c_str(), result.id.value());
  return result;
}

} // namespace bxml
