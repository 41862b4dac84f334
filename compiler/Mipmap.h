/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>

#include "utils/Chunk.h"
#include "utils/ResTypes.h"

namespace bxml {

struct MipmapTable {
  arsc::Chunk table;
  arsc::ResTableRef id;
};

// Density buckets of a launcher icon, mdpi through xxxhdpi.
struct MipmapDensity {
  const char* bucket;
  uint16_t density;
};
extern const MipmapDensity MIPMAP_DENSITIES[5];

/*
 * Builds a resource table for `package_name` holding the single resource
 * mipmap/<name>, with one value per density bucket pointing at
 * res/mipmap-<bucket>/<name>.png.
 */
MipmapTable compile_mipmap(const std::string& package_name,
                           const std::string& name);

} // namespace bxml
