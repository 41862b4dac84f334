/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#ifndef _RESC_ARSC_DUMP_H
#define _RESC_ARSC_DUMP_H

#include <ostream>
#include <string>

#include "utils/Chunk.h"
#include "utils/ResTypes.h"

namespace arsc {

/*
 * Human readable rendering of a chunk tree, one chunk per line, children
 * indented below their parent. String references are printed as indices.
 */
std::string show(const Chunk& chunk);
std::string show(const ResValue& value);
std::string show(const ResTableConfig& config);

std::ostream& operator<<(std::ostream& out, const Chunk& chunk);
std::ostream& operator<<(std::ostream& out, const ResValue& value);

} // namespace arsc

#endif
