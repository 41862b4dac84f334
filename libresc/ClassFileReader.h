/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <boost/optional.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace zip {
class ZipReader;
} // namespace zip

namespace jar {

/*
 * Returns the compile time constant of the `static final int` field
 * `field_name` declared in the given class file, or none if the class has no
 * such field. Malformed class files throw.
 */
boost::optional<int32_t> find_static_int_field(const uint8_t* buffer,
                                               size_t size,
                                               const std::string& field_name);

// Same as above, reading `<class_name>.class` (e.g. "android/R$attr") out of a
// jar. A missing class yields none.
boost::optional<int32_t> find_static_int_field(const zip::ZipReader& jar,
                                               const std::string& class_name,
                                               const std::string& field_name);

} // namespace jar
