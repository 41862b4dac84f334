/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "utils/Chunk.h"
#include "utils/ResTypes.h"

// Data that is used to write many test cases against. Meant to be included from
// individual test cpp files that want to code against it.

// Key strings of the sample "android" package, in pool order.
enum SampleKey : uint32_t {
  KEY_LAUNCH_MODE = 0,
  KEY_CONFIG_CHANGES,
  KEY_LABEL,
  KEY_CODENAME,
  KEY_STANDARD,
  KEY_SINGLE_TOP,
  KEY_ORIENTATION,
  KEY_KEYBOARD_HIDDEN,
  KEY_THEME,
};

// Ids the sample package assigns.
constexpr uint32_t SAMPLE_ATTR_LAUNCH_MODE = 0x01010000;
constexpr uint32_t SAMPLE_ATTR_CONFIG_CHANGES = 0x01010001;
constexpr uint32_t SAMPLE_ATTR_LABEL = 0x01010002;
constexpr uint32_t SAMPLE_ATTR_CODENAME = 0x01010003;
constexpr uint32_t SAMPLE_ID_STANDARD = 0x01020000;
constexpr uint32_t SAMPLE_ID_SINGLE_TOP = 0x01020001;
constexpr uint32_t SAMPLE_ID_ORIENTATION = 0x01020002;
constexpr uint32_t SAMPLE_ID_KEYBOARD_HIDDEN = 0x01020003;
constexpr uint32_t SAMPLE_STYLE_THEME = 0x01030000;

// Name of the format item of an attr map.
constexpr uint32_t ATTR_TYPE_KEY = 0x01000000;

/*
 * A resource table with a package "android" (id 0x01) declaring:
 *   attr/launchMode    enum  {standard = 0, singleTop = 1}
 *   attr/configChanges flags {orientation = 0x80, keyboardHidden = 0x20}
 *   attr/label         string|reference
 *   attr/compileSdkVersionCodename string
 *   id/standard, id/singleTop, id/orientation, id/keyboardHidden
 *   style/Theme
 */
arsc::TableChunk make_android_table();

// Shortcut for a single-child pool.
arsc::StringPoolChunk make_pool(std::vector<std::string> strings);

/*
 * Bytes of a zip archive holding the given (name, contents) pairs, each
 * stored or deflated.
 */
std::vector<char> make_zip(
    const std::vector<std::pair<std::string, std::string>>& files,
    bool deflate);

// Bytes of a class file declaring `public static final int <field> = value`
// next to an unrelated constant.
std::vector<char> make_class_file(const std::string& class_name,
                                  const std::string& field,
                                  int32_t value);
