/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <json/json.h>
#include <string>
#include <vector>

namespace resc {

Json::Value parse_config(const std::string& config_file);

std::string read_text_file(const std::string& path);

// Member `key` of a config object as a string, or `dflt` if absent.
std::string get_string(const Json::Value& config,
                       const char* key,
                       const std::string& dflt);

std::vector<std::string> get_string_list(const Json::Value& config,
                                         const char* key);

} // namespace resc
