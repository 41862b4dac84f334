/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "RescToolsCommon.h"

#include <fstream>
#include <iostream>
#include <sstream>

#include "Debug.h"

namespace resc {

Json::Value parse_config(const std::string& config_file) {
  std::ifstream config_stream(config_file);
  if (!config_stream) {
    std::cerr << "error: cannot find config file: " << config_file << std::endl;
    exit(EXIT_FAILURE);
  }
  Json::Value ret;
  config_stream >> ret; // parse JSON
  always_assert_log(ret.isObject(), "Config %s is not a json object",
                    config_file.c_str());
  return ret;
}

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  always_assert_log(in.good(), "Unable to read %s", path.c_str());
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

std::string get_string(const Json::Value& config,
                       const char* key,
                       const std::string& dflt) {
  if (!config.isMember(key)) {
    return dflt;
  }
  const auto& value = config[key];
  always_assert_log(value.isString(), "Config value %s must be a string", key);
  return value.asString();
}

std::vector<std::string> get_string_list(const Json::Value& config,
                                         const char* key) {
  std::vector<std::string> result;
  if (!config.isMember(key)) {
    return result;
  }
  const auto& value = config[key];
  always_assert_log(value.isArray(), "Config value %s must be a list", key);
  for (const auto& item : value) {
    always_assert_log(item.isString(), "Config value %s must hold strings",
                      key);
    result.push_back(item.asString());
  }
  return result;
}

} // namespace resc
