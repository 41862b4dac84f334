/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <boost/optional.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "Attributes.h"
#include "ClassFileReader.h"
#include "DebugUtils.h"
#include "RescToolsCommon.h"
#include "Trace.h"
#include "XmlCompiler.h"
#include "ZipReader.h"
#include "utils/Serialize.h"
#include "utils/Table.h"

namespace {

struct Arguments {
  std::string manifest;
  std::vector<std::string> android_jars;
  boost::optional<std::string> icon_package;
  std::string out_manifest;
  std::string out_resources;
};

Arguments parse_args(int argc, char* argv[]) {
  namespace po = boost::program_options;
  po::options_description od(
      "Compiles an AndroidManifest.xml into its binary form.\nOptions");
  od.add_options()("help,h", "print this help message");
  od.add_options()("config,c", po::value<std::string>(),
                   "JSON file providing defaults for the options below");
  od.add_options()("manifest,m", po::value<std::string>(),
                   "textual AndroidManifest.xml");
  od.add_options()(
      "android-jar,j",
      po::value<std::vector<std::string>>(), // Accumulation
      "android.jar (or apk) whose resources.arsc resolves references");
  od.add_options()("icon-package", po::value<std::string>(),
                   "also emit a mipmap/icon resource table for this package");
  od.add_options()("out-manifest,o", po::value<std::string>(),
                   "output path of the binary manifest");
  od.add_options()("out-resources", po::value<std::string>(),
                   "output path of the resources.arsc with the icon");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, od), vm);
    po::notify(vm);
  } catch (std::exception& e) {
    std::cerr << e.what() << std::endl << std::endl;
    od.print(std::cerr);
    exit(EXIT_FAILURE);
  }

  if (vm.count("help")) {
    od.print(std::cout);
    exit(EXIT_SUCCESS);
  }

  Json::Value config(Json::objectValue);
  if (vm.count("config")) {
    config = resc::parse_config(vm["config"].as<std::string>());
  }

  // Command line values win over the config file.
  auto string_arg = [&](const char* option, const char* key) {
    if (vm.count(option)) {
      return vm[option].as<std::string>();
    }
    return resc::get_string(config, key, "");
  };

  Arguments args;
  args.manifest = string_arg("manifest", "manifest");
  args.out_manifest = string_arg("out-manifest", "out_manifest");
  args.out_resources = string_arg("out-resources", "out_resources");
  auto icon_package = string_arg("icon-package", "icon_package");
  if (!icon_package.empty()) {
    args.icon_package = icon_package;
  }
  if (vm.count("android-jar")) {
    args.android_jars = vm["android-jar"].as<std::vector<std::string>>();
  } else {
    args.android_jars = resc::get_string_list(config, "android_jars");
  }

  if (args.manifest.empty() || args.out_manifest.empty()) {
    std::cerr << "error: --manifest and --out-manifest are required"
              << std::endl;
    od.print(std::cerr);
    exit(EXIT_FAILURE);
  }
  if (args.icon_package && args.out_resources.empty()) {
    std::cerr << "error: --icon-package requires --out-resources" << std::endl;
    exit(EXIT_FAILURE);
  }
  return args;
}

// Compares the dictionary against the platform's R$attr, which can drift for
// attributes whose ids were not read from a platform jar.
void check_platform_ids(const std::string& jar_path) {
  zip::ZipReader jar(jar_path);
  for (const char* name : {"compileSdkVersion", "compileSdkVersionCodename"}) {
    auto id = jar::find_static_int_field(jar, "android/R$attr", name);
    const auto* info = bxml::find_attribute(name);
    if (!id || info == nullptr || !info->res_id) {
      TRACE(MAIN, 2, "%s: no R$attr.%s", jar_path.c_str(), name);
      continue;
    }
    if ((uint32_t)*id != *info->res_id) {
      std::cerr << "warning: " << jar_path << " declares " << name << " as 0x"
                << std::hex << *id << ", expected 0x" << *info->res_id
                << std::dec << std::endl;
    } else {
      TRACE(MAIN, 1, "%s: R$attr.%s = 0x%08x", jar_path.c_str(), name,
            (uint32_t)*id);
    }
  }
}

void run(int argc, char* argv[]) {
  auto args = parse_args(argc, argv);

  arsc::Table table;
  for (const auto& jar : args.android_jars) {
    TRACE(MAIN, 1, "Importing %s", jar.c_str());
    table.import_apk(jar);
    check_platform_ids(jar);
  }

  auto xml = resc::read_text_file(args.manifest);
  auto compiled = bxml::compile_manifest(xml, table, args.icon_package);

  arsc::write_bytes_to_file(arsc::write_chunk(compiled.manifest),
                            args.out_manifest);
  TRACE(MAIN, 1, "Wrote %s", args.out_manifest.c_str());
  if (compiled.resources) {
    arsc::write_bytes_to_file(arsc::write_chunk(*compiled.resources),
                              args.out_resources);
    TRACE(MAIN, 1, "Wrote %s with icon 0x%08x", args.out_resources.c_str(),
          compiled.icon->value());
  }
}

} // namespace

int main(int argc, char* argv[]) {
  signal(SIGSEGV, crash_backtrace_handler);
#if !IS_WINDOWS
  signal(SIGBUS, crash_backtrace_handler);
#endif

  try {
    run(argc, argv);
  } catch (std::exception& e) {
    std::cerr << e.what() << std::endl;
    print_stack_trace(std::cerr, e);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
