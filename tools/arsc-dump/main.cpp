/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <string>

#include "DebugUtils.h"
#include "Trace.h"
#include "ZipReader.h"
#include "utils/Chunk.h"
#include "utils/Dump.h"

namespace po = boost::program_options;

namespace {

arsc::Chunk load(const po::variables_map& vm) {
  if (vm.count("apk") != 0u) {
    const auto& apk = vm["apk"].as<std::string>();
    TRACE(MAIN, 1, "Reading resources.arsc of %s", apk.c_str());
    return arsc::parse_chunk(zip::extract_zip_file(apk, "resources.arsc"));
  }
  const auto& path = vm.count("arsc") != 0u ? vm["arsc"].as<std::string>()
                                            : vm["xml"].as<std::string>();
  TRACE(MAIN, 1, "Reading %s", path.c_str());
  return arsc::parse_chunk_file(path);
}

} // namespace

// Prints the chunk tree of a resources.arsc or a binary xml document.
int main(int argc, char** argv) {
  po::options_description od("Usage: arsc-dump (--arsc F | --xml F | --apk F)");
  od.add_options()("help,h", "print this help message");
  od.add_options()("arsc", po::value<std::string>(), "a resources.arsc file");
  od.add_options()("xml", po::value<std::string>(), "a binary xml file");
  od.add_options()("apk", po::value<std::string>(),
                   "an apk or jar; dumps its resources.arsc");

  po::variables_map vm;
  try {
    po::store(po::parse_command_line(argc, argv, od), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << "\n\n" << od << std::endl;
    return EXIT_FAILURE;
  }
  if (vm.count("help") != 0u) {
    std::cout << od << std::endl;
    return EXIT_SUCCESS;
  }
  if (vm.count("arsc") + vm.count("xml") + vm.count("apk") != 1) {
    std::cerr << od << std::endl;
    return EXIT_FAILURE;
  }

  try {
    std::cout << load(vm);
  } catch (const std::exception& e) {
    std::cerr << "arsc-dump: " << e.what() << std::endl;
    print_stack_trace(std::cerr, e);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
