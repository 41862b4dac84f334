/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Trace.h"

#include <array>
#include <boost/algorithm/string.hpp>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>
#include <vector>

namespace {

constexpr std::array<const char*, N_TRACE_MODULES> kModuleNames = {{
#define TM(x) #x,
    TMS
#undef TM
}};

int module_by_name(const std::string& name) {
  for (size_t i = 0; i < kModuleNames.size(); i++) {
    if (name == kModuleNames[i]) {
      return (int)i;
    }
  }
  return -1;
}

/*
 * Trace settings come from the environment:
 *   TRACE=2                 everything up to level 2
 *   TRACE=ARSC:3,TABLE:1    per module levels, may be mixed with the above
 *   TRACEFILE=path|fd       output, stderr by default
 *   SHOW_TIMESTAMPS=1       prefix lines with the local time
 *   SHOW_TRACEMODULE=1      prefix lines with [MODULE:level]
 */
class Tracer {
 public:
  Tracer() {
    m_levels.fill(0);
    m_file = stderr;
    const char* spec = getenv("TRACE");
    if (spec == nullptr) {
      return;
    }
    parse_levels(spec);
    open_file(getenv("TRACEFILE"));
    m_show_timestamps = getenv("SHOW_TIMESTAMPS") != nullptr;
    m_show_module = getenv("SHOW_TRACEMODULE") != nullptr;
  }

  ~Tracer() {
    if (m_file != stderr) {
      fclose(m_file);
    }
  }

  bool enabled(TraceModule module, int level) const {
    return level <= m_global_level || level <= m_levels[module];
  }

  void write(TraceModule module, int level, const char* fmt, va_list ap) {
    std::lock_guard<std::mutex> guard(m_mutex);
    if (m_show_timestamps) {
      auto now = std::time(nullptr);
      struct tm local;
      localtime_r(&now, &local);
      std::array<char, 40> stamp;
      std::strftime(stamp.data(), stamp.size(), "%c", &local);
      fprintf(m_file, "[%s] ", stamp.data());
    }
    if (m_show_module) {
      fprintf(m_file, "[%s:%d] ", kModuleNames[module], level);
    }
    vfprintf(m_file, fmt, ap);
    fputc('\n', m_file);
    fflush(m_file);
  }

 private:
  void parse_levels(const std::string& spec) {
    std::vector<std::string> items;
    boost::split(items, spec, boost::is_any_of(", "),
                 boost::token_compress_on);
    for (const auto& item : items) {
      if (item.empty()) {
        continue;
      }
      auto colon = item.find(':');
      if (colon == std::string::npos) {
        m_global_level = atoi(item.c_str());
        continue;
      }
      auto name = item.substr(0, colon);
      auto module = module_by_name(name);
      if (module < 0) {
        fprintf(stderr, "Unknown trace module %s, ignoring\n", name.c_str());
        continue;
      }
      m_levels[module] = atoi(item.c_str() + colon + 1);
    }
  }

  void open_file(const char* name) {
    if (name == nullptr) {
      return;
    }
    char* end = nullptr;
    long fd = strtol(name, &end, 10);
    FILE* file = (*name != '\0' && *end == '\0') ? fdopen((int)fd, "w")
                                                  : fopen(name, "w");
    if (file == nullptr) {
      fprintf(stderr, "Unable to open TRACEFILE %s, using stderr\n", name);
      return;
    }
    m_file = file;
  }

  FILE* m_file;
  int m_global_level{0};
  std::array<int, N_TRACE_MODULES> m_levels;
  bool m_show_timestamps{false};
  bool m_show_module{false};
  std::mutex m_mutex;
};

Tracer& tracer() {
  static Tracer instance;
  return instance;
}

} // namespace

#ifndef NDEBUG
bool traceEnabled(TraceModule module, int level) {
  return tracer().enabled(module, level);
}
#endif

void trace(TraceModule module, int level, const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  tracer().write(module, level, fmt, ap);
  va_end(ap);
}
