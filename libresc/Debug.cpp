/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "Debug.h"
#include "DebugUtils.h"

#include <array>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <signal.h>
#include <string>
#include <vector>

#include <boost/exception/all.hpp>

#include "Macros.h"

#if IS_WINDOWS
#include <boost/stacktrace.hpp>
#else
#include <execinfo.h>
#include <unistd.h>
#endif

namespace {

#if IS_WINDOWS

using Backtrace = boost::stacktrace::stacktrace;

void print_backtrace(std::ostream& os, const Backtrace& bt) {
  os << bt << std::endl;
}

#else

// Return addresses captured where the assertion failed.
struct Backtrace {
  std::array<void*, 128> frames;
  int count;

  Backtrace() { count = backtrace(frames.data(), frames.size()); }
};

void print_backtrace(std::ostream& os, const Backtrace& bt) {
  char** symbols = backtrace_symbols(bt.frames.data(), bt.count);
  if (symbols == nullptr) {
    os << "<no symbols>" << std::endl;
    return;
  }
  for (int i = 0; i < bt.count; i++) {
    os << "  " << symbols[i] << "\n";
  }
  os.flush();
  free(symbols);
}

#endif

using traced = boost::error_info<struct tag_backtrace, Backtrace>;

template <typename Exception>
[[noreturn]] void throw_with_backtrace(const Exception& e) {
  throw boost::enable_error_info(e) << traced(Backtrace());
}

[[noreturn]] void throw_typed(RescError type, const std::string& msg) {
  switch (type) {
  case RescError::BUFFER_END_EXCEEDED:
    throw_with_backtrace(resc::BufferEndExceededException(msg));
  case RescError::MALFORMED_CHUNK:
    throw_with_backtrace(resc::MalformedChunkException(msg));
  case RescError::UNSUPPORTED_ATTRIBUTE:
    throw_with_backtrace(resc::UnsupportedAttributeException(msg));
  case RescError::MALFORMED_ATTRIBUTE_VALUE:
    throw_with_backtrace(resc::MalformedAttributeValueException(msg));
  case RescError::RESOURCE_NOT_FOUND:
    throw_with_backtrace(resc::ResourceNotFoundException(msg));
  case RescError::INVALID_ZIP:
    throw_with_backtrace(resc::InvalidZipException(msg));
  case RescError::INVALID_JAVA:
    throw_with_backtrace(resc::InvalidJavaException(msg));
  case RescError::INVALID_XML:
    throw_with_backtrace(resc::InvalidXmlException(msg));
  case RescError::INTERNAL_ERROR:
  case RescError::GENERIC_ASSERTION_ERROR:
    break;
  }
  throw_with_backtrace(RescException(type, msg));
}

} // namespace

void crash_backtrace_handler(int sig) {
#if !IS_WINDOWS
  // Only async-signal-safe calls from here on.
  std::array<void*, 128> frames;
  int count = backtrace(frames.data(), frames.size());
  backtrace_symbols_fd(frames.data(), count, STDERR_FILENO);
#endif
  signal(sig, SIG_DFL);
  raise(sig);
}

std::string v_format2string(const char* fmt, va_list ap) {
  va_list measure;
  va_copy(measure, ap);
  int len = vsnprintf(nullptr, 0, fmt, measure);
  va_end(measure);
  if (len <= 0) {
    return std::string();
  }
  std::vector<char> buf(len + 1);
  vsnprintf(buf.data(), buf.size(), fmt, ap);
  return std::string(buf.data(), len);
}

std::string format2string(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  auto result = v_format2string(fmt, ap);
  va_end(ap);
  return result;
}

void assert_fail(const char* expr,
                 const char* file,
                 unsigned line,
                 const char* func,
                 RescError type,
                 const char* fmt,
                 ...) {
  auto msg = format2string("%s:%u: %s: assertion `%s' failed.\n", file, line,
                           func, expr);
  // " " means no message, see Debug.h.
  if (strcmp(fmt, " ") != 0) {
    va_list ap;
    va_start(ap, fmt);
    msg += v_format2string(fmt, ap);
    va_end(ap);
  }
  if (resc::throw_typed_exception()) {
    throw_typed(type, msg);
  }
  throw_with_backtrace(RescException(type, msg));
}

void print_stack_trace(std::ostream& os, const std::exception& e) {
  if (const auto* bt = boost::get_error_info<traced>(e)) {
    print_backtrace(os, *bt);
  }
}
