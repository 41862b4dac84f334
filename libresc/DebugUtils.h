/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdarg>
#include <exception>
#include <iosfwd>
#include <string>

#include "Macros.h"

// printf into a std::string.
std::string format2string(const char* fmt, ...) ATTR_FORMAT(1, 2);
std::string v_format2string(const char* fmt, va_list ap);

// Writes the backtrace recorded when a failed assertion threw `e`. Nothing
// for exceptions raised any other way.
void print_stack_trace(std::ostream& os, const std::exception& e);

// Signal handler for SIGSEGV and SIGBUS: dumps the native backtrace to stderr
// and re-raises with the default disposition.
void crash_backtrace_handler(int sig);
