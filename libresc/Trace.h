/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "Macros.h"

#define TMS      \
  TM(ARSC)       \
  TM(BXML)       \
  TM(JAR)        \
  TM(MAIN)       \
  TM(TABLE)      \
  TM(ZIP)        \
  /* End of list */

enum TraceModule : int {
#define TM(x) x,
  TMS
#undef TM
      N_TRACE_MODULES,
};

// Release builds still type check the TRACE arguments; the constexpr false
// drops the call.
#ifdef NDEBUG
constexpr bool traceEnabled(TraceModule, int) { return false; }
#else
bool traceEnabled(TraceModule module, int level);
#endif // NDEBUG

void trace(TraceModule module, int level, const char* fmt, ...)
    ATTR_FORMAT(3, 4);

#define TRACE(module, level, fmt, ...)          \
  do {                                          \
    if (traceEnabled(module, level)) {          \
      trace(module, level, fmt, ##__VA_ARGS__); \
    }                                           \
  } while (0)
