/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "Macros.h" // For ATTR_FORMAT.
#include "RescException.h"

constexpr bool debug =
#ifdef NDEBUG
    false
#else
    true
#endif // NDEBUG
    ;

#ifdef _MSC_VER
#define UNREACHABLE() __assume(false)
#define PRETTY_FUNC() __func__
#else
#define UNREACHABLE() __builtin_unreachable()
#define PRETTY_FUNC() __PRETTY_FUNCTION__
#endif // _MSC_VER

/*
 * Reports a failed check. With typed exceptions enabled this throws the
 * RescException subclass matching `type`, otherwise a plain RescException.
 * Either way the message carries the expression, location and the formatted
 * `fmt`.
 */
[[noreturn]] void assert_fail(const char* expr,
                              const char* file,
                              unsigned line,
                              const char* func,
                              RescError type,
                              const char* fmt,
                              ...) ATTR_FORMAT(6, 7);

#define assert_fail_impl(e, type, msg, ...) \
  assert_fail(#e, __FILE__, __LINE__, PRETTY_FUNC(), type, msg, ##__VA_ARGS__)

#define assert_impl(cond, fail) \
  ((cond) ? static_cast<void>(0) : ((fail), static_cast<void>(0)))

// " " stands for "no message" so that -Wformat-zero-length stays quiet.
#define always_assert(e) \
  assert_impl(e, assert_fail_impl(e, RescError::GENERIC_ASSERTION_ERROR, " "))
#define always_assert_log(e, msg, ...) \
  assert_impl(e,                       \
              assert_fail_impl(        \
                  e, RescError::GENERIC_ASSERTION_ERROR, msg, ##__VA_ARGS__))
#define always_assert_type_log(e, type, msg, ...) \
  assert_impl(e, assert_fail_impl(e, type, msg, ##__VA_ARGS__))
#undef assert

// Unconditional failure of the given kind, for the end of a search that came
// up empty.
#define resc_fail(type, msg, ...) \
  assert_fail_impl(false, type, msg, ##__VA_ARGS__)

// Debug-only checks. Release builds still compile `e`, so no -Wunused.
#define assert_log(e, msg, ...) \
  always_assert_log(!debug || e, msg, ##__VA_ARGS__)
#define assert_type_log(e, type, msg, ...) \
  always_assert_type_log(!debug || e, type, msg, ##__VA_ARGS__)

#define not_reached()                                                   \
  do {                                                                  \
    resc_fail(RescError::INTERNAL_ERROR, "Control reached unreachable " \
                                         "code");                       \
  } while (true)
