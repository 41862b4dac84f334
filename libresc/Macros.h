/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

// MinGW lacks execinfo as well, so it counts as Windows here.
#if defined(_WIN32)
#define IS_WINDOWS 1
#else
#define IS_WINDOWS 0
#endif

// printf-style checking of `fmt` (1-based) against the varargs at `args`.
#if defined(__GNUC__)
#define ATTR_FORMAT(fmt, args) __attribute__((format(printf, fmt, args)))
#else
#define ATTR_FORMAT(fmt, args)
#endif
