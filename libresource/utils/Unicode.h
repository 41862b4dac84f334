/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#ifndef _RESC_ARSC_UNICODE_H
#define _RESC_ARSC_UNICODE_H

#include <boost/optional.hpp>
#include <cstddef>
#include <string>

namespace arsc {

// Rejects overlong forms, surrogates and code points above U+10FFFF.
bool is_valid_utf8(const char* s, size_t len);

// Number of UTF-16 code units needed for the (valid) UTF-8 string.
size_t utf8_to_utf16_length(const std::string& s);

std::u16string utf8_to_utf16(const std::string& s);

// None if `s` contains an unpaired surrogate.
boost::optional<std::string> utf16_to_utf8(const std::u16string& s);

} // namespace arsc

#endif
