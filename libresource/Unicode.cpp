/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "utils/Unicode.h"

#include <cstdint>

#include "Debug.h"

namespace arsc {

namespace {

// Decodes one code point starting at s[*i], advancing *i. Returns false on
// malformed input.
bool next_code_point(const uint8_t* s, size_t len, size_t* i, uint32_t* cp) {
  uint8_t lead = s[*i];
  size_t extra;
  uint32_t min;
  if (lead < 0x80) {
    *cp = lead;
    (*i)++;
    return true;
  } else if ((lead & 0xe0) == 0xc0) {
    extra = 1;
    min = 0x80;
    *cp = lead & 0x1f;
  } else if ((lead & 0xf0) == 0xe0) {
    extra = 2;
    min = 0x800;
    *cp = lead & 0x0f;
  } else if ((lead & 0xf8) == 0xf0) {
    extra = 3;
    min = 0x10000;
    *cp = lead & 0x07;
  } else {
    return false;
  }
  if (*i + extra >= len) {
    return false;
  }
  for (size_t k = 1; k <= extra; k++) {
    uint8_t c = s[*i + k];
    if ((c & 0xc0) != 0x80) {
      return false;
    }
    *cp = (*cp << 6) | (c & 0x3f);
  }
  if (*cp < min || *cp > 0x10ffff || (*cp >= 0xd800 && *cp <= 0xdfff)) {
    return false;
  }
  *i += extra + 1;
  return true;
}

} // namespace

bool is_valid_utf8(const char* s, size_t len) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(s);
  size_t i = 0;
  uint32_t cp;
  while (i < len) {
    if (!next_code_point(bytes, len, &i, &cp)) {
      return false;
    }
  }
  return true;
}

size_t utf8_to_utf16_length(const std::string& s) {
  return utf8_to_utf16(s).size();
}

std::u16string utf8_to_utf16(const std::string& s) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(s.data());
  std::u16string out;
  out.reserve(s.size());
  size_t i = 0;
  uint32_t cp;
  while (i < s.size()) {
    always_assert_log(next_code_point(bytes, s.size(), &i, &cp),
                      "Invalid UTF-8 in \"%s\"", s.c_str());
    if (cp >= 0x10000) {
      cp -= 0x10000;
      out.push_back(static_cast<char16_t>(0xd800 + (cp >> 10)));
      out.push_back(static_cast<char16_t>(0xdc00 + (cp & 0x3ff)));
    } else {
      out.push_back(static_cast<char16_t>(cp));
    }
  }
  return out;
}

boost::optional<std::string> utf16_to_utf8(const std::u16string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); i++) {
    uint32_t cp = s[i];
    if (cp >= 0xd800 && cp <= 0xdbff) {
      if (i + 1 >= s.size() || s[i + 1] < 0xdc00 || s[i + 1] > 0xdfff) {
        return boost::none;
      }
      cp = 0x10000 + ((cp - 0xd800) << 10) + (s[i + 1] - 0xdc00);
      i++;
    } else if (cp >= 0xdc00 && cp <= 0xdfff) {
      return boost::none;
    }
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xc0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xe0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    } else {
      out.push_back(static_cast<char>(0xf0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3f)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
  }
  return out;
}

} // namespace arsc
