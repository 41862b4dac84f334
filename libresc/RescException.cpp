/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "RescException.h"

#include <atomic>

namespace {

const char* error_name(RescError type) {
  switch (type) {
  case RescError::INTERNAL_ERROR:
    return "INTERNAL_ERROR";
  case RescError::GENERIC_ASSERTION_ERROR:
    return "GENERIC_ASSERTION_ERROR";
  case RescError::BUFFER_END_EXCEEDED:
    return "BUFFER_END_EXCEEDED";
  case RescError::MALFORMED_CHUNK:
    return "MALFORMED_CHUNK";
  case RescError::UNSUPPORTED_ATTRIBUTE:
    return "UNSUPPORTED_ATTRIBUTE";
  case RescError::MALFORMED_ATTRIBUTE_VALUE:
    return "MALFORMED_ATTRIBUTE_VALUE";
  case RescError::RESOURCE_NOT_FOUND:
    return "RESOURCE_NOT_FOUND";
  case RescError::INVALID_ZIP:
    return "INVALID_ZIP";
  case RescError::INVALID_JAVA:
    return "INVALID_JAVA";
  case RescError::INVALID_XML:
    return "INVALID_XML";
  }
  return "UNKNOWN";
}

std::atomic<bool> s_throw_typed{true};

} // namespace

RescException::RescException(RescError type_of_error,
                             const std::string& message)
    : type(type_of_error), message(message) {
  // Plain assertion failures carry their location in the message already.
  if (type_of_error == RescError::GENERIC_ASSERTION_ERROR) {
    m_msg = message;
  } else {
    m_msg = std::string(error_name(type_of_error)) + ": " + message;
  }
}

const char* RescException::what() const noexcept { return m_msg.c_str(); }

namespace resc {

bool throw_typed_exception() { return s_throw_typed.load(); }

void set_throw_typed_exception(bool value) { s_throw_typed.store(value); }

} // namespace resc
