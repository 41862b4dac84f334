/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <exception>
#include <string>

enum RescError {
  INTERNAL_ERROR = 1,
  GENERIC_ASSERTION_ERROR = 2,
  BUFFER_END_EXCEEDED = 3,
  MALFORMED_CHUNK = 4,
  UNSUPPORTED_ATTRIBUTE = 5,
  MALFORMED_ATTRIBUTE_VALUE = 6,
  RESOURCE_NOT_FOUND = 7,
  INVALID_ZIP = 8,
  INVALID_JAVA = 9,
  INVALID_XML = 10,
};

class RescException : public std::exception {
 public:
  const RescError type;
  const std::string message;

  explicit RescException(RescError type_of_error,
                         const std::string& message = "");

  const char* what() const noexcept override;

 private:
  std::string m_msg;
};

namespace resc {

class BufferEndExceededException : public RescException {
 public:
  explicit BufferEndExceededException(const std::string& message)
      : RescException(RescError::BUFFER_END_EXCEEDED, message) {}
};

class MalformedChunkException : public RescException {
 public:
  explicit MalformedChunkException(const std::string& message)
      : RescException(RescError::MALFORMED_CHUNK, message) {}
};

class UnsupportedAttributeException : public RescException {
 public:
  explicit UnsupportedAttributeException(const std::string& message)
      : RescException(RescError::UNSUPPORTED_ATTRIBUTE, message) {}
};

class MalformedAttributeValueException : public RescException {
 public:
  explicit MalformedAttributeValueException(const std::string& message)
      : RescException(RescError::MALFORMED_ATTRIBUTE_VALUE, message) {}
};

class ResourceNotFoundException : public RescException {
 public:
  explicit ResourceNotFoundException(const std::string& message)
      : RescException(RescError::RESOURCE_NOT_FOUND, message) {}
};

class InvalidZipException : public RescException {
 public:
  explicit InvalidZipException(const std::string& message)
      : RescException(RescError::INVALID_ZIP, message) {}
};

class InvalidJavaException : public RescException {
 public:
  explicit InvalidJavaException(const std::string& message)
      : RescException(RescError::INVALID_JAVA, message) {}
};

class InvalidXmlException : public RescException {
 public:
  explicit InvalidXmlException(const std::string& message)
      : RescException(RescError::INVALID_XML, message) {}
};

// Whether assertion failures raise the typed subclass for their error code
// instead of a plain RescException. On by default.
bool throw_typed_exception();
void set_throw_typed_exception(bool value);

} // namespace resc
