/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "ClassFileReader.h"

#include <string_view>
#include <vector>

#include "Debug.h"
#include "Trace.h"
#include "ZipReader.h"

namespace jar {

namespace {

constexpr uint32_t kClassMagic = 0xcafebabe;
constexpr uint16_t kAccStatic = 0x0008;
constexpr uint16_t kAccFinal = 0x0010;

// Constant pool tags, JVM specification 4.4.
enum ConstantTag : uint8_t {
  CONSTANT_Utf8 = 1,
  CONSTANT_Integer = 3,
  CONSTANT_Float = 4,
  CONSTANT_Long = 5,
  CONSTANT_Double = 6,
  CONSTANT_Class = 7,
  CONSTANT_String = 8,
  CONSTANT_Fieldref = 9,
  CONSTANT_Methodref = 10,
  CONSTANT_InterfaceMethodref = 11,
  CONSTANT_NameAndType = 12,
  CONSTANT_MethodHandle = 15,
  CONSTANT_MethodType = 16,
  CONSTANT_Dynamic = 17,
  CONSTANT_InvokeDynamic = 18,
  CONSTANT_Module = 19,
  CONSTANT_Package = 20,
};

// Big-endian reads, bounds checked against the end of the class file.
class ClassCursor {
 public:
  ClassCursor(const uint8_t* data, size_t size)
      : m_ptr(data), m_end(data + size) {}

  uint8_t u1() {
    need(1);
    return *m_ptr++;
  }

  uint16_t u2() {
    need(2);
    uint16_t v = (m_ptr[0] << 8) | m_ptr[1];
    m_ptr += 2;
    return v;
  }

  uint32_t u4() {
    need(4);
    uint32_t v = ((uint32_t)m_ptr[0] << 24) | ((uint32_t)m_ptr[1] << 16) |
                 ((uint32_t)m_ptr[2] << 8) | (uint32_t)m_ptr[3];
    m_ptr += 4;
    return v;
  }

  std::string_view bytes(size_t len) {
    need(len);
    std::string_view v(reinterpret_cast<const char*>(m_ptr), len);
    m_ptr += len;
    return v;
  }

  void skip(size_t len) { bytes(len); }

 private:
  void need(size_t len) const {
    always_assert_type_log(len <= (size_t)(m_end - m_ptr), BUFFER_END_EXCEEDED,
                           "Class file truncated: need %zu more bytes", len);
  }

  const uint8_t* m_ptr;
  const uint8_t* m_end;
};

// Only the constant kinds a field lookup needs are kept.
struct Constant {
  uint8_t tag{0};
  uint32_t int_value{0};
  std::string_view utf8;
};

Constant read_constant(ClassCursor& c) {
  Constant constant;
  constant.tag = c.u1();
  switch (constant.tag) {
  case CONSTANT_Utf8:
    constant.utf8 = c.bytes(c.u2());
    break;
  case CONSTANT_Integer:
    constant.int_value = c.u4();
    break;
  case CONSTANT_Float:
  case CONSTANT_Fieldref:
  case CONSTANT_Methodref:
  case CONSTANT_InterfaceMethodref:
  case CONSTANT_NameAndType:
  case CONSTANT_Dynamic:
  case CONSTANT_InvokeDynamic:
    c.skip(4);
    break;
  case CONSTANT_Long:
  case CONSTANT_Double:
    c.skip(8);
    break;
  case CONSTANT_Class:
  case CONSTANT_String:
  case CONSTANT_MethodType:
  case CONSTANT_Module:
  case CONSTANT_Package:
    c.skip(2);
    break;
  case CONSTANT_MethodHandle:
    c.skip(3);
    break;
  default:
    resc_fail(RescError::INVALID_JAVA, "Unrecognized constant pool tag 0x%x",
              constant.tag);
  }
  return constant;
}

std::string_view utf8_at(const std::vector<Constant>& pool, uint16_t index) {
  always_assert_type_log(index < pool.size() &&
                             pool[index].tag == CONSTANT_Utf8,
                         RescError::INVALID_JAVA,
                         "Constant %u is not a utf8 string", index);
  return pool[index].utf8;
}

} // namespace

boost::optional<int32_t> find_static_int_field(const uint8_t* buffer,
                                               size_t size,
                                               const std::string& field_name) {
  ClassCursor c(buffer, size);
  uint32_t magic = c.u4();
  always_assert_type_log(magic == kClassMagic, RescError::INVALID_JAVA,
                         "Bad class magic 0x%x", magic);
  c.skip(4); // minor and major version

  // Index 0 is unused, and longs and doubles take two slots.
  std::vector<Constant> pool(c.u2());
  for (size_t i = 1; i < pool.size(); i++) {
    pool[i] = read_constant(c);
    if (pool[i].tag == CONSTANT_Long || pool[i].tag == CONSTANT_Double) {
      always_assert_type_log(i + 1 < pool.size(), RescError::INVALID_JAVA,
                             "Long constant %zu overflows the pool", i);
      i++;
    }
  }

  c.skip(6); // access flags, this class, super class
  c.skip(2 * (size_t)c.u2()); // interfaces

  uint16_t field_count = c.u2();
  for (uint16_t i = 0; i < field_count; i++) {
    uint16_t flags = c.u2();
    auto name = utf8_at(pool, c.u2());
    auto descriptor = utf8_at(pool, c.u2());
    bool wanted = name == field_name && descriptor == "I" &&
                  (flags & (kAccStatic | kAccFinal)) ==
                      (kAccStatic | kAccFinal);
    uint16_t attribute_count = c.u2();
    for (uint16_t j = 0; j < attribute_count; j++) {
      auto attribute_name = utf8_at(pool, c.u2());
      uint32_t length = c.u4();
      if (!wanted || attribute_name != "ConstantValue") {
        c.skip(length);
        continue;
      }
      always_assert_type_log(length == 2, RescError::INVALID_JAVA,
                             "ConstantValue of %s has length %u",
                             field_name.c_str(), length);
      uint16_t index = c.u2();
      always_assert_type_log(index < pool.size() &&
                                 pool[index].tag == CONSTANT_Integer,
                             RescError::INVALID_JAVA,
                             "ConstantValue of %s is not an int constant",
                             field_name.c_str());
      TRACE(JAR, 3, "Found %s = 0x%x", field_name.c_str(),
            pool[index].int_value);
      return static_cast<int32_t>(pool[index].int_value);
    }
  }
  return boost::none;
}

boost::optional<int32_t> find_static_int_field(const zip::ZipReader& jar,
                                               const std::string& class_name,
                                               const std::string& field_name) {
  const auto* entry = jar.find_entry(class_name + ".class");
  if (entry == nullptr) {
    TRACE(JAR, 2, "No class %s in jar", class_name.c_str());
    return boost::none;
  }
  auto bytes = jar.extract(*entry);
  return find_static_int_field(reinterpret_cast<const uint8_t*>(bytes.data()),
                               bytes.size(), field_name);
}

} // namespace jar
