/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "TestStructures.h"

#include <stdexcept>
#include <zlib.h>

#include "utils/Serialize.h"

using namespace arsc;

namespace {

constexpr uint32_t FORMAT_STRING = 1 << 1;
constexpr uint32_t FORMAT_ENUM = 1 << 16;
constexpr uint32_t FORMAT_FLAGS = 1 << 17;

ResTableMap item(uint32_t name, ResValueType type, uint32_t data) {
  return ResTableMap{name, ResValue(type, data)};
}

ResTableMap format(uint32_t data) {
  return item(ATTR_TYPE_KEY, ResValueType::IntDec, data);
}

TableTypeSpecChunk make_spec(uint8_t type_id, size_t count) {
  TableTypeSpecChunk spec;
  spec.type_id = type_id;
  spec.flags.resize(count, 0);
  return spec;
}

TableTypeChunk make_type(uint8_t type_id, std::vector<ResTableEntry> entries) {
  TableTypeChunk type;
  type.type_id = type_id;
  for (auto& entry : entries) {
    type.entries.emplace_back(std::move(entry));
  }
  return type;
}

void push_be16(uint16_t v, std::vector<char>* out) {
  out->push_back((char)(v >> 8));
  out->push_back((char)(v & 0xff));
}

void push_be32(uint32_t v, std::vector<char>* out) {
  push_be16(v >> 16, out);
  push_be16(v & 0xffff, out);
}

void push_utf8_constant(const std::string& s, std::vector<char>* out) {
  out->push_back(1);
  push_be16(s.size(), out);
  out->insert(out->end(), s.begin(), s.end());
}

std::string raw_deflate(const std::string& in) {
  z_stream strm{};
  if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                   Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }
  std::string out(deflateBound(&strm, in.size()), '\0');
  strm.next_in = (Bytef*)in.data();
  strm.avail_in = in.size();
  strm.next_out = (Bytef*)&out[0];
  strm.avail_out = out.size();
  auto ret = deflate(&strm, Z_FINISH);
  out.resize(strm.total_out);
  deflateEnd(&strm);
  if (ret != Z_STREAM_END) {
    throw std::runtime_error("deflate failed");
  }
  return out;
}

} // namespace

StringPoolChunk make_pool(std::vector<std::string> strings) {
  StringPoolChunk pool;
  pool.strings = std::move(strings);
  return pool;
}

TableChunk make_android_table() {
  TablePackageChunk package;
  package.header.id = 0x01;
  package.header.name = "android";
  package.children.emplace_back(make_pool({"attr", "id", "style"}));
  package.children.emplace_back(make_pool(
      {"launchMode", "configChanges", "label", "compileSdkVersionCodename",
       "standard", "singleTop", "orientation", "keyboardHidden", "Theme"}));

  package.children.emplace_back(make_spec(1, 4));
  package.children.emplace_back(make_type(
      1,
      {ResTableEntry::make_complex(
           KEY_LAUNCH_MODE, 0,
           {format(FORMAT_ENUM),
            item(SAMPLE_ID_STANDARD, ResValueType::IntDec, 0),
            item(SAMPLE_ID_SINGLE_TOP, ResValueType::IntDec, 1)}),
       ResTableEntry::make_complex(
           KEY_CONFIG_CHANGES, 0,
           {format(FORMAT_FLAGS),
            item(SAMPLE_ID_ORIENTATION, ResValueType::IntHex, 0x80),
            item(SAMPLE_ID_KEYBOARD_HIDDEN, ResValueType::IntHex, 0x20)}),
       // reference|string
       ResTableEntry::make_complex(KEY_LABEL, 0, {format(0b11)}),
       ResTableEntry::make_complex(KEY_CODENAME, 0,
                                   {format(FORMAT_STRING)})}));

  package.children.emplace_back(make_spec(2, 4));
  std::vector<ResTableEntry> ids;
  for (uint32_t key : {KEY_STANDARD, KEY_SINGLE_TOP, KEY_ORIENTATION,
                       KEY_KEYBOARD_HIDDEN}) {
    ids.push_back(ResTableEntry::make_simple(
        key, ResValue(ResValueType::IntBoolean, 0)));
  }
  package.children.emplace_back(make_type(2, std::move(ids)));

  package.children.emplace_back(make_spec(3, 1));
  package.children.emplace_back(make_type(
      3, {ResTableEntry::make_complex(
             KEY_THEME, 0,
             {item(SAMPLE_ATTR_LABEL, ResValueType::String, 0)})}));

  TableChunk table;
  table.header.package_count = 1;
  table.children.emplace_back(make_pool({"Theme"}));
  table.children.emplace_back(std::move(package));
  return table;
}

std::vector<char> make_zip(
    const std::vector<std::pair<std::string, std::string>>& files,
    bool deflate) {
  std::vector<char> out;
  std::vector<char> central;
  for (const auto& file : files) {
    const auto& name = file.first;
    const auto& contents = file.second;
    uint32_t crc =
        crc32(0, (const Bytef*)contents.data(), (uInt)contents.size());
    auto data = deflate ? raw_deflate(contents) : contents;
    uint16_t method = deflate ? 8 : 0;
    uint32_t offset = out.size();

    push_long(0x04034b50, &out);
    push_short(20, &out); // version needed
    push_short(0, &out); // flags
    push_short(method, &out);
    push_short(0, &out); // time
    push_short(0, &out); // date
    push_long(crc, &out);
    push_long(data.size(), &out);
    push_long(contents.size(), &out);
    push_short(name.size(), &out);
    push_short(0, &out); // extra
    out.insert(out.end(), name.begin(), name.end());
    out.insert(out.end(), data.begin(), data.end());

    push_long(0x02014b50, &central);
    push_short(20, &central); // version made by
    push_short(20, &central); // version needed
    push_short(0, &central);
    push_short(method, &central);
    push_short(0, &central);
    push_short(0, &central);
    push_long(crc, &central);
    push_long(data.size(), &central);
    push_long(contents.size(), &central);
    push_short(name.size(), &central);
    push_short(0, &central); // extra
    push_short(0, &central); // comment
    push_short(0, &central); // disk
    push_short(0, &central); // internal attributes
    push_long(0, &central); // external attributes
    push_long(offset, &central);
    central.insert(central.end(), name.begin(), name.end());
  }
  uint32_t cd_offset = out.size();
  out.insert(out.end(), central.begin(), central.end());
  push_long(0x06054b50, &out);
  push_short(0, &out);
  push_short(0, &out);
  push_short(files.size(), &out);
  push_short(files.size(), &out);
  push_long(central.size(), &out);
  push_long(cd_offset, &out);
  push_short(0, &out); // comment
  return out;
}

std::vector<char> make_class_file(const std::string& class_name,
                                  const std::string& field,
                                  int32_t value) {
  std::vector<char> out;
  push_be32(0xcafebabe, &out);
  push_be16(0, &out); // minor
  push_be16(52, &out); // major
  push_be16(12, &out); // constant pool count
  push_utf8_constant(class_name, &out); // #1
  out.push_back(7); // #2 Class #1
  push_be16(1, &out);
  push_utf8_constant("java/lang/Object", &out); // #3
  out.push_back(7); // #4 Class #3
  push_be16(3, &out);
  push_utf8_constant(field, &out); // #5
  push_utf8_constant("I", &out); // #6
  push_utf8_constant("ConstantValue", &out); // #7
  out.push_back(3); // #8 Integer
  push_be32((uint32_t)value, &out);
  out.push_back(5); // #9 Long, takes #10 too
  push_be32(0, &out);
  push_be32(42, &out);
  push_utf8_constant("other", &out); // #11

  push_be16(0x0021, &out); // public super
  push_be16(2, &out);
  push_be16(4, &out);
  push_be16(0, &out); // interfaces

  push_be16(2, &out); // fields
  for (uint16_t name : {11, 5}) {
    push_be16(0x0019, &out); // public static final
    push_be16(name, &out);
    push_be16(6, &out);
    push_be16(1, &out); // attributes
    push_be16(7, &out);
    push_be32(2, &out);
    push_be16(8, &out);
  }
  push_be16(0, &out); // methods
  push_be16(0, &out); // attributes
  return out;
}
