/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "utils/Dump.h"

#include <boost/format.hpp>
#include <sstream>

namespace arsc {

namespace {

std::string hex(uint32_t v) { return (boost::format("0x%08x") % v).str(); }

void show_node(std::ostream& out, const ResXmlNodeHeader& node) {
  out << " line=" << node.line_number;
  if (node.comment != NO_STRING) {
    out << " comment=" << node.comment;
  }
}

void show_entry(std::ostream& out,
                const std::string& indent,
                size_t index,
                const ResTableEntry& entry) {
  out << indent << "entry " << index << " key=" << entry.key;
  if ((entry.flags & ResTableEntry::FLAG_PUBLIC) != 0) {
    out << " public";
  }
  if ((entry.flags & ResTableEntry::FLAG_WEAK) != 0) {
    out << " weak";
  }
  if (auto value = entry.simple()) {
    out << " " << *value << "\n";
    return;
  }
  auto complex = entry.complex();
  out << " parent=" << hex(complex->header.parent)
      << " count=" << complex->entries.size() << "\n";
  for (const auto& map : complex->entries) {
    out << indent << "  " << hex(map.name) << " = " << map.value << "\n";
  }
}

void show_chunk(std::ostream& out, const Chunk& chunk, size_t depth) {
  std::string indent(depth * 2, ' ');
  out << indent << chunk_type_name(chunk.type());
  if (auto pool = chunk.get_if<StringPoolChunk>()) {
    out << " strings=" << pool->strings.size()
        << " styles=" << pool->styles.size() << "\n";
    for (size_t i = 0; i < pool->strings.size(); i++) {
      out << indent << "  " << i << ": \"" << pool->strings[i] << "\"";
      if (i < pool->styles.size()) {
        for (const auto& span : pool->styles[i]) {
          out << " <" << span.name << " " << span.first_char << "-"
              << span.last_char << ">";
        }
      }
      out << "\n";
    }
  } else if (auto table = chunk.get_if<TableChunk>()) {
    out << " packages=" << table->header.package_count << "\n";
    for (const auto& child : table->children) {
      show_chunk(out, child, depth + 1);
    }
  } else if (auto xml = chunk.get_if<XmlChunk>()) {
    out << "\n";
    for (const auto& child : xml->children) {
      show_chunk(out, child, depth + 1);
    }
  } else if (auto ns = chunk.get_if<XmlStartNamespaceChunk>()) {
    show_node(out, ns->node);
    out << " prefix=" << ns->ns.prefix << " uri=" << ns->ns.uri << "\n";
  } else if (auto end_ns = chunk.get_if<XmlEndNamespaceChunk>()) {
    show_node(out, end_ns->node);
    out << " prefix=" << end_ns->ns.prefix << " uri=" << end_ns->ns.uri
        << "\n";
  } else if (auto element = chunk.get_if<XmlStartElementChunk>()) {
    show_node(out, element->node);
    const auto& e = element->element;
    out << " ns=" << e.ns << " name=" << e.name
        << " attributes=" << element->attributes.size() << " id=" << e.id_index
        << " class=" << e.class_index << " style=" << e.style_index << "\n";
    for (const auto& attr : element->attributes) {
      out << indent << "  attr ns=" << attr.ns << " name=" << attr.name
          << " raw=" << attr.raw_value << " " << attr.typed_value << "\n";
    }
  } else if (auto end = chunk.get_if<XmlEndElementChunk>()) {
    show_node(out, end->node);
    out << " ns=" << end->element.ns << " name=" << end->element.name << "\n";
  } else if (auto map = chunk.get_if<XmlResourceMapChunk>()) {
    out << " ids=" << map->ids.size() << "\n";
    for (size_t i = 0; i < map->ids.size(); i++) {
      out << indent << "  " << i << ": " << hex(map->ids[i]) << "\n";
    }
  } else if (auto package = chunk.get_if<TablePackageChunk>()) {
    out << " id=" << (boost::format("0x%02x") % package->header.id).str()
        << " name=" << package->header.name << "\n";
    for (const auto& child : package->children) {
      show_chunk(out, child, depth + 1);
    }
  } else if (auto type = chunk.get_if<TableTypeChunk>()) {
    out << " id=" << (uint32_t)type->type_id
        << " entries=" << type->entries.size() << " "
        << show(type->config) << "\n";
    for (size_t i = 0; i < type->entries.size(); i++) {
      if (type->entries[i]) {
        show_entry(out, indent + "  ", i, *type->entries[i]);
      }
    }
  } else if (auto spec = chunk.get_if<TableTypeSpecChunk>()) {
    out << " id=" << (uint32_t)spec->type_id
        << " entries=" << spec->flags.size() << "\n";
    for (size_t i = 0; i < spec->flags.size(); i++) {
      out << indent << "  " << i << ": " << hex(spec->flags[i]) << "\n";
    }
  } else {
    out << "\n";
  }
}

} // namespace

std::string show(const Chunk& chunk) {
  std::ostringstream out;
  show_chunk(out, chunk, 0);
  return out.str();
}

std::string show(const ResValue& value) {
  std::ostringstream out;
  out << "(" << value_type_name(value.data_type) << ") ";
  switch (static_cast<ResValueType>(value.data_type)) {
  case ResValueType::IntDec:
    out << (int32_t)value.data;
    break;
  case ResValueType::IntBoolean:
    out << (value.data != 0 ? "true" : "false");
    break;
  case ResValueType::String:
    out << "string " << value.data;
    break;
  default:
    out << hex(value.data);
    break;
  }
  return out.str();
}

std::string show(const ResTableConfig& config) {
  std::ostringstream out;
  out << "config(size=" << config.size;
  if (config.locale != 0) {
    out << " locale=" << hex(config.locale);
  }
  if (config.screen_type.density != 0) {
    out << " density=" << config.screen_type.density;
  }
  if (config.screen_size != 0) {
    out << " screen=" << hex(config.screen_size);
  }
  if (config.version != 0) {
    out << " version=" << hex(config.version);
  }
  out << ")";
  return out.str();
}

std::ostream& operator<<(std::ostream& out, const Chunk& chunk) {
  show_chunk(out, chunk, 0);
  return out;
}

std::ostream& operator<<(std::ostream& out, const ResValue& value) {
  return out << show(value);
}

} // namespace arsc
