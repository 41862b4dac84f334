/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "XmlCompiler.h"

#include <algorithm>
#include <exception>
#include <expat.h>

#include "Debug.h"
#include "Mipmap.h"
#include "StringPoolBuilder.h"
#include "Trace.h"

namespace bxml {

namespace {

// Separates the namespace uri from the local name in expat's names. Spaces
// cannot appear in a uri.
constexpr char NS_SEPARATOR = ' ';

void split_name(const char* expat_name, std::string* ns, std::string* name) {
  std::string full(expat_name);
  auto pos = full.find(NS_SEPARATOR);
  if (pos == std::string::npos) {
    ns->clear();
    *name = full;
  } else {
    *ns = full.substr(0, pos);
    *name = full.substr(pos + 1);
  }
}

/*
 * Builds the element tree from expat's callbacks. Exceptions must not cross
 * the parser's C frames: a failing callback stores the exception and stops
 * the parser, and rethrow_if_failed() raises it once XML_Parse returns.
 */
class DomBuilder {
 public:
  explicit DomBuilder(XML_Parser parser) : m_parser(parser) {
    XML_SetUserData(parser, this);
    XML_SetElementHandler(parser, start_element, end_element);
    XML_SetNamespaceDeclHandler(parser, start_namespace, nullptr);
  }

  std::unique_ptr<XmlElement> take_root() { return std::move(m_root); }

  void rethrow_if_failed() const {
    if (m_error) {
      std::rethrow_exception(m_error);
    }
  }

 private:
  static void XMLCALL start_element(void* data,
                                    const XML_Char* name,
                                    const XML_Char** attrs) {
    auto builder = static_cast<DomBuilder*>(data);
    if (builder->m_error) {
      return;
    }
    try {
      builder->on_start_element(name, attrs);
    } catch (...) {
      builder->fail(std::current_exception());
    }
  }

  static void XMLCALL end_element(void* data, const XML_Char* /* name */) {
    auto builder = static_cast<DomBuilder*>(data);
    if (!builder->m_error) {
      builder->m_stack.pop_back();
    }
  }

  static void XMLCALL start_namespace(void* data,
                                      const XML_Char* prefix,
                                      const XML_Char* uri) {
    auto builder = static_cast<DomBuilder*>(data);
    if (builder->m_error) {
      return;
    }
    try {
      builder->m_pending_namespaces.emplace_back(
          prefix != nullptr ? prefix : "", uri != nullptr ? uri : "");
    } catch (...) {
      builder->fail(std::current_exception());
    }
  }

  void fail(std::exception_ptr error) {
    m_error = std::move(error);
    XML_StopParser(m_parser, XML_FALSE);
  }

  void on_start_element(const XML_Char* name, const XML_Char** attrs) {
    auto element = std::make_unique<XmlElement>();
    split_name(name, &element->ns, &element->name);
    element->line_number = XML_GetCurrentLineNumber(m_parser);
    element->namespaces = std::move(m_pending_namespaces);
    m_pending_namespaces.clear();
    for (size_t i = 0; attrs[i] != nullptr; i += 2) {
      XmlAttr attr;
      split_name(attrs[i], &attr.ns, &attr.name);
      attr.value = attrs[i + 1];
      element->attributes.push_back(std::move(attr));
    }
    // The binary element stores its attribute count in 16 bits.
    always_assert_type_log(element->attributes.size() <= 0xffff, INVALID_XML,
                           "<%s> at line %u has %zu attributes",
                           element->name.c_str(), element->line_number,
                           element->attributes.size());
    auto raw = element.get();
    if (m_stack.empty()) {
      m_root = std::move(element);
    } else {
      m_stack.back()->children.push_back(std::move(element));
    }
    m_stack.push_back(raw);
  }

  XML_Parser m_parser;
  std::exception_ptr m_error;
  std::unique_ptr<XmlElement> m_root;
  std::vector<XmlElement*> m_stack;
  std::vector<std::pair<std::string, std::string>> m_pending_namespaces;
};

void collect_strings(const XmlElement& element, StringPoolBuilder* strings) {
  for (const auto& ns : element.namespaces) {
    if (!ns.first.empty()) {
      strings->add_string(ns.first);
    }
    strings->add_string(ns.second);
  }
  if (!element.ns.empty()) {
    strings->add_string(element.ns);
  }
  strings->add_string(element.name);
  for (const auto& attr : element.attributes) {
    strings->add_attribute(attr);
  }
  for (const auto& child : element.children) {
    collect_strings(*child, strings);
  }
}

arsc::ResXmlNamespace compile_namespace(
    const std::pair<std::string, std::string>& ns,
    const StringPoolBuilder& strings) {
  arsc::ResXmlNamespace result;
  result.prefix = ns.first.empty() ? arsc::NO_STRING : strings.id(ns.first);
  result.uri = strings.id(ns.second);
  return result;
}

void compile_element(const XmlElement& element,
                     const arsc::Table& table,
                     const StringPoolBuilder& strings,
                     std::vector<arsc::Chunk>* chunks) {
  arsc::ResXmlNodeHeader node;
  node.line_number = element.line_number;

  std::vector<const XmlAttr*> sorted;
  for (const auto& attr : element.attributes) {
    sorted.push_back(&attr);
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const XmlAttr* a, const XmlAttr* b) {
                     return a->name < b->name;
                   });

  arsc::XmlStartElementChunk start;
  start.node = node;
  start.element.ns =
      element.ns.empty() ? arsc::NO_STRING : strings.id(element.ns);
  start.element.name = strings.id(element.name);
  for (size_t i = 0; i < sorted.size(); i++) {
    const auto& name = sorted[i]->name;
    uint16_t index = i + 1;
    if (name == "id") {
      start.element.id_index = index;
    } else if (name == "class") {
      start.element.class_index = index;
    } else if (name == "style") {
      start.element.style_index = index;
    }
    start.attributes.push_back(compile_attr(table, strings, *sorted[i]));
  }
  start.element.attribute_count = start.attributes.size();
  TRACE(BXML, 3, "<%s> with %zu attributes at line %u", element.name.c_str(),
        start.attributes.size(), node.line_number);

  arsc::XmlEndElementChunk end;
  end.node = node;
  end.element.ns = start.element.ns;
  end.element.name = start.element.name;

  chunks->emplace_back(std::move(start));
  for (const auto& child : element.children) {
    compile_element(*child, table, strings, chunks);
  }
  chunks->emplace_back(std::move(end));
}

} // namespace

std::unique_ptr<XmlElement> parse_xml(const std::string& xml) {
  std::unique_ptr<XML_ParserStruct, decltype(&XML_ParserFree)> parser(
      XML_ParserCreateNS(nullptr, NS_SEPARATOR), &XML_ParserFree);
  always_assert_log(parser != nullptr, "Unable to create xml parser");
  DomBuilder builder(parser.get());
  auto status = XML_Parse(parser.get(), xml.data(), (int)xml.size(), 1);
  builder.rethrow_if_failed();
  always_assert_type_log(status != XML_STATUS_ERROR, INVALID_XML,
                         "malformed xml at line %lu: %s",
                         (unsigned long)XML_GetCurrentLineNumber(parser.get()),
                         XML_ErrorString(XML_GetErrorCode(parser.get())));
  auto root = builder.take_root();
  always_assert_type_log(root != nullptr, INVALID_XML,
                         "xml document has no root element");
  return root;
}

arsc::Chunk compile_xml(const std::string& xml, const arsc::Table& table) {
  auto root = parse_xml(xml);
  TRACE(BXML, 1, "Compiling <%s>", root->name.c_str());

  StringPoolBuilder strings;
  collect_strings(*root, &strings);
  strings.build();

  arsc::XmlChunk result;
  result.children.emplace_back(strings.pool_chunk());
  result.children.emplace_back(strings.resource_map_chunk());

  arsc::ResXmlNodeHeader node;
  node.line_number = root->line_number;
  for (const auto& ns : root->namespaces) {
    arsc::XmlStartNamespaceChunk start;
    start.node = node;
    start.ns = compile_namespace(ns, strings);
    result.children.emplace_back(start);
  }
  compile_element(*root, table, strings, &result.children);
  for (auto it = root->namespaces.rbegin(); it != root->namespaces.rend();
       ++it) {
    arsc::XmlEndNamespaceChunk end;
    end.node = node;
    end.ns = compile_namespace(*it, strings);
    result.children.emplace_back(end);
  }
  return result;
}

CompiledManifest compile_manifest(
    const std::string& xml,
    const arsc::Table& table,
    const boost::optional<std::string>& icon_package) {
  CompiledManifest result;
  if (!icon_package) {
    result.manifest = compile_xml(xml, table);
    return result;
  }
  auto mipmap = compile_mipmap(*icon_package, "icon");
  arsc::Table with_icon = table;
  with_icon.import_chunk(mipmap.table);
  result.manifest = compile_xml(xml, with_icon);
  result.resources = std::move(mipmap.table);
  result.icon = mipmap.id;
  return result;
}

} // namespace bxml
