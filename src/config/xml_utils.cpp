#include "config/xml_utils.h"

#include <stdexcept>
#include <sstream>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlschemas.h>

namespace {

struct LibXmlInit {
  LibXmlInit() { xmlInitParser(); }
  ~LibXmlInit() { xmlCleanupParser(); }
};
LibXmlInit g_init;

xmlNode* root(xmlDocPtr doc) {
  return xmlDocGetRootElement(doc);
}

std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> parts;
  std::istringstream in(path);
  std::string seg;
  while (std::getline(in, seg, '/')) {
    if (!seg.empty()) parts.push_back(seg);
  }
  return parts;
}

bool is_element(xmlNode* n, const std::string& name) {
  return n->type == XML_ELEMENT_NODE && name == reinterpret_cast<const char*>(n->name);
}

xmlNode* find_child(xmlNode* parent, const std::string& name) {
  for (xmlNode* n = parent ? parent->children : nullptr; n; n = n->next) {
    if (is_element(n, name)) return n;
  }
  return nullptr;
}

// Strip a leading root-name segment so "Engine/Index/CellSizeMeters" and
// "Index/CellSizeMeters" address the same node.
std::vector<std::string> relative_parts(xmlNode* r, const std::string& path) {
  auto parts = split_path(path);
  if (r && !parts.empty() && parts[0] == reinterpret_cast<const char*>(r->name)) {
    parts.erase(parts.begin());
  }
  return parts;
}

xmlNode* descend(xmlNode* n, std::vector<std::string>::const_iterator first,
                 std::vector<std::string>::const_iterator last) {
  for (auto it = first; n && it != last; ++it) n = find_child(n, *it);
  return n;
}

xmlNode* find_path(xmlDocPtr doc, const std::string& path) {
  xmlNode* r = root(doc);
  if (!r) return nullptr;
  const auto parts = relative_parts(r, path);
  return descend(r, parts.begin(), parts.end());
}

// First schema error seen during one validation, with its line number.
struct SchemaErrors {
  int count = 0;
  std::string first;
};

void collect_schema_error(void* ctx, xmlErrorPtr err) {
  auto* errs = static_cast<SchemaErrors*>(ctx);
  if (!errs || !err) return;
  if (errs->count++ == 0) {
    std::ostringstream oss;
    oss << "line " << err->line << ": " << (err->message ? err->message : "unknown error");
    errs->first = oss.str();
    while (!errs->first.empty() && (errs->first.back() == '\n' || errs->first.back() == ' ')) {
      errs->first.pop_back();
    }
  }
}

// Copies and releases a libxml-owned string.
std::string take(xmlChar* raw) {
  if (!raw) return "";
  std::string s(reinterpret_cast<const char*>(raw));
  xmlFree(raw);
  return s;
}

std::string trimmed(const std::string& s) {
  const auto l = s.find_first_not_of(" \t\r\n");
  if (l == std::string::npos) return "";
  const auto r = s.find_last_not_of(" \t\r\n");
  return s.substr(l, r - l + 1);
}

std::string node_text(xmlNode* n) {
  return n ? trimmed(take(xmlNodeGetContent(n))) : std::string();
}

std::string node_attr(xmlNode* n, const std::string& attr) {
  return n ? take(xmlGetProp(n, reinterpret_cast<const xmlChar*>(attr.c_str()))) : std::string();
}

double to_double(const std::string& s, double defv, const std::string& where) {
  if (s.empty()) return defv;
  std::size_t used = 0;
  double v = 0.0;
  try {
    v = std::stod(s, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid number '" + s + "' at " + where);
  }
  if (used != s.size()) throw std::runtime_error("Invalid number '" + s + "' at " + where);
  return v;
}

int to_int(const std::string& s, int defv, const std::string& where) {
  if (s.empty()) return defv;
  std::size_t used = 0;
  int v = 0;
  try {
    v = std::stoi(s, &used);
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid integer '" + s + "' at " + where);
  }
  if (used != s.size()) throw std::runtime_error("Invalid integer '" + s + "' at " + where);
  return v;
}

bool to_bool_text(const std::string& s, bool defv, const std::string& where) {
  if (s.empty()) return defv;
  if (s == "true" || s == "1" || s == "TRUE") return true;
  if (s == "false" || s == "0" || s == "FALSE") return false;
  throw std::runtime_error("Invalid boolean '" + s + "' at " + where);
}

} // namespace

namespace cfg::xmlu {

void* ReadXmlDocOrThrow(const std::string& xml_path) {
  xmlResetLastError();
  xmlDocPtr doc = xmlReadFile(xml_path.c_str(), nullptr, XML_PARSE_NONET | XML_PARSE_NOWARNING);
  if (!doc) {
    std::ostringstream oss;
    oss << "Failed to parse XML: " << xml_path;
    const xmlError* err = xmlGetLastError();
    if (err && err->message) oss << " (line " << err->line << ": " << trimmed(err->message) << ")";
    throw std::runtime_error(oss.str());
  }
  return reinterpret_cast<void*>(doc);
}

void FreeXmlDoc(void* doc) {
  if (doc) xmlFreeDoc(reinterpret_cast<xmlDocPtr>(doc));
}

std::string RootName(void* doc) {
  xmlDocPtr d = reinterpret_cast<xmlDocPtr>(doc);
  xmlNode* r = root(d);
  return r ? std::string(reinterpret_cast<const char*>(r->name)) : "";
}

void ValidateOrThrow(void* doc, const std::string& xsd_path, const std::string& xml_path_for_errors) {
  xmlDocPtr d = reinterpret_cast<xmlDocPtr>(doc);

  xmlSchemaParserCtxtPtr pctx = xmlSchemaNewParserCtxt(xsd_path.c_str());
  if (!pctx) {
    throw std::runtime_error("Failed to create XSD parser context: " + xsd_path);
  }

  xmlSchemaPtr schema = xmlSchemaParse(pctx);
  xmlSchemaFreeParserCtxt(pctx);
  if (!schema) {
    throw std::runtime_error("Failed to parse XSD: " + xsd_path);
  }

  xmlSchemaValidCtxtPtr vctx = xmlSchemaNewValidCtxt(schema);
  if (!vctx) {
    xmlSchemaFree(schema);
    throw std::runtime_error("Failed to create XSD validation context: " + xsd_path);
  }

  SchemaErrors errs;
  xmlSchemaSetValidStructuredErrors(vctx, &collect_schema_error, &errs);
  const int rc = xmlSchemaValidateDoc(vctx, d);

  xmlSchemaFreeValidCtxt(vctx);
  xmlSchemaFree(schema);

  if (rc != 0) {
    std::ostringstream oss;
    oss << "XSD validation failed for " << xml_path_for_errors << " using schema " << xsd_path;
    if (errs.count > 0) {
      oss << " (" << errs.count << " error" << (errs.count == 1 ? "" : "s") << ", first at " << errs.first << ")";
    } else {
      oss << " (rc=" << rc << ")";
    }
    throw std::runtime_error(oss.str());
  }
}

std::string GetText(void* doc, const std::string& path) {
  xmlDocPtr d = reinterpret_cast<xmlDocPtr>(doc);
  return node_text(find_path(d, path));
}

std::string GetAttr(void* doc, const std::string& path, const std::string& attr) {
  xmlDocPtr d = reinterpret_cast<xmlDocPtr>(doc);
  return node_attr(find_path(d, path), attr);
}

double GetDouble(void* doc, const std::string& path, double default_val) {
  return to_double(GetText(doc, path), default_val, path);
}

int GetInt(void* doc, const std::string& path, int default_val) {
  return to_int(GetText(doc, path), default_val, path);
}

bool GetBoolText(void* doc, const std::string& path, bool default_val) {
  return to_bool_text(GetText(doc, path), default_val, path);
}

std::vector<void*> FindNodes(void* doc, const std::string& path) {
  xmlNode* r = root(reinterpret_cast<xmlDocPtr>(doc));
  const auto parts = relative_parts(r, path);
  if (!r || parts.empty()) return {};
  return NodeChildren(descend(r, parts.begin(), parts.end() - 1), parts.back());
}

std::vector<void*> NodeChildren(void* node, const std::string& child_name) {
  std::vector<void*> out;
  xmlNode* parent = reinterpret_cast<xmlNode*>(node);
  for (xmlNode* n = parent ? parent->children : nullptr; n; n = n->next) {
    if (is_element(n, child_name)) out.push_back(reinterpret_cast<void*>(n));
  }
  return out;
}

std::string NodeGetAttr(void* node, const std::string& attr) {
  return node_attr(reinterpret_cast<xmlNode*>(node), attr);
}

std::string NodeGetTextChild(void* node, const std::string& child_name) {
  xmlNode* n = reinterpret_cast<xmlNode*>(node);
  return node_text(find_child(n, child_name));
}

double NodeGetDoubleChild(void* node, const std::string& child_name, double default_val) {
  return to_double(NodeGetTextChild(node, child_name), default_val, child_name);
}

int NodeGetIntChild(void* node, const std::string& child_name, int default_val) {
  return to_int(NodeGetTextChild(node, child_name), default_val, child_name);
}

} // namespace cfg::xmlu
