// libxml2-backed implementation of the XML tree view
#include "XmlTree.h"

#include <libxml/parser.h>
#include <libxml/xmlerror.h>

#include "Std.h"
#include "StringStuff.h"

using namespace xmltree;

namespace {
  // Quiet, local-only parsing; errors come back through xmlGetLastError()
  const int PARSE_OPTIONS = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;

  string lastErrorMessage() {
    const xmlError* err = xmlGetLastError();
    if (!err || !err->message) return "unknown parser error";
    string m(err->message);
    stripWhite(m);
    ostringstream oss;
    oss << m << " (line " << err->line << ")";
    return oss.str();
  }

  string toString(const xmlChar* s) {
    return s ? string(reinterpret_cast<const char*>(s)) : string();
  }
}

/////////////////////////////////////////////////////////////////////
// Document
/////////////////////////////////////////////////////////////////////

Document::Document(const string& filename): doc(0), name(filename) {
  xmlInitParser();
  xmlResetLastError();
  doc = xmlReadFile(filename.c_str(), NULL, PARSE_OPTIONS);
  if (!doc)
    throw XmlError("Could not parse file " + filename + ": " + lastErrorMessage());
  if (!xmlDocGetRootElement(doc)) {
    xmlFreeDoc(doc);
    throw XmlError("No root element in file " + filename);
  }
}

Document::Document(xmlDocPtr doc_, const string& name_): doc(doc_), name(name_) {}

std::unique_ptr<Document>
Document::parse(const string& text, const string& name) {
  xmlInitParser();
  xmlResetLastError();
  xmlDocPtr d = xmlReadMemory(text.data(), static_cast<int>(text.size()),
			      name.c_str(), NULL, PARSE_OPTIONS);
  if (!d)
    throw XmlError("Could not parse " + name + ": " + lastErrorMessage());
  if (!xmlDocGetRootElement(d)) {
    xmlFreeDoc(d);
    throw XmlError("No root element in " + name);
  }
  return std::unique_ptr<Document>(new Document(d, name));
}

Document::~Document() {
  if (doc) xmlFreeDoc(doc);
}

Element
Document::root() const {
  return Element(xmlDocGetRootElement(doc));
}

/////////////////////////////////////////////////////////////////////
// Element
/////////////////////////////////////////////////////////////////////

Element::Element(xmlNodePtr node_): node(node_) {
  Assert(node && node->type==XML_ELEMENT_NODE);
}

string
Element::tag() const {
  // libxml2 keeps the namespace apart from the local name
  return toString(node->name);
}

long
Element::line() const {
  return xmlGetLineNo(node);
}

bool
Element::hasAttribute(const string& name) const {
  return xmlHasProp(node, BAD_CAST name.c_str()) != NULL;
}

string
Element::attribute(const string& name) const {
  xmlChar* v = xmlGetProp(node, BAD_CAST name.c_str());
  if (!v)
    FormatAndThrow<XmlError>() << "Missing attribute <" << name << "> of element "
			       << tag() << " at line " << line();
  string out = toString(v);
  xmlFree(v);
  return out;
}

std::map<string,string>
Element::attributes() const {
  std::map<string,string> out;
  for (xmlAttrPtr a = node->properties; a; a = a->next) {
    string key = toString(a->name);
    out[key] = attribute(key);
  }
  return out;
}

string
Element::text() const {
  string out;
  for (xmlNodePtr c = node->children; c; c = c->next) {
    if (c->type==XML_TEXT_NODE || c->type==XML_CDATA_SECTION_NODE)
      out += toString(c->content);
  }
  return out;
}

vector<Element>
Element::children() const {
  vector<Element> out;
  for (xmlNodePtr c = node->children; c; c = c->next)
    if (c->type==XML_ELEMENT_NODE) out.push_back(Element(c));
  return out;
}

vector<Element>
Element::children(const string& tag) const {
  vector<Element> out;
  for (xmlNodePtr c = node->children; c; c = c->next)
    if (c->type==XML_ELEMENT_NODE && toString(c->name)==tag) out.push_back(Element(c));
  return out;
}

bool
Element::hasChildren() const {
  for (xmlNodePtr c = node->children; c; c = c->next)
    if (c->type==XML_ELEMENT_NODE) return true;
  return false;
}

bool
Element::hasChild(const string& tag) const {
  for (xmlNodePtr c = node->children; c; c = c->next)
    if (c->type==XML_ELEMENT_NODE && toString(c->name)==tag) return true;
  return false;
}

Element
Element::child(const string& tag) const {
  for (xmlNodePtr c = node->children; c; c = c->next)
    if (c->type==XML_ELEMENT_NODE && toString(c->name)==tag) return Element(c);
  FormatAndThrow<XmlError>() << "Missing child <" << tag << "> of element "
			     << this->tag() << " at line " << line();
  return *this;  // not reached
}

void
Element::collect(xmlNodePtr n, const string& tag, vector<Element>& out) const {
  if (toString(n->name)==tag) out.push_back(Element(n));
  for (xmlNodePtr c = n->children; c; c = c->next)
    if (c->type==XML_ELEMENT_NODE) collect(c, tag, out);
}

vector<Element>
Element::iter(const string& tag) const {
  vector<Element> out;
  collect(node, tag, out);
  return out;
}

string
xmltree::escape(const string& s) {
  string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
    case '&': out += "&amp;"; break;
    case '<': out += "&lt;"; break;
    case '>': out += "&gt;"; break;
    case '"': out += "&quot;"; break;
    case '\'': out += "&apos;"; break;
    default: out += c;
    }
  }
  return out;
}
