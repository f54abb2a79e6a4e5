// Read-only tree view of an XML document, on top of libxml2.
// The SIAF and SUR readers only need element tags, attributes,
// element children and text, so that is all this exposes.
// Tags are reported without any namespace prefix.
//
// Element objects are light handles into the Document that created them
// and must not outlive it.
#ifndef XMLTREE_H
#define XMLTREE_H

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include <libxml/tree.h>

namespace xmltree {

  class XmlError: public std::runtime_error {
  public:
    XmlError(const std::string &m=""):
      std::runtime_error("XML Error: " +m) {}
  };

  class Element {
  public:
    explicit Element(xmlNodePtr node_);
    std::string tag() const;
    // Line of the element in its source, for messages
    long line() const;

    bool hasAttribute(const std::string& name) const;
    // Throws XmlError if absent
    std::string attribute(const std::string& name) const;
    std::map<std::string,std::string> attributes() const;

    // Concatenation of the text directly inside this element
    std::string text() const;

    // Element children in document order, optionally only those with a tag
    std::vector<Element> children() const;
    std::vector<Element> children(const std::string& tag) const;
    bool hasChildren() const;
    bool hasChild(const std::string& tag) const;
    // First child with the tag; throws XmlError if there is none
    Element child(const std::string& tag) const;

    // This element and all elements below it with the tag, in document order
    std::vector<Element> iter(const std::string& tag) const;
  private:
    xmlNodePtr node;
    void collect(xmlNodePtr n, const std::string& tag, std::vector<Element>& out) const;
  };

  class Document {
  public:
    // Parse a file; throws XmlError if it cannot be read or is not well-formed
    explicit Document(const std::string& filename);
    // Parse XML held in memory; name is used in messages
    static std::unique_ptr<Document> parse(const std::string& text,
					   const std::string& name="<string>");
    ~Document();

    Element root() const;
    const std::string& getName() const {return name;}
  private:
    Document(xmlDocPtr doc_, const std::string& name_);
    xmlDocPtr doc;
    std::string name;
    // No copying:
    Document(const Document& rhs) =delete;
    void operator=(const Document& rhs) =delete;
  };

  // Escape &, <, >, " and ' for use in attribute values or element text
  std::string escape(const std::string& s);

} // namespace xmltree

#endif // XMLTREE_H
