#include "Sur.h"
#include "XmlTree.h"

using namespace sur;

Sur::Sur(const string& filename_): filename(filename_) {
  xmltree::Document doc(filename);
  load(doc.root());
}

std::unique_ptr<Sur>
Sur::parse(const string& text, const string& name) {
  std::unique_ptr<xmltree::Document> doc = xmltree::Document::parse(text, name);
  std::unique_ptr<Sur> s(new Sur);
  s->filename = name;
  s->load(doc->root());
  return s;
}

void
Sur::load(const xmltree::Element& root) {
  if (root.tag() != "SEGMENT_UPDATE_REQUEST")
    throw UnsupportedSchema("Root element of " + filename + " is " + root.tag()
			    + ", not SEGMENT_UPDATE_REQUEST");
  creator = requireAttribute(root, "creator");
  date = requireAttribute(root, "date");
  time = requireAttribute(root, "time");
  version = requireAttribute(root, "version");
  operational = requireAttribute(root, "operational");

  // Last occurrence wins if repeated
  for (auto& e : root.iter("CONFIGURATION_NAME"))
    configurationName = e.text();
  for (auto& e : root.iter("CORRECTION_ID"))
    correctionId = e.text();

  for (auto& grp : root.iter("GROUP")) {
    Group g;
    for (auto& update : grp.iter("UPDATE"))
      g.push_back(SegmentUpdate(update));
    groups.push_back(g);
  }
}

int
Sur::nUpdates() const {
  int n = 0;
  for (auto& g : groups) n += g.size();
  return n;
}

string
Sur::str() const {
  ostringstream oss;
  oss << "SUR " << filename << "\n";
  for (int i=0; i<groups.size(); i++) {
    oss << "\tGroup " << i+1 << "\n";
    for (auto& u : groups[i])
      oss << "\t\t" << u.str() << "\n";
  }
  return oss.str();
}

string
Sur::xmltext() const {
  using xmltree::escape;
  ostringstream oss;
  oss << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>\n"
      << "<SEGMENT_UPDATE_REQUEST creator=\"" << escape(creator)
      << "\" date=\"" << escape(date)
      << "\" time=\"" << escape(time)
      << "\" version=\"" << escape(version)
      << "\" operational=\"" << escape(operational)
      << "\" xmlns:xsi=\"http://www.w3.org/2001/XMLSchema-instance\""
      << " xsi:noNamespaceSchemaLocation=\"../../setup_files/schema/segment_update_request.xsd\">\n"
      << "    <CONFIGURATION_NAME>" << escape(configurationName) << "</CONFIGURATION_NAME>\n"
      << "    <CORRECTION_ID>" << escape(correctionId) << "</CORRECTION_ID>\n";
  for (int i=0; i<groups.size(); i++) {
    oss << "    <GROUP id=\"" << i+1 << "\">\n";
    for (auto& u : groups[i])
      oss << u.xmltext();
    oss << "    </GROUP>\n";
  }
  oss << "</SEGMENT_UPDATE_REQUEST>";
  return oss.str();
}
