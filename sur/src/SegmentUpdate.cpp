#include "SegmentUpdate.h"
#include "StringStuff.h"
#include <algorithm>
#include <limits>

using namespace sur;

const vector<string>&
sur::axisNames() {
  static const vector<string> names = {"X_TRANS", "Y_TRANS", "PISTON",
				       "X_TILT", "Y_TILT", "CLOCK"};
  return names;
}

string
sur::requireAttribute(const xmltree::Element& node, const string& name) {
  if (!node.hasAttribute(name))
    FormatAndThrow<UnsupportedSchema>() << "Missing attribute <" << name
					<< "> of " << node.tag()
					<< " at line " << node.line();
  return node.attribute(name);
}

SegmentUpdate::SegmentUpdate(const xmltree::Element& node) {
  type = requireAttribute(node, "type");
  if (type != "pose")
    FormatAndThrow<UnsupportedUpdateType>() << "<" << type
					    << ">, only pose updates are supported (line "
					    << node.line() << ")";

  string idString = requireAttribute(node, "id");
  {
    istringstream iss(idString);
    string extra;
    if (!(iss >> id) || (iss >> extra))
      throw UnsupportedSchema("Bad UPDATE id <" + idString + ">");
  }
  segment = requireAttribute(node, "seg_id").substr(0,2);
  absolute = requireAttribute(node, "absolute")=="true";
  coord = requireAttribute(node, "coord");
  stageType = requireAttribute(node, "stage_type");

  const vector<string>& axes = axisNames();
  for (auto& move : node.children()) {
    string axis = move.tag();
    if (std::find(axes.begin(), axes.end(), axis)==axes.end())
      FormatAndThrow<UnsupportedSchema>() << "Unknown move axis <" << axis
					  << "> in update " << id;
    double value;
    if (!stringstuff::parseDouble(move.text(), value))
      FormatAndThrow<UnsupportedSchema>() << "Bad value <" << move.text()
					  << "> for " << axis << " in update " << id;
    moves[axis] = value;
    units[axis] = requireAttribute(move, "units");
  }
}

const Moves&
SegmentUpdate::toGlobal() const {
  if (coord != "global")
    throw NotSupported("conversion of update " + segment + " from "
		       + coord + " to global coordinates");
  return moves;
}

const Moves&
SegmentUpdate::toLocal() const {
  if (coord != "local")
    throw NotSupported("conversion of update " + segment + " from "
		       + coord + " to local coordinates");
  return moves;
}

string
SegmentUpdate::str() const {
  ostringstream oss;
  oss << "Update " << id << ", " << (absolute ? "absolute" : "relative")
      << ", " << coord << ": {";
  bool first = true;
  for (auto& m : moves) {
    if (!first) oss << ", ";
    first = false;
    oss << m.first << ": " << m.second;
  }
  oss << "}";
  return oss.str();
}

string
SegmentUpdate::shortstr() const {
  static const char* order[] = {"PISTON", "X_TRANS", "Y_TRANS",
				"CLOCK", "X_TILT", "Y_TILT", 0};
  ostringstream oss;
  oss << "Update " << id << ": " << segment << ", "
      << (absolute ? "absolute" : "relative") << ", " << coord << " {";
  oss << std::setprecision(3);
  for (int i=0; order[i]; i++) {
    if (i>0) oss << ", ";
    auto m = moves.find(order[i]);
    double v = m==moves.end() ? std::numeric_limits<double>::quiet_NaN() : m->second;
    oss << order[i] << "=" << v;
  }
  oss << "}";
  return oss.str();
}

string
SegmentUpdate::xmltext() const {
  ostringstream oss;
  oss << "        <UPDATE id=\"" << id
      << "\" type=\"" << xmltree::escape(type)
      << "\" seg_id=\"" << xmltree::escape(segment)
      << "\" absolute=\"" << (absolute ? "true" : "false")
      << "\" coord=\"" << xmltree::escape(coord)
      << "\" stage_type=\"" << xmltree::escape(stageType)
      << "\">\n";
  // Same layout as printf's %E
  oss << std::scientific << std::uppercase << std::setprecision(6);
  for (auto& axis : axisNames()) {
    auto m = moves.find(axis);
    if (m==moves.end()) continue;
    oss << "            <" << axis << "  units=\"" << xmltree::escape(units.at(axis))
	<< "\">" << m->second << "</" << axis << ">\n";
  }
  oss << "        </UPDATE>\n";
  return oss.str();
}

std::ostream&
sur::operator<<(std::ostream& os, const SegmentUpdate& u) {
  os << u.str();
  return os;
}
