#include "ApertureFields.h"
#include "SiafCore.h"
#include "StringStuff.h"

using namespace siaf;

/////////////////////////////////////////////////////////////////////
// FieldValue
/////////////////////////////////////////////////////////////////////

FieldValue
FieldValue::makeNumber(double d) {
  FieldValue v;
  v.kind = Number;
  v.number = d;
  return v;
}

FieldValue
FieldValue::makeText(const string& s) {
  FieldValue v;
  v.kind = Text;
  v.text = s;
  return v;
}

FieldValue
FieldValue::makeAngle(double radians) {
  FieldValue v;
  v.kind = Angle;
  v.number = radians;
  return v;
}

FieldValue
FieldValue::makeArray(const vector<double>& a) {
  FieldValue v;
  v.kind = Array;
  v.array = a;
  return v;
}

double
FieldValue::getNumber() const {
  if (!isNumeric())
    throw SiafError("FieldValue::getNumber() on non-numeric field");
  return number;
}

const string&
FieldValue::getText() const {
  if (kind!=Text)
    throw SiafError("FieldValue::getText() on non-text field");
  return text;
}

const vector<double>&
FieldValue::getArray() const {
  if (kind!=Array)
    throw SiafError("FieldValue::getArray() on non-array field");
  return array;
}

void
FieldValue::write(YAML::Emitter& os) const {
  switch (kind) {
  case Number:
    os << number;
    break;
  case Text:
    os << text;
    break;
  case Angle:
    os << YAML::BeginMap
       << YAML::Key << "Radians" << YAML::Value << number
       << YAML::EndMap;
    break;
  case Array:
    os << YAML::Flow << array;
    break;
  }
}

FieldValue
FieldValue::create(const YAML::Node& node) {
  if (node.IsSequence())
    return makeArray(node.as<vector<double> >());
  if (node.IsMap()) {
    if (!node["Radians"])
      throw UnsupportedSchema("YAML metadata map without <Radians> key");
    return makeAngle(node["Radians"].as<double>());
  }
  if (node.IsNull())
    return makeText("");
  string s = node.as<string>();
  double d;
  if (stringstuff::parseDouble(s, d))
    return makeNumber(d);
  return makeText(s);
}

std::ostream&
siaf::operator<<(std::ostream& os, const FieldValue& v) {
  switch (v.getKind()) {
  case FieldValue::Number:
    os << v.getNumber();
    break;
  case FieldValue::Text:
    os << v.getText();
    break;
  case FieldValue::Angle:
    os << v.getNumber() << " rad";
    break;
  case FieldValue::Array:
    {
      const vector<double>& a = v.getArray();
      os << "[";
      for (int i=0; i<a.size(); i++) {
	if (i>0) os << ", ";
	os << a[i];
      }
      os << "]";
    }
    break;
  }
  return os;
}

/////////////////////////////////////////////////////////////////////
// ApertureFields
/////////////////////////////////////////////////////////////////////

FieldValue
ApertureFields::parseNode(const xmltree::Element& node) {
  if (!node.hasChildren()) {
    string text = node.text();
    double d;
    if (stringstuff::parseDouble(text, d))
      return FieldValue::makeNumber(d);
    stringstuff::stripWhite(text);
    return FieldValue::makeText(text);
  }

  if (node.hasChild("units")) {
    string units = node.child("units").text();
    stringstuff::stripWhite(units);
    if (!node.hasChild("value"))
      FormatAndThrow<UnsupportedSchema>() << "Angle node <" << node.tag()
					  << "> at line " << node.line()
					  << " has no <value>";
    string text = node.child("value").text();
    double d;
    if (!stringstuff::parseDouble(text, d))
      FormatAndThrow<UnsupportedSchema>() << "Non-numeric angle value <" << text
					  << "> for <" << node.tag() << ">";
    return FieldValue::makeAngle(d * radiansPerUnit(units));
  }

  if (node.hasChild("elt")) {
    vector<double> v;
    for (auto& e : node.children("elt")) {
      string text = e.text();
      double d;
      if (!stringstuff::parseDouble(text, d))
	FormatAndThrow<UnsupportedSchema>() << "Non-numeric array element <" << text
					    << "> in <" << node.tag() << ">";
      v.push_back(d);
    }
    return FieldValue::makeArray(v);
  }

  FormatAndThrow<UnsupportedSchema>() << "Cannot parse nested node <" << node.tag()
				      << "> at line " << node.line();
  return FieldValue();
}

ApertureFields::ApertureFields(const xmltree::Element& entry) {
  for (auto& node : entry.children()) {
    string tag = node.tag();
    if (fields.count(tag))
      FormatAndThrow<UnsupportedSchema>() << "Repeated field <" << tag
					  << "> at line " << node.line();
    fields[tag] = parseNode(node);
  }
}

const FieldValue&
ApertureFields::get(const string& name) const {
  auto i = fields.find(name);
  if (i==fields.end())
    throw UnsupportedSchema("Missing field <" + name + ">");
  return i->second;
}

double
ApertureFields::requireNumber(const string& name) const {
  const FieldValue& v = get(name);
  if (!v.isNumeric())
    throw UnsupportedSchema("Field <" + name + "> is not numeric");
  return v.getNumber();
}

string
ApertureFields::requireText(const string& name) const {
  const FieldValue& v = get(name);
  if (v.getKind()==FieldValue::Text)
    return v.getText();
  if (v.getKind()==FieldValue::Number) {
    // Names that happen to look like numbers
    ostringstream oss;
    oss << v.getNumber();
    return oss.str();
  }
  throw UnsupportedSchema("Field <" + name + "> is not text");
}
