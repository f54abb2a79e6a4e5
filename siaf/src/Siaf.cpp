// Reading, lookup and serialization of a SIAF aperture collection
#include "Siaf.h"
#include "StringStuff.h"
#include "XmlTree.h"
#include "yaml-cpp/yaml.h"
#include <algorithm>

using namespace siaf;

const string
Siaf::magicKey = "SiafCollection";

const vector<string>&
Siaf::instrumentNames() {
  static const vector<string> names = {"NIRCam", "NIRSpec", "NIRISS", "MIRI", "FGS"};
  return names;
}

bool
Siaf::isInstrument(const string& instrument) {
  const vector<string>& names = instrumentNames();
  return std::find(names.begin(), names.end(), instrument) != names.end();
}

string
Siaf::fileNameFor(const string& instrument) {
  if (!isInstrument(instrument))
    throw InvalidInstrument(instrument + " (names are case-sensitive)");
  return instrument + (instrument=="NIRISS" ? "_" : "") + "SIAF.XML";
}

Siaf::Siaf(const string& instrument, const string& basePath): instr(instrument) {
  // Name check comes before any file access
  string file = fileNameFor(instrument);
  if (basePath.empty()) {
    fname = stringstuff::findFileOnPath(file, "SIAF_PATH");
    if (fname.empty())
      throw SiafError("Cannot find " + file + " on SIAF_PATH");
  } else {
    fname = basePath + "/" + file;
  }

  xmltree::Document doc(fname);
  for (auto& entry : doc.root().iter("SiafEntry")) {
    try {
      add(new Aperture(entry));
    } catch (SiafError& e) {
      FormatAndThrow<UnsupportedSchema>() << "in " << fname
					  << " entry at line " << entry.line()
					  << ": " << e.getDetail();
    }
  }
}

void
Siaf::add(Aperture* ap) {
  std::unique_ptr<Aperture> owned(ap);
  if (has(ap->getName()))
    throw UnsupportedSchema("Duplicate aperture name " + ap->getName());
  apertures[ap->getName()] = std::move(owned);
}

const Aperture&
Siaf::find(const string& name) const {
  auto i = apertures.find(name);
  if (i==apertures.end())
    throw SiafError("No aperture " + name + " in SIAF for " + instr);
  return *(i->second);
}

vector<string>
Siaf::apertureNames() const {
  // map keys come out sorted
  vector<string> out;
  for (auto& a : apertures)
    out.push_back(a.first);
  return out;
}

void
Siaf::plot(PlotSurface& surface, Frame frame, const vector<string>& names,
	   bool label, const string& units) const {
  // Check units before drawing anything
  Aperture::unitScale(units);
  for (auto& a : apertures) {
    if (!names.empty()
	&& std::find(names.begin(), names.end(), a.first)==names.end())
      continue;
    a.second->drawOutline(surface, frame, label, units);
  }
  string xlabel, ylabel;
  Aperture::axisLabels(frame, units, xlabel, ylabel);
  surface.setAxisLabels(xlabel, ylabel);
  if (frame==Tel || frame==Idl)
    surface.flipXAxis();
  surface.setTitle(frameName(frame) + " frame");
}

/////////////////////////////////////////////////////////////////////
// YAML (de-)serialization
/////////////////////////////////////////////////////////////////////

void
Siaf::write(std::ostream& os, const string& comment) const {
  YAML::Emitter out;
  out << YAML::BeginMap;
  if (comment.size()>0)
    out << YAML::Comment(comment);
  out << YAML::Key << magicKey
      << YAML::Value << "This is a serialized SIAF"
      << YAML::Key << "Instrument" << YAML::Value << instr
      << YAML::Key << "Apertures" << YAML::Value
      << YAML::BeginMap;
  for (auto& a : apertures) {
    out << YAML::Key << a.first << YAML::Value;
    a.second->write(out);
  }
  out << YAML::EndMap
      << YAML::EndMap;
  os << out.c_str() << endl;
}

bool
Siaf::read(std::istream& is) {
  YAML::Node root = YAML::Load(is);
  if (!root.IsMap() || !root[magicKey]) {
    // Valid YAML but not one of ours
    return false;
  }
  if (root["Instrument"])
    instr = root["Instrument"].as<string>();
  if (!root["Apertures"])
    return true;
  const YAML::Node& aps = root["Apertures"];
  if (!aps.IsMap())
    throw UnsupportedSchema("YAML node <Apertures> is not a map");
  for (YAML::const_iterator i = aps.begin(); i != aps.end(); ++i) {
    string key = i->first.as<string>();
    Aperture* ap = Aperture::create(i->second, key);
    if (ap->getName() != key) {
      string apName = ap->getName();
      delete ap;
      throw UnsupportedSchema("YAML aperture key " + key + " holds aperture " + apName);
    }
    add(ap);
  }
  return true;
}
