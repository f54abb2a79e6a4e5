#include "SiafCore.h"

using namespace siaf;

Frame
siaf::parseFrame(const string& name) {
  if (name=="Det") return Det;
  if (name=="Sci") return Sci;
  if (name=="Idl") return Idl;
  if (name=="Tel") return Tel;
  throw InvalidFrameName("<" + name + ">, expected one of Det, Sci, Idl, Tel");
}

string
siaf::frameName(Frame f) {
  switch (f) {
  case Det: return "Det";
  case Sci: return "Sci";
  case Idl: return "Idl";
  case Tel: return "Tel";
  default:
    FormatAndThrow<SiafError>() << "Bad Frame value " << static_cast<int>(f);
  }
  return "";
}

double
siaf::radiansPerUnit(const string& units) {
  if (units=="RADIANS") return 1.;
  if (units=="DEGREES") return DEGREE;
  if (units=="ARCSECS") return ARCSEC;
  throw UnsupportedSchema("Unknown angle units <" + units + ">");
}
