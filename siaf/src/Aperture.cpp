// Aperture calibration and frame transformations
#include "Aperture.h"
#include "StringStuff.h"

using namespace siaf;
using linalg::DVector;
using linalg::DMatrix;

namespace {
  // Scalar calibration fields of a SiafEntry
  const char* calibrationFields[] = {"AperName", "XDetRef", "YDetRef", "XSciRef", "YSciRef",
				     "DetSciYAngle", "DetSciParity", "V2Ref", "V3Ref",
				     "V3IdlYAng", "VIdlParity", "Sci2IdlDeg", 0};

  // Angles may come as plain degrees or as tagged angles (radians)
  double degreesField(const ApertureFields& f, const string& name) {
    double v = f.requireNumber(name);
    return f.get(name).getKind()==FieldValue::Angle ? v / DEGREE : v;
  }
  // Positions on the sky may come as plain arcsec or as tagged angles
  double arcsecField(const ApertureFields& f, const string& name) {
    double v = f.requireNumber(name);
    return f.get(name).getKind()==FieldValue::Angle ? v * RadToArcsec : v;
  }

  string vertName(const string& prefix, int k) {
    ostringstream oss;
    oss << prefix << "Vert" << k;
    return oss.str();
  }

  string coeffName(const string& prefix, int i, int j) {
    ostringstream oss;
    oss << prefix << i << j;
    return oss.str();
  }

  vector<double> toStdVector(const DVector& v) {
    vector<double> out(v.size());
    for (int i=0; i<v.size(); i++) out[i] = v[i];
    return out;
  }

  typedef void (Aperture::*ScalarTransform)(double, double, double&, double&) const;

  void elementwise(const Aperture& ap, ScalarTransform f,
		   const DVector& x, const DVector& y,
		   DVector& xout, DVector& yout) {
    if (x.size()!=y.size())
      FormatAndThrow<std::invalid_argument>() << "Aperture " << ap.getName()
					      << " transform input lengths differ: "
					      << x.size() << " vs " << y.size();
    xout.resize(x.size());
    yout.resize(y.size());
    for (int k=0; k<x.size(); k++)
      (ap.*f)(x[k], y[k], xout[k], yout[k]);
  }
}

/////////////////////////////////////////////////////////////////////
// Construction from SIAF fields
/////////////////////////////////////////////////////////////////////

Aperture::Aperture(const ApertureFields& fields) {
  setFromFields(fields);
}

Aperture::Aperture(const xmltree::Element& entry) {
  setFromFields(ApertureFields(entry));
}

int
Aperture::parity(double p, const string& field) {
  if (p==1.) return 1;
  if (p==-1.) return -1;
  FormatAndThrow<UnsupportedSchema>() << "Parity <" << field << "> must be +1 or -1, got " << p;
  return 0;
}

void
Aperture::setFromFields(const ApertureFields& fields) {
  name = fields.requireText("AperName");
  try {
    xDetRef = fields.requireNumber("XDetRef");
    yDetRef = fields.requireNumber("YDetRef");
    xSciRef = fields.requireNumber("XSciRef");
    ySciRef = fields.requireNumber("YSciRef");
    detSciYAngle = degreesField(fields, "DetSciYAngle");
    detSciParity = parity(fields.requireNumber("DetSciParity"), "DetSciParity");
    v2Ref = arcsecField(fields, "V2Ref");
    v3Ref = arcsecField(fields, "V3Ref");
    v3IdlYAng = degreesField(fields, "V3IdlYAng");
    vIdlParity = parity(fields.requireNumber("VIdlParity"), "VIdlParity");

    xIdlVert = DVector(4, 0.);
    yIdlVert = DVector(4, 0.);
    for (int k=0; k<4; k++) {
      xIdlVert[k] = arcsecField(fields, vertName("XIdl", k+1));
      yIdlVert[k] = arcsecField(fields, vertName("YIdl", k+1));
    }

    double d = fields.requireNumber("Sci2IdlDeg");
    if (d < 0. || d != std::floor(d) || d > 9.)
      FormatAndThrow<UnsupportedSchema>() << "Bad polynomial degree " << d;
    int degree = static_cast<int>(d);
    sci2idl = SciIdlPoly(degree);
    idl2sci = SciIdlPoly(degree);
    for (int i=1; i<=degree; i++)
      for (int j=0; j<=i; j++) {
	double cx = fields.requireNumber(coeffName("Sci2IdlX", i, j));
	double cy = fields.requireNumber(coeffName("Sci2IdlY", i, j));
	sci2idl.setCoeff(i, j, cx, cy);
	cx = fields.requireNumber(coeffName("Idl2SciX", i, j));
	cy = fields.requireNumber(coeffName("Idl2SciY", i, j));
	idl2sci.setCoeff(i, j, cx, cy);
      }
  } catch (UnsupportedSchema& e) {
    FormatAndThrow<UnsupportedSchema>() << "in aperture " << name << ": " << e.getDetail();
  }

  // Everything that is not calibration is kept as metadata
  metadata = fields;
  for (int k=0; calibrationFields[k]; k++)
    metadata.erase(calibrationFields[k]);
  for (int k=1; k<=4; k++) {
    metadata.erase(vertName("XIdl", k));
    metadata.erase(vertName("YIdl", k));
  }
  for (int i=1; i<=getDegree(); i++)
    for (int j=0; j<=i; j++) {
      metadata.erase(coeffName("Sci2IdlX", i, j));
      metadata.erase(coeffName("Sci2IdlY", i, j));
      metadata.erase(coeffName("Idl2SciX", i, j));
      metadata.erase(coeffName("Idl2SciY", i, j));
    }
}

/////////////////////////////////////////////////////////////////////
// Direct transformations
/////////////////////////////////////////////////////////////////////

void
Aperture::det2Sci(double xdet, double ydet, double& xsci, double& ysci) const {
  double ang = detSciYAngle * DEGREE;
  double c = std::cos(ang);
  double s = std::sin(ang);
  double dx = xdet - xDetRef;
  double dy = ydet - yDetRef;
  xsci = xSciRef + detSciParity * (dx*c + dy*s);
  ysci = ySciRef - dx*s + dy*c;
}

void
Aperture::sci2Det(double xsci, double ysci, double& xdet, double& ydet) const {
  double ang = detSciYAngle * DEGREE;
  double c = std::cos(ang);
  double s = std::sin(ang);
  double dx = xsci - xSciRef;
  double dy = ysci - ySciRef;
  xdet = xDetRef + detSciParity*dx*c - dy*s;
  ydet = yDetRef + detSciParity*dx*s + dy*c;
}

void
Aperture::sci2Idl(double xsci, double ysci, double& xidl, double& yidl) const {
  sci2idl.evaluate(xsci - xSciRef, ysci - ySciRef, xidl, yidl);
}

void
Aperture::idl2Sci(double xidl, double yidl, double& xsci, double& ysci) const {
  // Ideal origin is the reference point, so no recentering on input
  double dx, dy;
  idl2sci.evaluate(xidl, yidl, dx, dy);
  xsci = dx + xSciRef;
  ysci = dy + ySciRef;
}

void
Aperture::idl2Tel(double xidl, double yidl, double& v2, double& v3) const {
  double ang = v3IdlYAng * DEGREE;
  double c = std::cos(ang);
  double s = std::sin(ang);
  v2 = v2Ref + vIdlParity*xidl*c + yidl*s;
  v3 = v3Ref - vIdlParity*xidl*s + yidl*c;
}

void
Aperture::tel2Idl(double v2, double v3, double& xidl, double& yidl) const {
  double ang = v3IdlYAng * DEGREE;
  double c = std::cos(ang);
  double s = std::sin(ang);
  double dv2 = v2 - v2Ref;
  double dv3 = v3 - v3Ref;
  xidl = vIdlParity * (dv2*c - dv3*s);
  yidl = dv2*s + dv3*c;
}

/////////////////////////////////////////////////////////////////////
// Compound transformations
/////////////////////////////////////////////////////////////////////

void
Aperture::det2Idl(double xdet, double ydet, double& xidl, double& yidl) const {
  double xsci, ysci;
  det2Sci(xdet, ydet, xsci, ysci);
  sci2Idl(xsci, ysci, xidl, yidl);
}

void
Aperture::det2Tel(double xdet, double ydet, double& v2, double& v3) const {
  double xidl, yidl;
  det2Idl(xdet, ydet, xidl, yidl);
  idl2Tel(xidl, yidl, v2, v3);
}

void
Aperture::sci2Tel(double xsci, double ysci, double& v2, double& v3) const {
  double xidl, yidl;
  sci2Idl(xsci, ysci, xidl, yidl);
  idl2Tel(xidl, yidl, v2, v3);
}

void
Aperture::idl2Det(double xidl, double yidl, double& xdet, double& ydet) const {
  double xsci, ysci;
  idl2Sci(xidl, yidl, xsci, ysci);
  sci2Det(xsci, ysci, xdet, ydet);
}

void
Aperture::tel2Sci(double v2, double v3, double& xsci, double& ysci) const {
  double xidl, yidl;
  tel2Idl(v2, v3, xidl, yidl);
  idl2Sci(xidl, yidl, xsci, ysci);
}

void
Aperture::tel2Det(double v2, double v3, double& xdet, double& ydet) const {
  double xsci, ysci;
  tel2Sci(v2, v3, xsci, ysci);
  sci2Det(xsci, ysci, xdet, ydet);
}

/////////////////////////////////////////////////////////////////////
// Elementwise forms
/////////////////////////////////////////////////////////////////////

void
Aperture::det2Sci(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::det2Sci, x, y, xout, yout);
}
void
Aperture::sci2Det(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::sci2Det, x, y, xout, yout);
}
void
Aperture::sci2Idl(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::sci2Idl, x, y, xout, yout);
}
void
Aperture::idl2Sci(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::idl2Sci, x, y, xout, yout);
}
void
Aperture::idl2Tel(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::idl2Tel, x, y, xout, yout);
}
void
Aperture::tel2Idl(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::tel2Idl, x, y, xout, yout);
}
void
Aperture::det2Idl(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::det2Idl, x, y, xout, yout);
}
void
Aperture::det2Tel(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::det2Tel, x, y, xout, yout);
}
void
Aperture::sci2Tel(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::sci2Tel, x, y, xout, yout);
}
void
Aperture::idl2Det(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::idl2Det, x, y, xout, yout);
}
void
Aperture::tel2Sci(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::tel2Sci, x, y, xout, yout);
}
void
Aperture::tel2Det(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const {
  elementwise(*this, &Aperture::tel2Det, x, y, xout, yout);
}

/////////////////////////////////////////////////////////////////////
// Generic conversion
/////////////////////////////////////////////////////////////////////

namespace {
  typedef std::map<std::pair<Frame,Frame>, Aperture::Transform> TransformTable;

  TransformTable buildTransformTable() {
    TransformTable t;
    Aperture::Transform f;
    f = &Aperture::det2Sci; t[std::make_pair(Det,Sci)] = f;
    f = &Aperture::det2Idl; t[std::make_pair(Det,Idl)] = f;
    f = &Aperture::det2Tel; t[std::make_pair(Det,Tel)] = f;
    f = &Aperture::sci2Det; t[std::make_pair(Sci,Det)] = f;
    f = &Aperture::sci2Idl; t[std::make_pair(Sci,Idl)] = f;
    f = &Aperture::sci2Tel; t[std::make_pair(Sci,Tel)] = f;
    f = &Aperture::idl2Det; t[std::make_pair(Idl,Det)] = f;
    f = &Aperture::idl2Sci; t[std::make_pair(Idl,Sci)] = f;
    f = &Aperture::idl2Tel; t[std::make_pair(Idl,Tel)] = f;
    f = &Aperture::tel2Det; t[std::make_pair(Tel,Det)] = f;
    f = &Aperture::tel2Sci; t[std::make_pair(Tel,Sci)] = f;
    f = &Aperture::tel2Idl; t[std::make_pair(Tel,Idl)] = f;
    return t;
  }
}

const std::map<std::pair<Frame,Frame>, Aperture::Transform>&
Aperture::transformTable() {
  static const TransformTable table = buildTransformTable();
  return table;
}

void
Aperture::convert(const DVector& x, const DVector& y, Frame from, Frame to,
		  DVector& xout, DVector& yout) const {
  if (from==to) {
    if (x.size()!=y.size())
      FormatAndThrow<std::invalid_argument>() << "Aperture " << name
					      << " convert input lengths differ: "
					      << x.size() << " vs " << y.size();
    xout = x;
    yout = y;
    return;
  }
  auto i = transformTable().find(std::make_pair(from,to));
  if (i==transformTable().end())
    throw InvalidFrameName("no transformation from " + frameName(from)
			   + " to " + frameName(to));
  (this->*(i->second))(x, y, xout, yout);
}

void
Aperture::convert(double x, double y, Frame from, Frame to,
		  double& xout, double& yout) const {
  DVector xv(1, x);
  DVector yv(1, y);
  DVector xo, yo;
  convert(xv, yv, from, to, xo, yo);
  xout = xo[0];
  yout = yo[0];
}

void
Aperture::convert(const DVector& x, const DVector& y,
		  const string& from, const string& to,
		  DVector& xout, DVector& yout) const {
  convert(x, y, parseFrame(from), parseFrame(to), xout, yout);
}

void
Aperture::corners(DVector& x, DVector& y, Frame frame) const {
  convert(xIdlVert, yIdlVert, Idl, frame, x, y);
}

void
Aperture::center(double& x, double& y, Frame frame) const {
  convert(v2Ref, v3Ref, Tel, frame, x, y);
}

/////////////////////////////////////////////////////////////////////
// Plotting
/////////////////////////////////////////////////////////////////////

double
Aperture::unitScale(const string& units) {
  if (stringstuff::nocaseEqual(units, "arcsec")) return 1.;
  if (stringstuff::nocaseEqual(units, "arcmin")) return 1./60.;
  throw std::invalid_argument("Unknown plot units: " + units);
}

void
Aperture::axisLabels(Frame frame, const string& units,
		     string& xlabel, string& ylabel) {
  if (frame==Idl || frame==Tel) {
    xlabel = "V2 [" + units + "]";
    ylabel = "V3 [" + units + "]";
  } else {
    xlabel = "X pixels [" + frameName(frame) + "]";
    ylabel = "Y pixels [" + frameName(frame) + "]";
  }
}

void
Aperture::drawOutline(PlotSurface& surface, Frame frame, bool label,
		      const string& units) const {
  // Pixel frames are never rescaled
  double scale = unitScale(units);
  if (frame==Det || frame==Sci) scale = 1.;

  DVector x, y;
  corners(x, y, frame);
  int n = x.size();
  // Close the outline
  DVector xc(n+1), yc(n+1);
  for (int i=0; i<n; i++) {
    xc[i] = x[i]*scale;
    yc[i] = y[i]*scale;
  }
  xc[n] = xc[0];
  yc[n] = yc[0];
  surface.drawPolygon(xc, yc, name);
  if (label)
    surface.drawLabel(x.sumElements()/n*scale, y.sumElements()/n*scale, name);
}

void
Aperture::plot(PlotSurface& surface, Frame frame, bool label,
	       bool title, const string& units) const {
  drawOutline(surface, frame, label, units);
  string xlabel, ylabel;
  axisLabels(frame, units, xlabel, ylabel);
  surface.setAxisLabels(xlabel, ylabel);
  // V2 increases to the left
  if (frame==Idl || frame==Tel)
    surface.flipXAxis();
  if (title)
    surface.setTitle(frameName(frame) + " frame");
}

string
Aperture::repr() const {
  return "<Aperture AperName=" + name + ">";
}

std::ostream&
siaf::operator<<(std::ostream& os, const Aperture& ap) {
  os << ap.repr();
  return os;
}

/////////////////////////////////////////////////////////////////////
// YAML (de-)serialization
/////////////////////////////////////////////////////////////////////

void
Aperture::write(YAML::Emitter& os) const {
  os << YAML::BeginMap
     << YAML::Key << "AperName" << YAML::Value << name
     << YAML::Key << "XDetRef" << YAML::Value << xDetRef
     << YAML::Key << "YDetRef" << YAML::Value << yDetRef
     << YAML::Key << "XSciRef" << YAML::Value << xSciRef
     << YAML::Key << "YSciRef" << YAML::Value << ySciRef
     << YAML::Key << "DetSciYAngle" << YAML::Value << detSciYAngle
     << YAML::Key << "DetSciParity" << YAML::Value << detSciParity
     << YAML::Key << "V2Ref" << YAML::Value << v2Ref
     << YAML::Key << "V3Ref" << YAML::Value << v3Ref
     << YAML::Key << "V3IdlYAng" << YAML::Value << v3IdlYAng
     << YAML::Key << "VIdlParity" << YAML::Value << vIdlParity
     << YAML::Key << "XIdlVert" << YAML::Flow << YAML::Value << toStdVector(xIdlVert)
     << YAML::Key << "YIdlVert" << YAML::Flow << YAML::Value << toStdVector(yIdlVert)
     << YAML::Key << "Sci2Idl" << YAML::Value;
  sci2idl.write(os);
  os << YAML::Key << "Idl2Sci" << YAML::Value;
  idl2sci.write(os);
  if (metadata.size() > 0) {
    os << YAML::Key << "Metadata" << YAML::Value << YAML::BeginMap;
    for (auto& f : metadata) {
      os << YAML::Key << f.first << YAML::Value;
      f.second.write(os);
    }
    os << YAML::EndMap;
  }
  os << YAML::EndMap;
}

Aperture*
Aperture::create(const YAML::Node& node, const string& nodeName) {
  if (!node.IsMap())
    throw UnsupportedSchema("YAML node for Aperture " + nodeName + " is not a map");
  const char* keys[] = {"AperName", "XDetRef", "YDetRef", "XSciRef", "YSciRef",
			"DetSciYAngle", "DetSciParity", "V2Ref", "V3Ref",
			"V3IdlYAng", "VIdlParity", "XIdlVert", "YIdlVert",
			"Sci2Idl", "Idl2Sci", 0};
  for (int k=0; keys[k]; k++)
    if (!node[keys[k]])
      throw UnsupportedSchema("Missing YAML key <" + string(keys[k])
			      + "> for Aperture " + nodeName);

  std::unique_ptr<Aperture> ap(new Aperture);
  ap->name = node["AperName"].as<string>();
  ap->xDetRef = node["XDetRef"].as<double>();
  ap->yDetRef = node["YDetRef"].as<double>();
  ap->xSciRef = node["XSciRef"].as<double>();
  ap->ySciRef = node["YSciRef"].as<double>();
  ap->detSciYAngle = node["DetSciYAngle"].as<double>();
  ap->detSciParity = parity(node["DetSciParity"].as<double>(), "DetSciParity");
  ap->v2Ref = node["V2Ref"].as<double>();
  ap->v3Ref = node["V3Ref"].as<double>();
  ap->v3IdlYAng = node["V3IdlYAng"].as<double>();
  ap->vIdlParity = parity(node["VIdlParity"].as<double>(), "VIdlParity");

  vector<double> xv = node["XIdlVert"].as<vector<double> >();
  vector<double> yv = node["YIdlVert"].as<vector<double> >();
  if (xv.size()!=4 || yv.size()!=4)
    throw UnsupportedSchema("Aperture " + ap->name + " needs 4 Idl vertices");
  ap->xIdlVert = DVector(4);
  ap->yIdlVert = DVector(4);
  for (int k=0; k<4; k++) {
    ap->xIdlVert[k] = xv[k];
    ap->yIdlVert[k] = yv[k];
  }

  std::unique_ptr<SciIdlPoly> fwd(SciIdlPoly::create(node["Sci2Idl"]));
  std::unique_ptr<SciIdlPoly> rev(SciIdlPoly::create(node["Idl2Sci"]));
  if (fwd->getDegree() != rev->getDegree())
    throw UnsupportedSchema("Aperture " + ap->name + " polynomial degrees differ");
  ap->sci2idl = *fwd;
  ap->idl2sci = *rev;

  if (node["Metadata"]) {
    const YAML::Node& m = node["Metadata"];
    if (!m.IsMap())
      throw UnsupportedSchema("Metadata of Aperture " + ap->name + " is not a map");
    for (YAML::const_iterator i = m.begin(); i != m.end(); ++i)
      ap->metadata.set(i->first.as<string>(), FieldValue::create(i->second));
  }
  return ap.release();
}
