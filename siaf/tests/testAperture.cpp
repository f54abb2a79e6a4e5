// Test aperture transformations on the NIRCam fixture SIAF.
// usage: testAperture <directory holding NIRCamSIAF.XML>
#include "Siaf.h"
#include "Aperture.h"
#include "Checks.h"

using namespace checks;
using namespace siaf;
using linalg::DVector;

namespace {
  // One decimal place, as the calibration values are quoted
  const double TOL1 = 0.05;

  void checkPair(double x, double y, double xe, double ye, double tol, const string& what) {
    checkClose(x, xe, tol, what + " x");
    checkClose(y, ye, tol, what + " y");
  }

  // Parse a single SiafEntry held in a string
  Aperture* entryFromString(const string& body) {
    std::unique_ptr<xmltree::Document> doc =
      xmltree::Document::parse("<SiafEntry>" + body + "</SiafEntry>", "entry");
    return new Aperture(doc->root());
  }

  const string minimalEntry =
    "<AperName>TEST</AperName>"
    "<XDetRef>1</XDetRef><YDetRef>1</YDetRef><XSciRef>1</XSciRef><YSciRef>1</YSciRef>"
    "<DetSciYAngle>0</DetSciYAngle><DetSciParity>1</DetSciParity>"
    "<V2Ref>0</V2Ref><V3Ref>0</V3Ref><V3IdlYAng>0</V3IdlYAng><VIdlParity>-1</VIdlParity>"
    "<XIdlVert1>0</XIdlVert1><XIdlVert2>0</XIdlVert2><XIdlVert3>0</XIdlVert3><XIdlVert4>0</XIdlVert4>"
    "<YIdlVert1>0</YIdlVert1><YIdlVert2>0</YIdlVert2><YIdlVert3>0</YIdlVert3><YIdlVert4>0</YIdlVert4>";
}

int
main(int argc, char *argv[])
{
  if (argc != 2) {
    cerr << "usage: testAperture <SIAF fixture directory>" << endl;
    exit(1);
  }
  Siaf siaf("NIRCam", argv[1]);
  const Aperture& nca = siaf["NIRCAM A"];

  // Reference point, upward
  {
    double x, y;
    nca.det2Sci(1023., 1024., x, y);
    checkPair(x, y, 1020., 1020., TOL1, "Det2Sci");
    nca.det2Idl(1023., 1024., x, y);
    checkPair(x, y, 0., 0., TOL1, "Det2Idl");
    nca.det2Tel(1023., 1024., x, y);
    checkPair(x, y, 87.50, -497.10, TOL1, "Det2Tel");
  }
  // and downward
  {
    double x, y;
    nca.sci2Det(1020., 1020., x, y);
    checkPair(x, y, 1023., 1024., TOL1, "Sci2Det");
    nca.tel2Idl(87.50, -497.10, x, y);
    checkPair(x, y, 0., 0., TOL1, "Tel2Idl");
    nca.tel2Sci(87.50, -497.10, x, y);
    checkPair(x, y, 1020., 1020., TOL1, "Tel2Sci");
    nca.tel2Det(87.50, -497.10, x, y);
    checkPair(x, y, 1023., 1024., TOL1, "Tel2Det");
  }

  // Round trips
  {
    double x1, y1, x2, y2;
    nca.sci2Det(1020., 1020., x1, y1);
    nca.det2Sci(x1, y1, x2, y2);
    checkPair(x2, y2, 1020., 1020., 1e-9, "Det2Sci(Sci2Det)");
    nca.det2Sci(10., 2000., x1, y1);
    nca.sci2Det(x1, y1, x2, y2);
    checkPair(x2, y2, 10., 2000., 1e-9, "Sci2Det(Det2Sci)");

    nca.idl2Tel(10., 10., x1, y1);
    nca.tel2Idl(x1, y1, x2, y2);
    checkPair(x2, y2, 10., 10., 1e-9, "Tel2Idl(Idl2Tel)");
    nca.tel2Idl(10., 10., x1, y1);
    nca.idl2Tel(x1, y1, x2, y2);
    checkPair(x2, y2, 10., 10., 1e-9, "Idl2Tel(Tel2Idl)");

    nca.sci2Tel(10., 10., x1, y1);
    nca.tel2Sci(x1, y1, x2, y2);
    checkPair(x2, y2, 10., 10., TOL1, "Tel2Sci(Sci2Tel)");
    nca.tel2Sci(10., 10., x1, y1);
    nca.sci2Tel(x1, y1, x2, y2);
    checkPair(x2, y2, 10., 10., TOL1, "Sci2Tel(Tel2Sci)");
  }

  // Tel->Idl undoes the rotation and parity flip
  {
    double x, y;
    nca.idl2Tel(3., 0., x, y);
    double ang = nca.getV3IdlYAng()*DEGREE;
    checkPair(x, y, 87.5 - 3.*std::cos(ang), -497.1 + 3.*std::sin(ang), 1e-9, "Idl2Tel parity");
    nca.tel2Idl(x, y, x, y);
    checkPair(x, y, 3., 0., 1e-9, "Tel2Idl of offset point");
  }

  // Generic conversion matches the named transformations
  {
    DVector xin(3), yin(3);
    xin << 1023., 10., 2000.;
    yin << 1024., 2000., 5.;
    Frame frames[] = {Det, Sci, Idl, Tel};
    for (auto from : frames) {
      DVector xs, ys;
      nca.convert(xin, yin, from, from, xs, ys);
      check(xs==xin && ys==yin, "identity conversion for " + frameName(from));
      double xo, yo;
      nca.convert(5., 6., from, from, xo, yo);
      check(xo==5. && yo==6., "scalar identity for " + frameName(from));
    }
    DVector xa, ya, xb, yb;
    nca.convert(xin, yin, Det, Tel, xa, ya);
    nca.det2Tel(xin, yin, xb, yb);
    check(xa.size()==3 && xa==xb && ya==yb, "convert Det->Tel");
    nca.convert(xin, yin, "Tel", "Sci", xa, ya);
    nca.tel2Sci(xin, yin, xb, yb);
    check(xa==xb && ya==yb, "convert Tel->Sci by name");
    for (int i=0; i<3; i++) {
      double xs, ys;
      nca.det2Tel(xin[i], yin[i], xs, ys);
      nca.convert(xin, yin, Det, Tel, xa, ya);
      checkPair(xa[i], ya[i], xs, ys, 0., "vector element matches scalar");
    }
    checkThrows<InvalidFrameName>([&]() {nca.convert(xin, yin, "Det", "Foo", xa, ya);},
				  "unknown frame name");
    checkThrows<std::invalid_argument>([&]() {nca.convert(xin, yin, "det", "Sci", xa, ya);},
				       "frame names are case-sensitive");
    DVector shortv(2, 0.);
    checkThrows<std::invalid_argument>([&]() {nca.det2Sci(xin, shortv, xa, ya);},
				       "unequal vector lengths");
  }

  // Corners and center
  {
    DVector x, y;
    nca.corners(x, y);
    check(x.size()==4 && x[1]==32.5 && y[2]==32.7, "corners in Idl");
    nca.corners(x, y, Tel);
    double xt, yt;
    nca.idl2Tel(32.5, -32.4, xt, yt);
    checkPair(x[1], y[1], xt, yt, 1e-9, "corner in Tel");
    double xc, yc;
    nca.center(xc, yc);
    checkPair(xc, yc, 87.5, -497.1, 0., "center in Tel");
    nca.center(xc, yc, Det);
    checkPair(xc, yc, 1023., 1024., 1e-6, "center in Det");
  }

  // Degree 0 and unit-tagged fields
  {
    const Aperture& pt = siaf["NIRCAM POINT"];
    check(pt.getDegree()==0, "degree 0 aperture");
    double x, y;
    pt.sci2Idl(600., 300., x, y);
    checkPair(x, y, 0., 0., 0., "degree 0 applies no terms");
    pt.idl2Sci(5., -5., x, y);
    checkPair(x, y, 512., 256., 0., "degree 0 inverse gives reference");
    checkClose(pt.getV3IdlYAng(), -0.5, 1e-12, "DEGREES-tagged angle");
    checkClose(pt.getV2Ref(), 0.0005*RadToArcsec, 1e-9, "RADIANS-tagged V2Ref in arcsec");
  }

  // Metadata keeps the non-calibration fields
  {
    const ApertureFields& m = nca.getMetadata();
    check(m.has("InstrName") && m.get("InstrName").getText()=="NIRCAM", "text metadata");
    check(m.has("XDetSize") && m.get("XDetSize").getNumber()==2048., "numeric metadata");
    check(m.has("PixelScales") && m.get("PixelScales").getArray().size()==2, "array metadata");
    check(m.has("XSciScale") && m.get("XSciScale").getKind()==FieldValue::Angle,
	  "angle metadata");
    if (m.has("XSciScale"))
      checkClose(m.get("XSciScale").getNumber(), 0.0317*ARCSEC, 1e-15, "ARCSECS to radians");
    check(m.has("Comment") && m.get("Comment").getText().empty(), "empty leaf is text");
    check(!m.has("V2Ref") && !m.has("Sci2IdlX10"), "calibration not in metadata");
  }

  check(nca.repr()=="<Aperture AperName=NIRCAM A>", "repr");

  // Plotting
  {
    OutlineTable table;
    nca.plot(table, Tel, true, true, "arcmin");
    check(table.nPolygons()==1 && table.nLabels()==1, "one outline and label");
    check(table.isFlipped(), "V2 axis flipped");
    check(table.getTitle()=="Tel frame", "title");
    check(table.getXLabel()=="V2 [arcmin]", "axis label");
    OutlineTable pix;
    nca.plot(pix, Det, false, false);
    check(pix.nLabels()==0 && !pix.isFlipped() && pix.getTitle().empty(),
	  "pixel frame plot");
    check(pix.getXLabel()=="X pixels [Det]", "pixel axis label");
    checkThrows<std::invalid_argument>([&]() {nca.plot(pix, Idl, true, true, "degrees");},
				       "unknown plot units");
  }

  // Rotated and flipped frames, with offsets in both axes:
  // cos(30)=0.8660254, sin(30)=0.5
  {
    std::unique_ptr<Aperture> rot(entryFromString(
      "<AperName>ROT30</AperName>"
      "<XDetRef>100</XDetRef><YDetRef>200</YDetRef><XSciRef>10</XSciRef><YSciRef>20</YSciRef>"
      "<DetSciYAngle>30</DetSciYAngle><DetSciParity>-1</DetSciParity>"
      "<V2Ref>50</V2Ref><V3Ref>-300</V3Ref><V3IdlYAng>30</V3IdlYAng><VIdlParity>-1</VIdlParity>"
      "<XIdlVert1>0</XIdlVert1><XIdlVert2>0</XIdlVert2><XIdlVert3>0</XIdlVert3><XIdlVert4>0</XIdlVert4>"
      "<YIdlVert1>0</YIdlVert1><YIdlVert2>0</YIdlVert2><YIdlVert3>0</YIdlVert3><YIdlVert4>0</YIdlVert4>"
      "<Sci2IdlDeg>0</Sci2IdlDeg>"));
    const double tol = 1e-6;
    double x, y;
    // XSci = 10 - (3 cos + 4 sin), YSci = 20 - 3 sin + 4 cos
    rot->det2Sci(103., 204., x, y);
    checkPair(x, y, 5.4019238, 21.9641016, tol, "rotated Det2Sci");
    // XDet = 100 - 2 cos - 3 sin, YDet = 200 - 2 sin + 3 cos
    rot->sci2Det(12., 23., x, y);
    checkPair(x, y, 96.7679492, 201.5980762, tol, "rotated Sci2Det");
    rot->sci2Det(5.4019238, 21.9641016, x, y);
    checkPair(x, y, 103., 204., tol, "rotated Sci2Det inverts Det2Sci");
    // V2 = 50 - 3 cos + 4 sin, V3 = -300 + 3 sin + 4 cos
    rot->idl2Tel(3., 4., x, y);
    checkPair(x, y, 49.4019238, -295.0358984, tol, "rotated Idl2Tel");
    rot->tel2Idl(49.4019238, -295.0358984, x, y);
    checkPair(x, y, 3., 4., tol, "rotated Tel2Idl");
  }

  // Parser errors
  {
    std::unique_ptr<Aperture> ok(entryFromString(minimalEntry + "<Sci2IdlDeg>0</Sci2IdlDeg>"));
    check(ok->getName()=="TEST", "minimal entry");
    checkThrows<UnsupportedSchema>([&]() {
	delete entryFromString(minimalEntry + "<Sci2IdlDeg>1</Sci2IdlDeg>");
      }, "missing coefficients");
    try {
      delete entryFromString(minimalEntry + "<Sci2IdlDeg>1</Sci2IdlDeg>");
    } catch (UnsupportedSchema& e) {
      string msg = e.what();
      check(msg=="SIAF Error: Unsupported schema: in aperture TEST: Missing field <Sci2IdlX10>",
	    "aperture context added once: " + msg);
    }
    checkThrows<UnsupportedSchema>([&]() {
	delete entryFromString(minimalEntry + "<Sci2IdlDeg>1.5</Sci2IdlDeg>");
      }, "non-integer degree");
    checkThrows<UnsupportedSchema>([&]() {
	delete entryFromString(minimalEntry + "<Sci2IdlDeg>0</Sci2IdlDeg>"
			       "<Odd><a>1</a><b>2</b></Odd>");
      }, "unknown nested shape");
    checkThrows<UnsupportedSchema>([&]() {
	delete entryFromString(minimalEntry + "<Sci2IdlDeg>0</Sci2IdlDeg>"
			       "<Ang><value>1</value><units>GRADS</units></Ang>");
      }, "unknown units");
    checkThrows<UnsupportedSchema>([&]() {
	delete entryFromString(minimalEntry + "<Sci2IdlDeg>abc</Sci2IdlDeg>");
      }, "text where number required");
    string noParity = minimalEntry;
    size_t p = noParity.find("<VIdlParity>-1");
    noParity.replace(p, 14, "<VIdlParity>2");
    checkThrows<UnsupportedSchema>([&]() {
	delete entryFromString(noParity + "<Sci2IdlDeg>0</Sci2IdlDeg>");
      }, "bad parity");
  }

  return summary("testAperture");
}
