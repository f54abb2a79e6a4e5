// One aperture of a SIAF, with the transformations between its four
// coordinate frames:
//   Det <-> Sci : rotation by DetSciYAngle, parity flip, shift of reference pixel
//   Sci <-> Idl : distortion polynomials, separately fitted in each direction
//   Idl <-> Tel : rotation by V3IdlYAng, parity flip, shift to (V2Ref,V3Ref)
// Compound transformations chain these in the order Det->Sci->Idl->Tel
// or its reverse.  convert() dispatches any frame pair through a table.
//
// Idl <-> Tel is the planar approximation to the spherical geometry; it
// is good to about 1.7 mas at 10 arcmin from the reference point.
//
// Units: pixels in Det and Sci, arcsec in Idl and Tel.
// Angles DetSciYAngle and V3IdlYAng are kept in degrees.
//
// Every transformation comes in a scalar form and an elementwise DVector
// form; vector inputs must have equal lengths.
#ifndef APERTURE_H
#define APERTURE_H

#include <map>
#include "Std.h"
#include "LinearAlgebra.h"
#include "SiafCore.h"
#include "SciIdlPoly.h"
#include "ApertureFields.h"
#include "PlotSurface.h"
#include "yaml-cpp/yaml.h"

namespace siaf {

  class Aperture {
  public:
    // Build from the fields of a SiafEntry.  All calibration fields are
    // required; anything else is kept as metadata.
    explicit Aperture(const ApertureFields& fields);
    // Parse a SiafEntry element
    explicit Aperture(const xmltree::Element& entry);
    ~Aperture() {}

    const string& getName() const {return name;}
    double getXDetRef() const {return xDetRef;}
    double getYDetRef() const {return yDetRef;}
    double getXSciRef() const {return xSciRef;}
    double getYSciRef() const {return ySciRef;}
    double getDetSciYAngle() const {return detSciYAngle;}
    int getDetSciParity() const {return detSciParity;}
    double getV2Ref() const {return v2Ref;}
    double getV3Ref() const {return v3Ref;}
    double getV3IdlYAng() const {return v3IdlYAng;}
    int getVIdlParity() const {return vIdlParity;}
    int getDegree() const {return sci2idl.getDegree();}
    const SciIdlPoly& getSci2IdlPoly() const {return sci2idl;}
    const SciIdlPoly& getIdl2SciPoly() const {return idl2sci;}
    const linalg::DVector& getXIdlVert() const {return xIdlVert;}
    const linalg::DVector& getYIdlVert() const {return yIdlVert;}
    // Fields of the entry beyond the calibration
    const ApertureFields& getMetadata() const {return metadata;}

    // Direct transformations
    void det2Sci(double xdet, double ydet, double& xsci, double& ysci) const;
    void sci2Det(double xsci, double ysci, double& xdet, double& ydet) const;
    void sci2Idl(double xsci, double ysci, double& xidl, double& yidl) const;
    void idl2Sci(double xidl, double yidl, double& xsci, double& ysci) const;
    void idl2Tel(double xidl, double yidl, double& v2, double& v3) const;
    void tel2Idl(double v2, double v3, double& xidl, double& yidl) const;
    // Compound transformations
    void det2Idl(double xdet, double ydet, double& xidl, double& yidl) const;
    void det2Tel(double xdet, double ydet, double& v2, double& v3) const;
    void sci2Tel(double xsci, double ysci, double& v2, double& v3) const;
    void idl2Det(double xidl, double yidl, double& xdet, double& ydet) const;
    void tel2Sci(double v2, double v3, double& xsci, double& ysci) const;
    void tel2Det(double v2, double v3, double& xdet, double& ydet) const;

    // Elementwise versions
    typedef linalg::DVector DVector;
    void det2Sci(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void sci2Det(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void sci2Idl(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void idl2Sci(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void idl2Tel(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void tel2Idl(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void det2Idl(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void det2Tel(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void sci2Tel(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void idl2Det(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void tel2Sci(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;
    void tel2Det(const DVector& x, const DVector& y, DVector& xout, DVector& yout) const;

    // Any frame to any other.  Same frame in and out returns the input.
    void convert(double x, double y, Frame from, Frame to,
		 double& xout, double& yout) const;
    void convert(const DVector& x, const DVector& y, Frame from, Frame to,
		 DVector& xout, DVector& yout) const;
    // Frame names as in parseFrame(); throws InvalidFrameName
    void convert(const DVector& x, const DVector& y,
		 const string& from, const string& to,
		 DVector& xout, DVector& yout) const;

    // Outline vertices in the given frame
    void corners(DVector& x, DVector& y, Frame frame=Idl) const;
    // Reference point (V2Ref,V3Ref) in the given frame
    void center(double& x, double& y, Frame frame=Tel) const;

    // Draw the closed outline on the surface, with axis labels, title,
    // and V2 increasing to the left for angular frames.
    // units is "arcsec" or "arcmin" (case-insensitive), scaling the
    // Idl and Tel coordinates; otherwise std::invalid_argument.
    void plot(PlotSurface& surface, Frame frame=Idl, bool label=true,
	      bool title=true, const string& units="arcsec") const;
    // Outline (and optional label) only
    void drawOutline(PlotSurface& surface, Frame frame, bool label,
		     const string& units) const;
    static double unitScale(const string& units);
    // Axis labels for plots in a frame
    static void axisLabels(Frame frame, const string& units,
			   string& xlabel, string& ylabel);

    // <Aperture AperName=...>
    string repr() const;

    void write(YAML::Emitter& os) const;
    static Aperture* create(const YAML::Node& node, const string& name="");

    typedef void (Aperture::*Transform)(const DVector&, const DVector&,
					DVector&, DVector&) const;
  private:
    Aperture() {}
    string name;
    double xDetRef, yDetRef;
    double xSciRef, ySciRef;
    double detSciYAngle;   // degrees
    int detSciParity;
    double v2Ref, v3Ref;   // arcsec
    double v3IdlYAng;      // degrees
    int vIdlParity;
    linalg::DVector xIdlVert;
    linalg::DVector yIdlVert;
    SciIdlPoly sci2idl;
    SciIdlPoly idl2sci;
    ApertureFields metadata;

    void setFromFields(const ApertureFields& fields);
    static int parity(double p, const string& field);
    static const std::map<std::pair<Frame,Frame>, Transform>& transformTable();
  };

  std::ostream& operator<<(std::ostream& os, const Aperture& ap);

} // namespace siaf

#endif // APERTURE_H
