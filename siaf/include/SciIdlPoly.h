// One direction of the distortion polynomial between Science-frame pixel
// offsets and Ideal-frame angles:
//    xout = sum CX(i,j) * x^(i-j) * y^j
//    yout = sum CY(i,j) * x^(i-j) * y^j
// over 1 <= i <= degree, 0 <= j <= i.  There is no constant term.
// The coefficient matrices are (degree+1)x(degree+1); entries outside the
// summation range stay zero.
//
// The Sci->Idl and Idl->Sci directions are separately fitted calibrations,
// so an Aperture holds two of these rather than inverting one.
#ifndef SCIIDLPOLY_H
#define SCIIDLPOLY_H

#include "Std.h"
#include "LinearAlgebra.h"
#include "yaml-cpp/yaml.h"

namespace siaf {

  class SciIdlPoly {
  public:
    // All-zero polynomial of the given degree
    explicit SciIdlPoly(int degree_=0);
    // Take coefficients from square matrices of equal size.
    // Entries outside the summation range are ignored and zeroed.
    SciIdlPoly(const linalg::DMatrix& cx_, const linalg::DMatrix& cy_);
    ~SciIdlPoly() {}

    int getDegree() const {return degree;}
    const linalg::DMatrix& getXCoeffs() const {return cx;}
    const linalg::DMatrix& getYCoeffs() const {return cy;}
    // Set the coefficients of x^(i-j) y^j
    void setCoeff(int i, int j, double cxij, double cyij);

    void evaluate(double x, double y, double& xout, double& yout) const;
    // Elementwise; x and y must have equal lengths (invalid_argument if not)
    void evaluate(const linalg::DVector& x, const linalg::DVector& y,
		  linalg::DVector& xout, linalg::DVector& yout) const;

    // Number of coefficients per axis, and their vector form,
    // ordered (1,0),(1,1),(2,0),(2,1),(2,2),...
    int nCoeffs() const {return degree*(degree+3)/2;}
    static bool inRange(int i, int j, int degree) {
      return i>=1 && i<=degree && j>=0 && j<=i;
    }

    void write(YAML::Emitter& os) const;
    static SciIdlPoly* create(const YAML::Node& node);

  private:
    int degree;
    linalg::DMatrix cx;
    linalg::DMatrix cy;
    linalg::DVector powers(double z) const;
    std::vector<double> vectorFromMatrix(const linalg::DMatrix& m) const;
    void fillFromVector(const std::vector<double>& v, linalg::DMatrix& m) const;
  };

} // namespace siaf

#endif // SCIIDLPOLY_H
