#include <memory>
#include "SciIdlPoly.h"
#include "SiafCore.h"

using namespace siaf;
using namespace linalg;

SciIdlPoly::SciIdlPoly(int degree_): degree(degree_) {
  if (degree < 0)
    FormatAndThrow<UnsupportedSchema>() << "Negative polynomial degree " << degree;
  cx = DMatrix(degree+1, degree+1, 0.);
  cy = DMatrix(degree+1, degree+1, 0.);
}

SciIdlPoly::SciIdlPoly(const DMatrix& cx_, const DMatrix& cy_):
  degree(cx_.nrows()-1), cx(cx_), cy(cy_) {
  if (cx.nrows()<1 || cx.nrows()!=cx.ncols()
      || cy.nrows()!=cx.nrows() || cy.ncols()!=cx.ncols())
    throw UnsupportedSchema("SciIdlPoly coefficient matrices not square and equal in size");
  for (int i=0; i<=degree; i++)
    for (int j=0; j<=degree; j++)
      if (!inRange(i,j,degree)) {
	cx(i,j) = 0.;
	cy(i,j) = 0.;
      }
}

void
SciIdlPoly::setCoeff(int i, int j, double cxij, double cyij) {
  if (!inRange(i,j,degree))
    FormatAndThrow<SiafError>() << "Coefficient (" << i << "," << j
				<< ") out of range for degree " << degree;
  cx(i,j) = cxij;
  cy(i,j) = cyij;
}

DVector
SciIdlPoly::powers(double z) const {
  DVector p(degree+1, 1.);
  for (int i=1; i<=degree; i++)
    p[i] = z*p[i-1];
  return p;
}

void
SciIdlPoly::evaluate(double x, double y, double& xout, double& yout) const {
  xout = 0.;
  yout = 0.;
  if (degree==0) return;
  DVector px = powers(x);
  DVector py = powers(y);
  for (int i=1; i<=degree; i++)
    for (int j=0; j<=i; j++) {
      double term = px[i-j]*py[j];
      xout += cx(i,j) * term;
      yout += cy(i,j) * term;
    }
}

void
SciIdlPoly::evaluate(const DVector& x, const DVector& y,
		     DVector& xout, DVector& yout) const {
  if (x.size()!=y.size())
    FormatAndThrow<std::invalid_argument>() << "SciIdlPoly input lengths differ: "
					    << x.size() << " vs " << y.size();
  xout.resize(x.size());
  yout.resize(y.size());
  for (int k=0; k<x.size(); k++)
    evaluate(x[k], y[k], xout[k], yout[k]);
}

vector<double>
SciIdlPoly::vectorFromMatrix(const DMatrix& m) const {
  vector<double> v;
  v.reserve(nCoeffs());
  for (int i=1; i<=degree; i++)
    for (int j=0; j<=i; j++)
      v.push_back(m(i,j));
  return v;
}

void
SciIdlPoly::fillFromVector(const vector<double>& v, DMatrix& m) const {
  Assert(v.size()==nCoeffs());
  int k=0;
  for (int i=1; i<=degree; i++)
    for (int j=0; j<=i; j++)
      m(i,j) = v[k++];
}

void
SciIdlPoly::write(YAML::Emitter& os) const {
  os << YAML::BeginMap
     << YAML::Key << "Degree" << YAML::Value << degree
     << YAML::Key << "XCoefficients" << YAML::Flow << YAML::Value << vectorFromMatrix(cx)
     << YAML::Key << "YCoefficients" << YAML::Flow << YAML::Value << vectorFromMatrix(cy)
     << YAML::EndMap;
}

SciIdlPoly*
SciIdlPoly::create(const YAML::Node& node) {
  if (!node.IsMap())
    throw UnsupportedSchema("No YAML map node for SciIdlPoly");
  if (!node["Degree"])
    throw UnsupportedSchema("Missing YAML key <Degree> for SciIdlPoly");
  int deg = node["Degree"].as<int>();
  std::unique_ptr<SciIdlPoly> poly(new SciIdlPoly(deg));
  const char* keys[2] = {"XCoefficients", "YCoefficients"};
  DMatrix* targets[2] = {&poly->cx, &poly->cy};
  for (int k=0; k<2; k++) {
    vector<double> v;
    if (node[keys[k]])
      v = node[keys[k]].as<vector<double> >();
    if (v.size() != poly->nCoeffs())
      FormatAndThrow<UnsupportedSchema>() << "Wrong coefficient count for SciIdlPoly <"
					  << keys[k] << ">: " << v.size()
					  << " vs " << poly->nCoeffs();
    poly->fillFromVector(v, *targets[k]);
  }
  return poly.release();
}
