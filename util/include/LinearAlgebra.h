// Linear algebra classes for jwgeom, built on Eigen.
// linalg::Vector<T> / Matrix<T> are dynamic-size objects of data type T,
// derived from the Eigen classes so that the rest of the code can use
// short common names and a few TMV-style conveniences.
//
// Notes:
// * Eigen distinguishes row from column vectors; Vector is a column vector.
// * Element-wise work goes through the array() views, e.g.
//   v.array() * w.array(), and converts back on assignment.
// * Default-constructed objects hold uninitialized data; use the
//   (size, value) constructors when zeros are wanted.
#ifndef LINEARALGEBRA_H
#define LINEARALGEBRA_H

#include <iostream>

#ifndef USE_EIGEN
#error USE_EIGEN must be defined to build jwgeom
#endif

#include "Eigen/Dense"

namespace linalg {
  // Dynamic-length vector
  template <typename T>
  class Vector: public Eigen::Matrix<T,Eigen::Dynamic,1> {
  public:
    typedef Vector Type;
    typedef Eigen::Matrix<T,Eigen::Dynamic,1> Base;
    Vector() =default;
    Vector(int n): Base(n) {}
    Vector(int n, T val): Base(Base::Constant(n,val)) {}
    Vector(const Base& v): Base(v) {}
    template <class Other>
    Vector(const Other& o): Base(o) {}
    template <class Other>
    Type& operator=(const Other& o) {Base::operator=(o); return *this;}

    Eigen::Block<Base> subVector(int i1, int i2) {return Base::block(i1,0,i2-i1,1);}
    Eigen::Block<const Base> subVector(int i1, int i2) const {return Base::block(i1,0,i2-i1,1);}
    T sumElements() const {return Base::sum();}
  };

  // Dynamic-size matrix
  template <typename T>
  class Matrix: public Eigen::Matrix<T,Eigen::Dynamic,Eigen::Dynamic> {
  public:
    typedef Matrix Type;
    typedef Eigen::Matrix<T,Eigen::Dynamic,Eigen::Dynamic> Base;
    Matrix() =default;
    Matrix(int n1, int n2): Base(n1,n2) {}
    Matrix(int n1, int n2, T val): Base(Base::Constant(n1,n2,val)) {}
    Matrix(const Base& v): Base(v) {}
    template <class Other>
    Matrix(const Other& o): Base(o) {}
    template <class Other>
    Type& operator=(const Other& o) {Base::operator=(o); return *this;}

    int nrows() const {return Base::rows();}
    int ncols() const {return Base::cols();}
    Type& setToIdentity() {Base::setIdentity(); return *this;}
  };

  typedef Vector<double> DVector;
  typedef Vector<int>    IVector;
  typedef Matrix<double> DMatrix;

} // end namespace linalg

#endif  // LINEARALGEBRA_H
