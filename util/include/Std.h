// Common includes and small helpers shared by all jwgeom modules.
#ifndef STD_H
#define STD_H

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <string>
#include <vector>
#include <map>
#include <stdexcept>

using namespace std;

// Assertions are active only in debug builds; they check internal
// consistency, never user input.
#ifdef NDEBUG
#define Assert(x) {}
#else
#define Assert(x) \
  { if(!(x)) { \
      std::cerr << "Error - Assert " #x " failed" << std::endl; \
      std::cerr << "on line " << __LINE__ << " in file " << __FILE__ << std::endl; \
      std::exit(1);} }
#endif

template <class T>
inline T SQR(const T& x) {return x*x;}

// Build an exception message with stream syntax; the exception is thrown
// when the temporary goes out of scope:
//   FormatAndThrow<SiafError>() << "Bad degree " << deg;
template <class Ex=std::runtime_error>
class FormatAndThrow {
public:
  FormatAndThrow() {}
  template <class T>
  FormatAndThrow& operator<<(const T& t) {oss << t; return *this;}
  ~FormatAndThrow() noexcept(false) {throw Ex(oss.str());}
private:
  std::ostringstream oss;
};

// Report an exception and exit; used by the programs' main()
inline void quit(const std::exception& e, const int exit_code=1) {
  std::cerr << e.what() << std::endl;
  std::exit(exit_code);
}

#endif // STD_H
