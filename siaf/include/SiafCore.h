// Exceptions, frame names and unit factors used throughout the siaf module
#ifndef SIAFCORE_H
#define SIAFCORE_H

#include <stdexcept>
#include "Std.h"
#include "AstronomicalConstants.h"

namespace siaf {

  class SiafError: public std::runtime_error {
  public:
    SiafError(const string &m=""): std::runtime_error("SIAF Error: " +m), detail(m) {}
    // Message without the error-kind prefixes, for adding context
    const string& getDetail() const {return detail;}
  protected:
    SiafError(const string& kind, const string& m):
      std::runtime_error("SIAF Error: " + kind + m), detail(m) {}
  private:
    string detail;
  };

  // XML (or YAML) content with a shape or value we do not understand
  class UnsupportedSchema: public SiafError {
  public:
    UnsupportedSchema(const string &m=""): SiafError("Unsupported schema: ", m) {}
  };

  class InvalidInstrument: public SiafError {
  public:
    InvalidInstrument(const string &m=""): SiafError("Invalid instrument: ", m) {}
  };

  class InvalidFrameName: public std::invalid_argument {
  public:
    InvalidFrameName(const string &m=""):
      std::invalid_argument("SIAF Error: Invalid frame name: " +m) {}
  };

  // The four coordinate frames of an aperture:
  // Det = raw detector pixels, Sci = pixels in DMS orientation,
  // Idl = arcsec from the aperture reference point, Tel = V2/V3 in arcsec.
  enum Frame {Det, Sci, Idl, Tel};
  const int NFRAMES = 4;

  // Names are "Det", "Sci", "Idl", "Tel" (case-sensitive).
  Frame parseFrame(const string& name);
  string frameName(Frame f);

  // Radians per unit for the units tokens of angle nodes.
  // Throws UnsupportedSchema for an unknown token.
  double radiansPerUnit(const string& units);

} // namespace siaf

#endif // SIAFCORE_H
