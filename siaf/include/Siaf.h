// Science Instrument Aperture File: the collection of all apertures
// of one instrument, keyed by aperture name.
//
// The XML reader takes the instrument name, checks it against the
// known JWST instruments, and reads <instrument>SIAF.XML (NIRISS_SIAF.XML
// for NIRISS) from a base directory, or from the SIAF_PATH search path
// when no directory is given.
//
// A Siaf can also be serialized to / deserialized from YAML, holding
// the calibration of every aperture.
#ifndef SIAF_H
#define SIAF_H

#include <map>
#include <memory>
#include "Std.h"
#include "SiafCore.h"
#include "Aperture.h"
#include "PlotSurface.h"

namespace siaf {

  class Siaf {
  public:
    // Empty collection, to be filled by read()
    Siaf() {}
    // Read the SIAF of an instrument.  The name is checked before any
    // file is touched.  Empty basePath means search SIAF_PATH.
    explicit Siaf(const string& instrument, const string& basePath="");
    ~Siaf() {}

    // Instruments with SIAF files, and the file name for each
    static const vector<string>& instrumentNames();
    static bool isInstrument(const string& instrument);
    static string fileNameFor(const string& instrument);

    const string& instrument() const {return instr;}
    const string& filename() const {return fname;}

    int size() const {return apertures.size();}
    bool has(const string& name) const {return apertures.count(name)>0;}
    // Throws SiafError for unknown names
    const Aperture& find(const string& name) const;
    const Aperture& operator[](const string& name) const {return find(name);}
    // All aperture names, sorted
    vector<string> apertureNames() const;

    // Draw the outlines of all apertures, or of those whose names
    // are listed in names if it is non-empty.
    void plot(PlotSurface& surface,
	      Frame frame=Tel,
	      const vector<string>& names=vector<string>(),
	      bool label=true,
	      const string& units="arcsec") const;

    // YAML serialization of the whole collection
    void write(std::ostream& os, const string& comment="") const;
    // Add apertures from a serialized stream.  Returns false if the
    // stream is valid YAML that is not a serialized Siaf.
    bool read(std::istream& is);

  private:
    string instr;
    string fname;
    std::map<string, std::unique_ptr<Aperture> > apertures;
    void add(Aperture* ap);
    static const string magicKey;

    // Hide copying
    Siaf(const Siaf& rhs) =delete;
    void operator=(const Siaf& rhs) =delete;
  };

} // namespace siaf

#endif // SIAF_H
