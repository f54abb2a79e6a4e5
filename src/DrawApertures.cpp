// Tabulate aperture outlines of an instrument for plotting
#include <fstream>
#include <set>
#include "Std.h"
#include "StringStuff.h"
#include "Pset.h"
#include "Siaf.h"

using namespace siaf;
using namespace stringstuff;

string usage =
  "DrawApertures: write the outlines of SIAF apertures as an ASCII table\n"
  "   (one block of closed-polygon vertices per aperture, gnuplot style)\n"
  "\n"
  "usage: DrawApertures <instrument> [parameter file] [parameter file...]\n"
  "   [-parameter[=]value...]\n"
  "      <instrument>: one of NIRCam, NIRSpec, NIRISS, MIRI, FGS (case-sensitive)\n"
  "      Program parameters specified as command-line options or read from\n"
  "          parameter file(s) specified on cmd line\n"
  "   Outlines are drawn in the frame given by the frame parameter; the select\n"
  "   parameter is a regular expression that aperture names must match.";

int
main(int argc, char *argv[])
{
  string frameName;
  string units;
  string select;
  string siafPath;
  string outFile;
  bool   label;
  int    verbose;

  Pset parameters;
  {
    const int def=PsetMember::hasDefault;
    parameters.addMember("frame",&frameName, def,
			 "Frame of the outlines (Det, Sci, Idl, Tel)", "Tel");
    parameters.addMember("units",&units, def,
			 "Units for Idl/Tel outlines (arcsec or arcmin)", "arcsec");
    parameters.addMember("select",&select, def,
			 "Regular expression for aperture names (blank for all)", "");
    parameters.addMember("label",&label, def,
			 "Include labels at outline centers?", true);
    parameters.addMember("siafPath",&siafPath, def,
			 "Directory holding SIAF XML files (blank to search SIAF_PATH)", "");
    parameters.addMember("outFile",&outFile, def,
			 "Output table file, - for stdout", "-");
    parameters.addMember("verbose",&verbose, def,
			 "Diagnostic output level", 0);
  }

  try {
    processParameters(parameters, usage, 1, argc, argv, cerr);

    string instrument = argv[1];
    Frame frame = parseFrame(frameName);

    Siaf siaf(instrument, siafPath);
    if (verbose > 0)
      cerr << "# Read " << siaf.size() << " apertures from " << siaf.filename() << endl;

    vector<string> names;
    if (!select.empty()) {
      std::set<string> matches = stringstuff::findMatches(select, siaf.apertureNames(), true);
      if (matches.empty()) {
	cerr << "No apertures match " << select << endl;
	exit(1);
      }
      names.assign(matches.begin(), matches.end());
      if (verbose > 0)
	cerr << "# Selected " << names.size() << " apertures" << endl;
    }

    OutlineTable table;
    siaf.plot(table, frame, names, label, units);

    if (outFile=="-") {
      table.write(cout);
    } else {
      ofstream ofs(outFile.c_str());
      if (!ofs) {
	cerr << "Could not open output file " << outFile << endl;
	exit(1);
      }
      table.write(ofs);
    }
  } catch (std::runtime_error& m) {
    quit(m,1);
  } catch (std::invalid_argument& m) {
    quit(m,1);
  }
  exit(0);
}
