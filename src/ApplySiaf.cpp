// Map coordinates between the frames of one SIAF aperture
#include <fstream>
#include <sstream>
#include "Std.h"
#include "StringStuff.h"
#include "Pset.h"
#include "Siaf.h"

using namespace siaf;
using namespace stringstuff;

string usage =
  "ApplySiaf: transform coordinates between the frames of a SIAF aperture\n"
  "\n"
  "usage: ApplySiaf <instrument> <aperture> [parameter file] [parameter file...]\n"
  "   [-parameter[=]value...]\n"
  "      <instrument>: one of NIRCam, NIRSpec, NIRISS, MIRI, FGS (case-sensitive)\n"
  "      <aperture>:   aperture name, e.g. \"NIRCAM A\"\n"
  "      Program parameters specified as command-line options or read from\n"
  "          parameter file(s) specified on cmd line\n"
  "   Frames are Det (detector pixels), Sci (science pixels), Idl (arcsec from the\n"
  "   aperture reference point) and Tel (V2,V3 in arcsec).\n"
  "   The SIAF file is read from siafPath, or found on the SIAF_PATH search path.\n"
  "     stdin:  each line is <x> <y> in frameIn\n"
  "     stdout: each line is <x> <y> in frameOut";

int
main(int argc, char *argv[])
{
  string frameIn;
  string frameOut;
  string siafPath;
  int    precision;
  int    verbose;

  Pset parameters;
  {
    const int def=PsetMember::hasDefault;
    const int low=PsetMember::hasLowerBound;
    const int up=PsetMember::hasUpperBound;
    parameters.addMember("frameIn",&frameIn, def,
			 "Frame of input coordinates (Det, Sci, Idl, Tel)", "Det");
    parameters.addMember("frameOut",&frameOut, def,
			 "Frame of output coordinates (Det, Sci, Idl, Tel)", "Tel");
    parameters.addMember("siafPath",&siafPath, def,
			 "Directory holding SIAF XML files (blank to search SIAF_PATH)", "");
    parameters.addMember("precision",&precision, def+low+up,
			 "Digits after the decimal point in output", 4, 0, 12);
    parameters.addMember("verbose",&verbose, def,
			 "Diagnostic output level", 0);
  }

  try {
    processParameters(parameters, usage, 2, argc, argv, cerr);

    string instrument = argv[1];
    string apertureName = argv[2];

    Frame from = parseFrame(frameIn);
    Frame to = parseFrame(frameOut);

    Siaf siaf(instrument, siafPath);
    if (verbose > 0)
      cerr << "# Read " << siaf.size() << " apertures from " << siaf.filename() << endl;
    const Aperture& ap = siaf[apertureName];
    if (verbose > 0)
      cerr << "# Using " << ap << " " << frameIn << " -> " << frameOut << endl;

    cout << fixed << setprecision(precision);
    string buffer;
    while (stringstuff::getlineNoComment(cin, buffer)) {
      istringstream iss(buffer);
      double x, y;
      if (!(iss >> x >> y)) {
	cerr << "Bad input line: " << buffer << endl;
	exit(1);
      }
      double xout, yout;
      ap.convert(x, y, from, to, xout, yout);
      cout << xout << " " << yout << endl;
    }
  } catch (std::runtime_error& m) {
    quit(m,1);
  } catch (std::invalid_argument& m) {
    quit(m,1);
  }
  exit(0);
}
