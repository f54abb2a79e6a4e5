// Serialize all apertures of an instrument's SIAF to YAML
#include <fstream>
#include "Std.h"
#include "StringStuff.h"
#include "Pset.h"
#include "Siaf.h"

using namespace siaf;

string usage =
  "DumpSiaf: read an instrument's SIAF XML and write its apertures as YAML\n"
  "\n"
  "usage: DumpSiaf <instrument> [parameter file] [parameter file...]\n"
  "   [-parameter[=]value...]\n"
  "      <instrument>: one of NIRCam, NIRSpec, NIRISS, MIRI, FGS (case-sensitive)\n"
  "      Program parameters specified as command-line options or read from\n"
  "          parameter file(s) specified on cmd line";

int
main(int argc, char *argv[])
{
  string siafPath;
  string outFile;
  int    verbose;

  Pset parameters;
  {
    const int def=PsetMember::hasDefault;
    parameters.addMember("siafPath",&siafPath, def,
			 "Directory holding SIAF XML files (blank to search SIAF_PATH)", "");
    parameters.addMember("outFile",&outFile, def,
			 "Output YAML file", "siaf.yaml");
    parameters.addMember("verbose",&verbose, def,
			 "Diagnostic output level", 0);
  }

  try {
    processParameters(parameters, usage, 1, argc, argv);

    string instrument = argv[1];
    Siaf siaf(instrument, siafPath);
    if (verbose > 0)
      cerr << "# Read " << siaf.size() << " apertures from " << siaf.filename() << endl;

    ofstream ofs(outFile.c_str());
    if (!ofs) {
      cerr << "Could not open output file " << outFile << endl;
      exit(1);
    }
    siaf.write(ofs, stringstuff::taggedCommandLine(argc, argv));
    if (verbose > 0)
      cerr << "# Wrote " << outFile << endl;
  } catch (std::runtime_error& m) {
    quit(m,1);
  }
  exit(0);
}
