// Read a Segment Update Request and write it back out in canonical form
#include <fstream>
#include "Std.h"
#include "StringStuff.h"
#include "Pset.h"
#include "Sur.h"

using namespace sur;

string usage =
  "RewriteSur: read a Segment Update Request file and regenerate its XML\n"
  "\n"
  "usage: RewriteSur <SUR file> [parameter file] [parameter file...]\n"
  "   [-parameter[=]value...]\n"
  "      <SUR file>: XML segment update request\n"
  "      Program parameters specified as command-line options or read from\n"
  "          parameter file(s) specified on cmd line\n"
  "   With verbose>0 a summary of the groups and updates goes to stderr;\n"
  "   with verbose>1 each update is listed in short form as well.";

int
main(int argc, char *argv[])
{
  string outFile;
  int    verbose;

  Pset parameters;
  {
    const int def=PsetMember::hasDefault;
    parameters.addMember("outFile",&outFile, def,
			 "Output XML file, - for stdout", "-");
    parameters.addMember("verbose",&verbose, def,
			 "Diagnostic output level", 0);
  }

  try {
    processParameters(parameters, usage, 1, argc, argv, cerr);

    string surFile = argv[1];
    Sur sur(surFile);

    if (verbose > 0)
      cerr << sur.str();
    if (verbose > 1)
      for (auto& g : sur.getGroups())
	for (auto& u : g)
	  cerr << u.shortstr() << endl;

    if (outFile=="-") {
      cout << sur.xmltext();
    } else {
      ofstream ofs(outFile.c_str());
      if (!ofs) {
	cerr << "Could not open output file " << outFile << endl;
	exit(1);
      }
      ofs << sur.xmltext();
    }
  } catch (std::runtime_error& m) {
    quit(m,1);
  }
  exit(0);
}
