// Test parameter-set reading from streams and command-line arguments
#include <sstream>
#include "Pset.h"
#include "Checks.h"

using namespace checks;

int
main(int argc, char *argv[])
{
  int verbose;
  double scale;
  string units;
  bool label;

  Pset parameters;
  parameters.addMemberNoValue("PLOT", 0, "Plot options");
  parameters.addMember("verbose", &verbose, PsetMember::hasDefault,
		       "Diagnostic level", 0);
  parameters.addMember("scale", &scale,
		       PsetMember::hasDefault | PsetMember::hasLowerBound | PsetMember::openLowerBound,
		       "Scale factor", 1., 0.);
  parameters.addMember("units", &units, PsetMember::hasDefault, "Plot units", "arcsec");
  parameters.addMember("label", &label, PsetMember::hasDefault, "Label outlines", true);

  parameters.setDefault();
  check(verbose==0 && scale==1. && units=="arcsec" && label, "defaults");

  {
    istringstream iss("# comment line\n"
		      "verbose = 2  ; trailing comment\n"
		      "UNITS \"arc min\"\n"
		      "label no\n");
    parameters.setStream(iss);
    check(verbose==2, "verbose from stream");
    check(units=="arc min", "quoted value, case-insensitive keyword");
    check(!label, "bool from stream");
  }

  {
    const char* args[] = {"prog", "positional", "-scale=2.5", "-units", "arcmin", "-label", "=", "yes"};
    int firstKeyword = parameters.setFromArguments(8, const_cast<char**>(args));
    check(firstKeyword==2, "index of first keyword argument");
    checkClose(scale, 2.5, 0., "scale from arguments");
    check(units=="arcmin", "value in next argument");
    check(label, "value after lone =");
  }

  {
    istringstream iss("\"units\"=\"deg\"#comment\n"
		      "  verbose\t7   \n"
		      "   \n"
		      "; only a comment\n");
    parameters.setStream(iss);
    check(units=="deg", "quoted keyword and value with = and no spaces");
    check(verbose==7, "trailing white space dropped from unquoted value");
  }

  {
    const char* args[] = {"prog", "-units", "=arcsec", "-scale=", "4"};
    int firstKeyword = parameters.setFromArguments(5, const_cast<char**>(args));
    check(firstKeyword==1, "no positional arguments");
    check(units=="arcsec", "leading = of next argument dropped");
    checkClose(scale, 4., 0., "value after trailing =");
    const char* twice[] = {"prog", "-verbose", "=", "=5"};
    checkThrows<PsetError>([&]() {parameters.setFromArguments(4, const_cast<char**>(twice));},
			   "only one = is consumed");
    const char* dangling[] = {"prog", "-units"};
    checkThrows<PsetError>([&]() {parameters.setFromArguments(2, const_cast<char**>(dangling));},
			   "option with no value");
  }

  checkThrows<PsetError>([&]() {parameters.setKeyValue("scale", "0.");},
			 "open lower bound");
  checkThrows<PsetError>([&]() {parameters.setKeyValue("scale", "abc");},
			 "non-numeric value");
  checkThrows<PsetError>([&]() {parameters.setKeyValue("nosuch", "1");},
			 "unknown keyword");
  checkThrows<PsetError>([&]() {parameters.setKeyValue("PLOT", "1");},
			 "heading has no value");
  checkThrows<PsetError>([&]() {
      istringstream iss("units \"unterminated\n");
      parameters.setStream(iss);
    }, "unbounded quote");

  // The parameter echo goes only to the requested stream, so that a
  // program can keep stdout for its product.
  {
    const char* args[] = {"prog", "input.xml", "-verbose=3"};
    ostringstream echo;
    ostringstream captured;
    std::streambuf* saved = cout.rdbuf(captured.rdbuf());
    try {
      processParameters(parameters, "usage", 1, 3, const_cast<char**>(args), echo);
    } catch (std::runtime_error& m) {
      cout.rdbuf(saved);
      throw;
    }
    cout.rdbuf(saved);
    check(verbose==3, "processParameters applies options");
    check(captured.str().empty(), "nothing echoed to stdout");
    check(echo.str().find("#")==0 && echo.str().find("prog input.xml -verbose=3")!=string::npos,
	  "tagged command line echoed");
    check(echo.str().find("verbose")!=string::npos, "parameter dump echoed");
  }

  return summary("testPset");
}
