// Test the string helpers used for parsing fields, names and search paths
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <vector>
#include "StringStuff.h"
#include "Std.h"
#include "Checks.h"

using namespace checks;

int
main(int argc, char *argv[])
{
  check(isComment("") && isComment("   ") && isComment("  # note"), "comment lines");
  check(!isComment("1 2 # trailing"), "data with trailing comment");

  {
    istringstream iss("# header\n\n1 2\n  # skip\n3 4\n");
    string line;
    vector<string> lines;
    while (getlineNoComment(iss, line)) lines.push_back(line);
    check(lines.size()==2 && lines[0]=="1 2" && lines[1]=="3 4", "getlineNoComment");
  }

  check(nocaseEqual("ArcMin", "arcmin") && !nocaseEqual("arcmin", "arcsec")
	&& !nocaseEqual("arc", "arcsec"), "nocaseEqual");

  {
    string s = " \t NIRCAM A \n";
    stripWhite(s);
    check(s=="NIRCAM A", "stripWhite keeps inner space");
    string blank = " \t ";
    stripWhite(blank);
    check(blank.empty(), "stripWhite of blank string");
  }

  {
    std::list<string> parts = split("a::b:", ':');
    vector<string> v(parts.begin(), parts.end());
    check(v.size()==4 && v[0]=="a" && v[1].empty() && v[2]=="b" && v[3].empty(),
	  "split keeps empty fields");
    parts = split("  one two\tthree  ");
    v.assign(parts.begin(), parts.end());
    check(v.size()==3 && v[2]=="three", "split on white space");
  }

  {
    double d = -1.;
    check(parseDouble(" 1.5e-3 ", d) && d==1.5e-3, "parseDouble with white space");
    check(parseDouble("-32", d) && d==-32., "parseDouble integer");
    d = 7.;
    check(!parseDouble("1.5 arcsec", d) && d==7., "trailing text rejected");
    check(!parseDouble("", d) && !parseDouble("NIRCAM", d), "non-numbers rejected");
  }

  {
    vector<string> names = {"NIRCAM A", "NIRCAM B", "NIRCAM POINT", "FGS1"};
    std::set<string> m = findMatches("NIRCAM [AB]", names);
    check(m.size()==2 && m.count("NIRCAM B"), "regex selection");
    check(findMatches("nircam.*", names).size()==3, "case-insensitive by default");
    check(findMatches("nircam.*", names, true).empty(), "case-sensitive match");
  }

  {
    ostringstream oss;
    oss << std::setprecision(3);
    {
      StreamSaver ss(oss);
      oss << std::scientific << std::setprecision(8);
    }
    check(oss.precision()==3 && !(oss.flags() & std::ios_base::scientific),
	  "StreamSaver restores format");
  }

  {
    char* args[] = {const_cast<char*>("DumpSiaf"), const_cast<char*>("NIRCam")};
    string tag = taggedCommandLine(2, args);
    check(tag.find(":  DumpSiaf NIRCam") != string::npos, "tagged command line");
  }

  {
    // Search path lookup, using a file written to the current directory
    const string name = "testStringStuff.tmp";
    {
      ofstream ofs(name.c_str());
      ofs << "x" << endl;
    }
    setenv("JWGEOM_TEST_PATH", "/nonexistent/dir::.", 1);
    check(findFileOnPath(name, "JWGEOM_TEST_PATH")=="./" + name, "found on path");
    check(findFileOnPath("no_such_file.xml", "JWGEOM_TEST_PATH").empty(), "not found");
    check(findFileOnPath("/abs/file.xml", "JWGEOM_TEST_PATH")=="/abs/file.xml",
	  "absolute path returned as given");
    std::remove(name.c_str());
  }

  return summary("testStringStuff");
}
