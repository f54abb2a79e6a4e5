// String helpers shared by the jwgeom modules and programs
#ifndef STRINGSTUFF_H
#define STRINGSTUFF_H

#include <iostream>
#include <sstream>
#include <string>
#include <set>
#include <list>
#include <ios>
#include <regex>

using std::string;

namespace stringstuff {
  // Blank lines and lines whose first non-white character is # are comments
  bool isComment(const string& instr);
  // getline() that skips comment lines
  std::istream& getlineNoComment(std::istream& is, string& s);

  bool nocaseEqual(char c1, char c2);
  bool nocaseEqual(const string& s1, const string& s2);

  // Remove leading and trailing white space in place
  void stripWhite(string& s);

  // Split at every occurrence of c, keeping empty fields.
  // With c=0, split into the white-space separated words.
  std::list<string> split(const string& s, char c=0);

  // Read a double from the whole of s (surrounding white space allowed).
  // Returns false, leaving value untouched, if s is not entirely a number.
  bool parseDouble(const string& s, double& value);

  // Time stamp followed by the command line, for output headers
  string taggedCommandLine(int argc, char *argv[]);

  // True if the POSIX extended regex matches all of s
  bool regexMatch(const string& regex_,
		  const string& s,
		  bool caseSensitive=false);

  // The members of a string container that match a regex
  template <class Container>
  std::set<string> findMatches(const string& regex_,
			       const Container& c,
			       bool caseSensitive=false) {
    std::set<string> result;
    for (auto& s : c)
      if (regexMatch(regex_, s, caseSensitive)) result.insert(s);
    return result;
  }

  // Restores the format flags and precision of a stream on destruction
  class StreamSaver {
  public:
    explicit StreamSaver(std::ostream& os_):
      os(os_), flags(os_.flags()), precision(os_.precision()) {}
    ~StreamSaver() {
      os.flags(flags);
      os.precision(precision);
    }
  private:
    std::ostream& os;
    std::ios_base::fmtflags flags;
    std::streamsize precision;
  };

  // Full path of the first readable filename in the colon-separated
  // directories of environmentVar, or in the current directory if the
  // variable is unset.  Empty string if not found.  Absolute filenames
  // are returned as given.
  string findFileOnPath(const string& filename, const string& environmentVar);

} // namespace stringstuff

using namespace stringstuff;

#endif
