#include "StringStuff.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <fstream>

namespace stringstuff {
  bool isComment(const string& instr) {
    size_t first = instr.find_first_not_of(" \t\r\n");
    return first==string::npos || instr[first]=='#';
  }

  std::istream& getlineNoComment(std::istream& is, string& s) {
    while (getline(is,s))
      if (!isComment(s)) break;
    return is;
  }

  bool nocaseEqual(char c1, char c2) {
    return std::tolower(static_cast<unsigned char>(c1))
      == std::tolower(static_cast<unsigned char>(c2));
  }

  bool nocaseEqual(const string& s1, const string& s2) {
    if (s1.size() != s2.size()) return false;
    for (size_t i=0; i<s1.size(); i++)
      if (!nocaseEqual(s1[i], s2[i])) return false;
    return true;
  }

  void stripWhite(string& s) {
    const char* white = " \t\r\n\f\v";
    size_t last = s.find_last_not_of(white);
    if (last==string::npos) {
      s.clear();
      return;
    }
    s.erase(last+1);
    s.erase(0, s.find_first_not_of(white));
  }

  std::list<string>
  split(const string& s, char c) {
    std::list<string> out;
    if (c==0) {
      // Words separated by any amount of white space
      std::istringstream iss(s);
      string word;
      while (iss >> word) out.push_back(word);
      return out;
    }
    size_t start = 0;
    for (size_t end = s.find(c); end!=string::npos; end = s.find(c, start)) {
      out.push_back(s.substr(start, end-start));
      start = end+1;
    }
    out.push_back(s.substr(start));
    return out;
  }

  bool
  parseDouble(const string& s, double& value) {
    string trimmed = s;
    stripWhite(trimmed);
    if (trimmed.empty()) return false;
    const char* start = trimmed.c_str();
    char* end = 0;
    errno = 0;
    double d = std::strtod(start, &end);
    if (end == start || *end != '\0' || errno==ERANGE) return false;
    value = d;
    return true;
  }

  string taggedCommandLine(int argc, char *argv[]) {
    time_t now = time(0);
    char stamp[64];
    strftime(stamp, sizeof(stamp), "%a %b %d %H:%M:%S %Y", localtime(&now));
    std::ostringstream oss;
    oss << stamp << ": ";
    for (int i=0; i<argc; i++)
      oss << " " << argv[i];
    return oss.str();
  }

  bool
  regexMatch(const std::string& regex_,
	     const string& s,
	     bool caseSensitive) {
    std::regex::flag_type flags = std::regex::extended;
    if (!caseSensitive) flags |= std::regex::icase;
    return std::regex_match(s, std::regex(regex_, flags));
  }

  string
  findFileOnPath(const string& filename, const string& environmentVar) {
    string name = filename;
    stripWhite(name);
    if (name.empty() || name[0]=='/') return name;

    const char* pathspec = std::getenv(environmentVar.c_str());
    std::list<string> dirs;
    if (pathspec)
      dirs = split(pathspec, ':');
    else
      dirs.push_back(".");

    for (auto& dir : dirs) {
      // Empty path element means the current directory
      string candidate = (dir.empty() ? string(".") : dir) + "/" + name;
      std::ifstream ifs(candidate.c_str());
      if (ifs.good()) return candidate;
    }
    return "";
  }
}
