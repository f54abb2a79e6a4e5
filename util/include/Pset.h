// Parameter sets for the command-line programs.
// A Pset holds a list of named parameters, each bound to a program variable.
// Values can come from defaults, from parameter files made of
//     keyword [=] value   ; comment
// lines, and from -keyword=value command-line options (later sources win).
//
//   Pset parameters;
//   parameters.addMember("verbose", &verbose, PsetMember::hasDefault,
//                        "Diagnostic level", 0);
//   processParameters(parameters, usage, 2, argc, argv);
#ifndef PSET_H
#define PSET_H

#include <list>
#include <string>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include "Std.h"
#include "StringStuff.h"

class PsetError: public std::runtime_error {
public:
  PsetError(const string& m=""): std::runtime_error("Pset Error: " + m) {}
};

class PsetUnboundedQuote: public PsetError {
public:
  PsetUnboundedQuote(const string& m=""): PsetError("Unbounded quote in: " + m) {}
};

class PsetMember {
public:
  // Flags, to be added together
  static const int hasDefault=1;
  static const int hasLowerBound=2;
  static const int hasUpperBound=4;
  static const int openLowerBound=8;
  static const int openUpperBound=16;

  PsetMember(const string& k, int f, const string& c):
    keyword(k), flags(f), comment(c) {}
  virtual ~PsetMember() {}
  const string& getKeyword() const {return keyword;}
  // A member without a value is only a heading in dumps
  virtual bool hasValue() const {return false;}
  virtual void setValue(const string& v) {
    throw PsetError("Attempt to set value of comment keyword " + keyword);
  }
  virtual void setDefault() {}
  virtual void dump(std::ostream& os) const {
    os << "#------ " << keyword << " " << comment << endl;
  }
protected:
  string keyword;
  int flags;
  string comment;
};

namespace pset {
  // Keeps a parameter out of template argument deduction
  template <class T>
  struct Same {typedef T type;};

  // Conversions from the string forms of values
  inline bool readValue(const string& s, string& value) {
    value = s;
    return true;
  }
  inline bool readValue(const string& s, bool& value) {
    string v=s;
    stringstuff::stripWhite(v);
    if (stringstuff::nocaseEqual(v,"true") || stringstuff::nocaseEqual(v,"t")
	|| stringstuff::nocaseEqual(v,"yes") || v=="1") {
      value = true;
      return true;
    }
    if (stringstuff::nocaseEqual(v,"false") || stringstuff::nocaseEqual(v,"f")
	|| stringstuff::nocaseEqual(v,"no") || v=="0") {
      value = false;
      return true;
    }
    return false;
  }
  template <class T>
  bool readValue(const string& s, T& value) {
    std::istringstream iss(s);
    T tmp;
    if (!(iss >> tmp)) return false;
    string extra;
    if (iss >> extra) return false;
    value = tmp;
    return true;
  }
} // namespace pset

template <class T>
class PsetMem: public PsetMember {
public:
  PsetMem(const string& k, T* ptr, int f, const string& c,
	  const T& def, const T& low, const T& up):
    PsetMember(k,f,c), valuePtr(ptr), defaultValue(def), lowerBound(low), upperBound(up) {}
  virtual bool hasValue() const {return true;}
  virtual void setValue(const string& v) {
    T tmp;
    if (!pset::readValue(v, tmp))
      throw PsetError("Bad value <" + v + "> for keyword " + keyword);
    checkBounds(tmp);
    *valuePtr = tmp;
  }
  virtual void setDefault() {
    if (flags & hasDefault) *valuePtr = defaultValue;
  }
  virtual void dump(std::ostream& os) const {
    os << keyword << " = " << *valuePtr << "\t; " << comment << endl;
  }
private:
  T* valuePtr;
  T defaultValue;
  T lowerBound;
  T upperBound;
  void checkBounds(const T& v) const {
    if (flags & hasLowerBound) {
      bool bad = (flags & openLowerBound) ? !(lowerBound < v) : v < lowerBound;
      if (bad) {
	std::ostringstream oss;
	oss << "Value " << v << " below bound " << lowerBound << " for keyword " << keyword;
	throw PsetError(oss.str());
      }
    }
    if (flags & hasUpperBound) {
      bool bad = (flags & openUpperBound) ? !(v < upperBound) : upperBound < v;
      if (bad) {
	std::ostringstream oss;
	oss << "Value " << v << " above bound " << upperBound << " for keyword " << keyword;
	throw PsetError(oss.str());
      }
    }
  }
};

class Pset {
public:
  Pset() {}
  ~Pset() {
    for (auto m : l) delete m;
  }
  // Type is set by the bound variable; default and bound arguments
  // may be anything convertible to it.
  template <class T>
  void addMember(const char* k, T* ptr, int f, const char* c,
		 const typename pset::Same<T>::type& def=T(),
		 const typename pset::Same<T>::type& low=T(),
		 const typename pset::Same<T>::type& up=T()) {
    if (findMember(k))
      throw PsetError("Duplicate keyword " + string(k));
    l.push_back( new PsetMem<T>(k, ptr, f, c, def, low, up) );
  }
  // A heading line for the dump, holds no value
  void addMemberNoValue(const char* k, const int f, const char* c);

  // Set every member that has a default to its default value
  void setDefault() {
    for (auto m : l) m->setDefault();
  }
  void setKeyValue(const string& keyword, const string& value);
  // Read keyword/value lines until end of stream
  void setStream(std::istream& is);
  // Read -keyword[=]value arguments.  Returns the index of the first
  // such argument, i.e. the number of positional arguments + 1.
  int setFromArguments(int argc, char** argv);
  void dump(std::ostream& os) const {
    for (auto m : l) m->dump(os);
  }

private:
  std::list<PsetMember*> l;
  PsetMember* findMember(const string& keyword) const;
  static bool read_keyvalue(const string& in, string& keyword, string& value);
  // Hide copying
  Pset(const Pset& rhs) =delete;
  void operator=(const Pset& rhs) =delete;
};

// Read parameter files named after the nRequiredArgs positional arguments,
// then the command-line options, and echo the result to echo.
// Programs whose product goes to stdout should echo to cerr.
// Prints usage and throws if there are too few positional arguments.
void processParameters(Pset& parameters, const string& usage,
		       int nRequiredArgs, int argc, char *argv[],
		       std::ostream& echo=cout);

#endif // PSET_H
