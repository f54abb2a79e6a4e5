// Routines for parameter sets
#include <string>
#include <cctype>
#include "Pset.h"

void
Pset::addMemberNoValue(const char *k,
		       const int f,
		       const char *c) {
  l.push_back( new PsetMember(k, f, c) );
}

PsetMember*
Pset::findMember(const string& keyword) const {
  for (auto m : l)
    if (m->hasValue() && stringstuff::nocaseEqual(m->getKeyword(), keyword))
      return m;
  return 0;
}

void
Pset::setKeyValue(const string& keyword, const string& value) {
  PsetMember* m = findMember(keyword);
  if (!m)
    throw PsetError("Unknown keyword " + keyword);
  m->setValue(value);
}

namespace {
  const char quote='"';
  const string white=" \t\r\n\f\v";
  const string comments="#;";

  // Token between the quote at in[i] and the next quote; i moves past it
  string quotedToken(const string& in, string::size_type& i) {
    string::size_type close = in.find(quote, i+1);
    if (close==string::npos) throw PsetUnboundedQuote(in);
    string out = in.substr(i+1, close-i-1);
    i = close+1;
    return out;
  }
}

// Split a parameter-file line into keyword and value.  Either may be
// quoted; an optional '=' separates them and # or ; starts a comment.
// Returns false for lines with no keyword.
bool
Pset::read_keyvalue(const string &in, string &keyword, string &value) {
  keyword.clear();
  value.clear();

  string::size_type i = in.find_first_not_of(white);
  if (i==string::npos) return false;

  if (in[i]==quote) {
    keyword = quotedToken(in, i);
  } else {
    string::size_type end = in.find_first_of(white + "=\"" + comments, i);
    if (end==string::npos) end = in.size();
    keyword = in.substr(i, end-i);
    i = end;
  }
  if (keyword.empty()) return false;

  i = in.find_first_not_of(white + "=", i);
  if (i==string::npos || comments.find(in[i])!=string::npos)
    return true;		// keyword alone

  if (in[i]==quote) {
    value = quotedToken(in, i);
  } else {
    string::size_type end = in.find_first_of(comments, i);
    value = in.substr(i, end==string::npos ? string::npos : end-i);
    value.erase(value.find_last_not_of(white)+1);
  }
  return true;
}

void
Pset::setStream(std::istream& is) {
  string buffer;
  string keyword;
  string value;
  int lineNumber = 0;
  while (getline(is, buffer)) {
    lineNumber++;
    if (!read_keyvalue(buffer, keyword, value)) continue;
    try {
      setKeyValue(keyword, value);
    } catch (PsetError& m) {
      FormatAndThrow<PsetError>() << "at line " << lineNumber << ": " << m.what();
    }
  }
}

int
Pset::setFromArguments(int argc, char **argv) {
  // Positional arguments are everything before the first option
  int firstKeyword = 0;
  while (firstKeyword < argc && argv[firstKeyword][0]!='-')
    firstKeyword++;

  int iarg = firstKeyword;
  while (iarg < argc) {
    string arg = argv[iarg++];
    if (arg[0] != '-')
      throw PsetError("Expected cmd-line argument beginning with '-', got: " + arg);
    arg.erase(0,1);

    string::size_type eq = arg.find('=');
    string keyword = arg.substr(0, eq);
    stringstuff::stripWhite(keyword);
    if (keyword.empty())
      throw PsetError("Missing keyword at cmd-line argument: -" + arg);
    string value;
    if (eq!=string::npos) {
      value = arg.substr(eq+1);
      stringstuff::stripWhite(value);
    }

    if (value.empty()) {
      // Value is in the following argument(s): "-k v", "-k = v", "-k =v", "-k= v"
      bool haveEquals = eq!=string::npos;
      if (!haveEquals && iarg < argc) {
	string next = argv[iarg];
	stringstuff::stripWhite(next);
	if (next=="=") {
	  haveEquals = true;
	  iarg++;
	}
      }
      if (iarg >= argc)
	throw PsetError("Ran out of command-line arguments awaiting a value for " + keyword);
      value = argv[iarg++];
      if (!haveEquals && !value.empty() && value[0]=='=')
	value.erase(0,1);
    }
    setKeyValue(keyword, value);
  }
  return firstKeyword;
}

void
processParameters(Pset& parameters, const string& usage,
		  int nRequiredArgs, int argc, char *argv[],
		  std::ostream& echo) {
  parameters.setDefault();
  int positionalArguments;
  try {
    // First pass finds how many positional arguments precede the options
    positionalArguments = parameters.setFromArguments(argc, argv);
  } catch (std::runtime_error& m) {
    cerr << usage << endl;
    cerr << "#---- Parameter defaults: ----" << endl;
    parameters.dump(cerr);
    throw;
  }
  if (positionalArguments < nRequiredArgs + 1) {
    cerr << usage << endl;
    cerr << "#---- Parameter defaults: ----" << endl;
    parameters.dump(cerr);
    throw PsetError("Too few positional arguments");
  }

  // Remaining positional arguments are parameter files
  for (int i = nRequiredArgs + 1; i < positionalArguments; i++) {
    ifstream ifs(argv[i]);
    if (!ifs)
      throw PsetError("Can't open parameter file " + string(argv[i]));
    try {
      parameters.setStream(ifs);
    } catch (PsetError& m) {
      FormatAndThrow<PsetError>() << "In file " << argv[i] << ": " << m.what();
    }
  }
  // Command-line options take precedence over files
  parameters.setFromArguments(argc, argv);

  echo << "#" << stringstuff::taggedCommandLine(argc, argv) << endl;
  parameters.dump(echo);
}
