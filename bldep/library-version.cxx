// file      : bldep/library-version.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/library-version.hxx>

#include <regex>

using namespace std;

namespace bldep
{
  const string unknown_version ("0.0.0");

  string
  extract_version (const string& s)
  {
    static const regex re ("\\d+(?:\\.\\d+)+", regex::ECMAScript);

    smatch m;
    return regex_search (s, m, re) ? m.str () : unknown_version;
  }
}
