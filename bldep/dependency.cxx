// file      : bldep/dependency.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/dependency.hxx>

using namespace std;

namespace bldep
{
  const string ilp64_symbol_suffix ("64_");

  string
  to_string (machine m)
  {
    switch (m)
    {
    case machine::build: return "build";
    case machine::host:  return "host";
    }

    return string (); // Can't be here.
  }

  string
  to_string (interface_variant v)
  {
    switch (v)
    {
    case interface_variant::lp64:  return "lp64";
    case interface_variant::ilp64: return "ilp64";
    }

    return string (); // Can't be here.
  }

  interface_variant
  to_interface_variant (const string& s)
  {
         if (s == "lp64")  return interface_variant::lp64;
    else if (s == "ilp64") return interface_variant::ilp64;
    else throw invalid_argument ("invalid interface '" + s + '\'');
  }
}
