// file      : bldep/library-version.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_LIBRARY_VERSION_HXX
#define BLDEP_LIBRARY_VERSION_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

namespace bldep
{
  // Version of a library that was found but whose version could not be
  // determined. Note that it does not mean the library is absent.
  //
  extern const string unknown_version; // 0.0.0

  // Extract the first dotted version (two or more groups of digits separated
  // by dots) from a vendor version macro expansion or similar text, for
  // example, 0.3.21 from "OpenBLAS 0.3.21  ". Return unknown_version if there
  // is none.
  //
  string
  extract_version (const string&);
}

#endif // BLDEP_LIBRARY_VERSION_HXX
