// file      : bldep/modules.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_MODULES_HXX
#define BLDEP_MODULES_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/dependency.hxx>

namespace bldep
{
  // Normalized set of the requested modules.
  //
  struct module_set
  {
    interface_variant variant = interface_variant::lp64;

    bool cblas   = false;
    bool lapack  = false;
    bool lapacke = false;
  };

  // Parse and validate the module tokens. The recognized vocabulary is:
  //
  // interface:lp64
  // interface:ilp64
  // cblas
  // lapack
  // lapacke
  //
  // At most one interface token may be specified with LP64 being the
  // default. Throw configuration_error on unrecognized tokens or multiple
  // interface tokens.
  //
  module_set
  parse_modules (const strings&);
}

#endif // BLDEP_MODULES_HXX
