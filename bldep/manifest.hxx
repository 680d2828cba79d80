// file      : bldep/manifest.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_MANIFEST_HXX
#define BLDEP_MANIFEST_HXX

#include <libbutl/manifest-serializer.hxx>

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/dependency.hxx>

namespace bldep
{
  // Serialize the resolution outcome as a manifest. For example:
  //
  // : 1
  // name: openblas
  // found: true
  // method: pkg-config
  // version: 0.3.21
  // interface: ilp64
  // capabilities: cblas lapack
  // compile-options: -I/usr/include/openblas64
  // link-options: -L/usr/lib -lopenblas64_
  //
  // If not found, then only the name, found, and interface values are
  // written. The options are space-separated with the options containing
  // spaces or quotes being quoted.
  //
  // Throw manifest_serialization or io_error on failure.
  //
  void
  serialize (butl::manifest_serializer&, const resolved_dependency&);

  // Join the arguments into a space-separated string that can be split
  // back with split_args().
  //
  string
  join_args (const strings&);
}

#endif // BLDEP_MANIFEST_HXX
