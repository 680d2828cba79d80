// file      : bldep/host-os.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_HOST_OS_HXX
#define BLDEP_HOST_OS_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

namespace bldep
{
  // Return the version of the operating system we are running on (for
  // example, 14.2.1 on macOS) or empty string if it is unknown or not
  // meaningful for the specified host.
  //
  // Currently only macOS is supported where the version is obtained with
  // sw_vers(1). Note that sw_vers being absent or exiting with non-zero code
  // is not an error.
  //
  string
  host_os_version (const target_triplet& host);
}

#endif // BLDEP_HOST_OS_HXX
