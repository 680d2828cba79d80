// file      : bldep/machine-file.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_MACHINE_FILE_HXX
#define BLDEP_MACHINE_FILE_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

namespace bldep
{
  // Properties of a build or host machine as specified in the [properties]
  // section of the machine file. For example:
  //
  // [binaries]
  // c = 'gcc'
  //
  // [properties]
  // openblas_includedir = '/opt/openblas/include'
  // openblas_librarydir = '/opt/openblas/lib'
  //
  // Note that only the string values are interpreted (unquoted). Array
  // values (in brackets) are stored as is. Other sections are ignored.
  //
  using machine_properties = map<string, string>;

  // Parse the machine file read from the stream. The name is used for
  // diagnostics. Issue diagnostics and throw failed on parsing errors.
  //
  machine_properties
  parse_machine_file (istream&, const string& name);

  // As above but read from the file. Issue diagnostics and throw failed if
  // the file does not exist or cannot be read.
  //
  machine_properties
  load_machine_file (const path&);
}

#endif // BLDEP_MACHINE_FILE_HXX
