// file      : bldep/package-metadata.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_PACKAGE_METADATA_HXX
#define BLDEP_PACKAGE_METADATA_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

namespace bldep
{
  // Compile/link flags and version of a package as described by its
  // metadata file.
  //
  struct package_metadata
  {
    strings compile_args;
    strings link_args;
    string  version;     // Empty if unspecified.
  };

  // Package metadata lookup keyed by the package name.
  //
  class package_metadata_lookup
  {
  public:
    // Return nullopt if there is no metadata for this package. Issue
    // diagnostics and throw failed if the lookup tool cannot be executed or
    // misbehaves.
    //
    virtual optional<package_metadata>
    find (const string& name) = 0;

    virtual
    ~package_metadata_lookup ();
  };

  // The pkg-config(1) implementation.
  //
  // The environment variables (in the NAME=VALUE form) are passed to every
  // invocation, for example, to point PKG_CONFIG_PATH to the build machine
  // packages.
  //
  class pkg_config: public package_metadata_lookup
  {
  public:
    explicit
    pkg_config (process_path, strings env = {});

    virtual optional<package_metadata>
    find (const string&) override;

  private:
    // Run pkg-config with the specified option for the package. Return
    // nullopt if it exits with non-zero code.
    //
    optional<string>
    run (const char* option, const string& name);

    process_path pkg_config_;
    strings      env_;
    cstrings     evars_; // NULL-terminated view of env_.
  };
}

#endif // BLDEP_PACKAGE_METADATA_HXX
