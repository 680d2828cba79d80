// file      : bldep/build-config.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_BUILD_CONFIG_HXX
#define BLDEP_BUILD_CONFIG_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

namespace bldep
{
  // Compile/link flags of a package as described by its build system
  // configuration files.
  //
  struct build_config
  {
    strings compile_args;
    strings link_args;
  };

  // Build configuration lookup keyed by the vendor's package name.
  //
  class build_config_lookup
  {
  public:
    // Return nullopt if the package is not found. Issue diagnostics and
    // throw failed if the lookup tool cannot be executed or misbehaves.
    //
    virtual optional<build_config>
    find (const string& package) = 0;

    virtual
    ~build_config_lookup ();
  };

  // The CMake implementation. Uses the cmake --find-package mode which
  // searches for the <package>Config.cmake (or <package>-config.cmake) file
  // and prints the flags of the imported targets.
  //
  // The compiler id is the CMake compiler id the flags are produced for
  // (GNU, Clang, AppleClang, etc).
  //
  class cmake_package: public build_config_lookup
  {
  public:
    explicit
    cmake_package (process_path, string compiler_id = "GNU");

    virtual optional<build_config>
    find (const string&) override;

  private:
    optional<string>
    run (const string& package, const char* mode);

    process_path cmake_;
    string       compiler_id_;
  };
}

#endif // BLDEP_BUILD_CONFIG_HXX
