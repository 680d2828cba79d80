// file      : bldep/family.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_FAMILY_HXX
#define BLDEP_FAMILY_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/modules.hxx>
#include <bldep/dependency.hxx>

namespace bldep
{
  // Discovery mechanisms. Each family lists the ones that apply to it in
  // the priority order.
  //
  enum class strategy_kind
  {
    system,           // Library and header search.
    package_metadata, // pkg-config.
    build_config,     // CMake package configuration.
    framework         // Platform framework (Accelerate).
  };

  // Return the method name as shown to the user (system, pkg-config, cmake,
  // framework).
  //
  string
  to_string (strategy_kind);

  inline ostream&
  operator<< (ostream& os, strategy_kind k)
  {
    return os << to_string (k);
  }

  // Whether to try the unsuffixed (LP64) library names as the last resort
  // for an ILP64 request. A library found this way is only accepted if it
  // passes symbol verification with the ILP64 symbol names (some vendors
  // build ILP64 with the suffixed symbols but without renaming the library).
  // Families whose ILP64 symbols are not suffixed never fall back since the
  // verification cannot tell the interfaces apart.
  //
  enum class ilp64_fallback
  {
    verify, // Try them and let symbol verification decide.
    exclude // Only try the ILP64 library names.
  };

  string
  to_string (ilp64_fallback);

  // Throw invalid_argument if the string is not a recognized policy name.
  //
  ilp64_fallback
  to_ilp64_fallback (const string&);

  // Description of a BLAS/LAPACK vendor family and how to discover it.
  //
  struct library_family
  {
    string name;

    small_vector<strategy_kind, 4> strategies;

    // Library names (without the lib prefix and extension) for the system
    // search and machine file overrides. If both are empty, then the family
    // cannot be found via the system search or overridden in the machine
    // file.
    //
    strings lp64_libraries;
    strings ilp64_libraries;

    // Vendor header that must be present for the system search and the
    // framework lookup (umbrella header). Empty if there is none.
    //
    string header;

    // Macro in the vendor header that expands to the vendor version string.
    // Empty if there is none.
    //
    string version_macro;

    // Return the pkg-config package names for the module set. NULL if the
    // family is not discoverable via pkg-config.
    //
    function<strings (const module_set&)> metadata_packages;

    // CMake package name.
    //
    string cmake_package;

    // Framework name, the minimum host OS version that ships the required
    // interface, and the compile definitions it always needs.
    //
    string  framework;
    string  framework_min_os_version;
    strings framework_defines;

    // Compile definitions that select the ILP64 interface in the vendor
    // headers. Added by the strategies that produce their own compile
    // options (system, framework, and machine file override).
    //
    strings ilp64_defines;

    // Libraries that must follow the ILP64 interface library on the link
    // line (for example, the threading and computational layers).
    //
    strings ilp64_companions;

    // Suffix of the ILP64 symbol names. If empty, then the ILP64 interface
    // can only be told apart by the library name.
    //
    string ilp64_suffix = ilp64_symbol_suffix;
  };

  // Return the library names to try, in order, for the interface variant.
  //
  // For ILP64 these are the family's ILP64 names followed (unless the policy
  // is exclude or the family's ILP64 symbols are not suffixed) by the LP64
  // names not already in the list. For LP64 these are the family's LP64
  // names only.
  //
  strings
  library_candidates (const library_family&,
                      interface_variant,
                      ilp64_fallback);

  // Known library families. Constructed once at startup and passed to the
  // resolver. Immutable after construction, so can be shared between
  // concurrent resolutions.
  //
  class family_registry
  {
  public:
    // Throw invalid_argument if a family with this name is already
    // registered.
    //
    void
    insert (library_family);

    // Return NULL if not found.
    //
    const library_family*
    find (const string& name) const;

    const map<string, library_family>&
    families () const {return families_;}

  private:
    map<string, library_family> families_;
  };

  // Create the registry with the built-in families:
  //
  // openblas   -- OpenBLAS
  // netlib     -- Netlib reference BLAS/CBLAS/LAPACK/LAPACKE
  // mkl        -- Intel oneAPI Math Kernel Library
  // armpl      -- Arm Performance Libraries
  // accelerate -- Apple Accelerate framework
  //
  family_registry
  default_family_registry ();
}

#endif // BLDEP_FAMILY_HXX
