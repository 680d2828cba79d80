// file      : bldep/dependency.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_DEPENDENCY_HXX
#define BLDEP_DEPENDENCY_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

namespace bldep
{
  // Invalid dependency request or machine configuration. This is always a
  // user mistake and is never downgraded to "not found".
  //
  class configuration_error: public invalid_argument
  {
  public:
    using invalid_argument::invalid_argument;
  };

  // The machine the dependency is resolved for. When building natively
  // both are the same machine but may still be configured differently (for
  // example, with separate machine files).
  //
  enum class machine {build, host};

  string
  to_string (machine);

  inline ostream&
  operator<< (ostream& os, machine m)
  {
    return os << to_string (m);
  }

  // BLAS/LAPACK binary interface. LP64 uses 32-bit integers for indices
  // while ILP64 uses 64-bit integers.
  //
  enum class interface_variant {lp64, ilp64};

  string
  to_string (interface_variant);

  // Throw invalid_argument if the string is not a recognized interface name.
  //
  interface_variant
  to_interface_variant (const string&);

  inline ostream&
  operator<< (ostream& os, interface_variant v)
  {
    return os << to_string (v);
  }

  // Default ILP64 symbol suffix. Note that some vendors (e.g., MKL) provide
  // ILP64 via a separate interface library that exports unsuffixed names.
  //
  extern const string ilp64_symbol_suffix; // 64_

  // A request to resolve a library family for a machine. The modules are the
  // raw module tokens as specified by the user (see parse_modules() for the
  // vocabulary).
  //
  struct dependency_request
  {
    string  name;
    strings modules;
    bldep::machine for_machine = machine::host;
  };

  // Result of a single discovery strategy. If not found, then all the other
  // members are empty.
  //
  // Note that the order of the arguments is significant and is preserved
  // exactly as discovered.
  //
  struct strategy_result
  {
    bool             found = false;
    strings          compile_args;
    strings          link_args;
    optional<string> version;

    strategy_result () = default;

    strategy_result (strings c, strings l, optional<string> v = nullopt)
        : found (true),
          compile_args (move (c)),
          link_args (move (l)),
          version (move (v)) {}
  };

  // Explicit include/library directory pair pinned in the machine file.
  // Both are absolute.
  //
  struct machine_override
  {
    dir_path include_dir;
    dir_path library_dir;
  };

  // The final resolution outcome handed back to the caller.
  //
  // The method is the name of the discovery method that produced the result
  // (system, pkg-config, cmake, framework, or machine-file) and is empty if
  // not found. The version is never empty if found but may be the unknown
  // version sentinel (see extract_version() for details).
  //
  struct resolved_dependency
  {
    bool              found = false;
    string            name;
    string            method;
    strings           compile_args;
    strings           link_args;
    string            version;
    interface_variant variant = interface_variant::lp64;

    // Capabilities confirmed by symbol verification (or by the vendor
    // guarantee for frameworks).
    //
    bool cblas   = false;
    bool lapack  = false;
    bool lapacke = false;
  };
}

#endif // BLDEP_DEPENDENCY_HXX
