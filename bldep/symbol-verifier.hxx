// file      : bldep/symbol-verifier.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_SYMBOL_VERIFIER_HXX
#define BLDEP_SYMBOL_VERIFIER_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/modules.hxx>
#include <bldep/dependency.hxx>
#include <bldep/compiler-probe.hxx>

namespace bldep
{
  // Confirm that the link arguments provide the routines of the requested
  // modules with the requested interface by linking a program that calls
  // them.
  //
  // Neither the library presence nor the header presence is sufficient: a
  // vendor library may provide a different interface than requested (for
  // example, an LP64-only build when ILP64 was requested), which can only
  // be detected by linking against the exact symbol names.
  //
  class symbol_verifier
  {
  public:
    // The ILP64 suffix is appended to every symbol name when verifying the
    // ILP64 interface.
    //
    explicit
    symbol_verifier (compiler_probe& cc,
                     string ilp64_suffix = ilp64_symbol_suffix)
        : cc_ (cc), ilp64_suffix_ (move (ilp64_suffix)) {}

    bool
    verify (const module_set&, const strings& link_args) const;

    // Return the symbols to check, in order:
    //
    // dgemm_          always
    // cblas_dgemm     if cblas
    // zungqr_         if lapack
    // LAPACKE_zungqr  if lapacke
    //
    // With the variant-dependent suffix appended to each.
    //
    strings
    symbols (const module_set&) const;

    // Return the C translation unit that calls all the symbols.
    //
    static string
    program (const strings& symbols);

  private:
    compiler_probe& cc_;
    string ilp64_suffix_;
  };
}

#endif // BLDEP_SYMBOL_VERIFIER_HXX
