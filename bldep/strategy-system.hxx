// file      : bldep/strategy-system.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_STRATEGY_SYSTEM_HXX
#define BLDEP_STRATEGY_SYSTEM_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/strategy.hxx>

namespace bldep
{
  // Find the library by searching the compiler's (or the extra) library
  // directories and the vendor header by searching the compiler's (and the
  // extra) include directories.
  //
  // The library names are tried in the library_candidates() order. A
  // candidate is only accepted if both the library and the header are found
  // and the symbol verification passes. Otherwise, the next candidate is
  // tried.
  //
  // If the extra library directories are specified, then the link arguments
  // are -L<dir> -l<name> for the directory the library was found in.
  // Otherwise, they are as returned by the compiler probe. The extra include
  // directories are returned as -I<dir>. For ILP64 the family's companion
  // libraries are searched for the same way and appended after the
  // interface library, and its ILP64 definitions follow the -I options.
  //
  class system_strategy
  {
  public:
    system_strategy (const library_family& f,
                     machine_context& c,
                     const symbol_verifier& v,
                     ilp64_fallback fb)
        : family_ (f), context_ (c), verifier_ (v), fallback_ (fb) {}

    strategy_result
    probe (const module_set&) const;

  private:
    // Return false if any of the companion libraries is not found.
    //
    bool
    append_companions (strings& link_args) const;

  private:
    const library_family&  family_;
    machine_context&       context_;
    const symbol_verifier& verifier_;
    ilp64_fallback         fallback_;
  };
}

#endif // BLDEP_STRATEGY_SYSTEM_HXX
