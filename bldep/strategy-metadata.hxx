// file      : bldep/strategy-metadata.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_STRATEGY_METADATA_HXX
#define BLDEP_STRATEGY_METADATA_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/strategy.hxx>

namespace bldep
{
  // Get the flags from the package metadata (pkg-config) and re-validate
  // them with the symbol verifier. The metadata presence alone does not
  // mean the interface is as requested (think openblas.pc describing an
  // LP64 build).
  //
  // If the family maps the module set to multiple packages, then all of
  // them must be present and their flags are combined in order. The link
  // flags are concatenated as is while the repeated compile flags are
  // dropped. The version is taken from the first package that has one.
  //
  class metadata_strategy
  {
  public:
    metadata_strategy (const library_family& f,
                       machine_context& c,
                       const symbol_verifier& v)
        : family_ (f), context_ (c), verifier_ (v) {}

    strategy_result
    probe (const module_set&) const;

  private:
    const library_family&  family_;
    machine_context&       context_;
    const symbol_verifier& verifier_;
  };
}

#endif // BLDEP_STRATEGY_METADATA_HXX
