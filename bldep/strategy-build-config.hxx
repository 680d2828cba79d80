// file      : bldep/strategy-build-config.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_STRATEGY_BUILD_CONFIG_HXX
#define BLDEP_STRATEGY_BUILD_CONFIG_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/strategy.hxx>

namespace bldep
{
  // Get the flags from the vendor's CMake package configuration and
  // re-validate them with the symbol verifier.
  //
  // Note that the package is always looked up by its default name and there
  // is no way to select the ILP64 configuration. As a result, an ILP64
  // request is only satisfied if the default configuration happens to pass
  // the ILP64 symbol verification.
  //
  class build_config_strategy
  {
  public:
    build_config_strategy (const library_family& f,
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

#endif // BLDEP_STRATEGY_BUILD_CONFIG_HXX
