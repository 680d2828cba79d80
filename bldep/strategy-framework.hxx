// file      : bldep/strategy-framework.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_STRATEGY_FRAMEWORK_HXX
#define BLDEP_STRATEGY_FRAMEWORK_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/strategy.hxx>

namespace bldep
{
  // Find the library as a platform framework (currently only Accelerate on
  // macOS).
  //
  // Only applies if the target is macOS and its version is at least the
  // family's minimum. The framework and its umbrella header must both be
  // found. The family's framework defines are added to the compile
  // arguments (and the ILP64 defines if ILP64 is requested) and the version
  // is the OS version.
  //
  // Note that there is no symbol verification: the framework headers alias
  // the routines to the interface selected with the defines and the
  // aliasing scheme is fixed by the vendor.
  //
  class framework_strategy
  {
  public:
    framework_strategy (const library_family& f, machine_context& c)
        : family_ (f), context_ (c) {}

    strategy_result
    probe (const module_set&) const;

    // Return true if the OS version satisfies the minimum. An empty or
    // unparsable version never satisfies.
    //
    static bool
    eligible (const string& os_version, const string& min_version);

  private:
    const library_family& family_;
    machine_context&      context_;
  };
}

#endif // BLDEP_STRATEGY_FRAMEWORK_HXX
