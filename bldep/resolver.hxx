// file      : bldep/resolver.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_RESOLVER_HXX
#define BLDEP_RESOLVER_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/family.hxx>
#include <bldep/strategy.hxx>
#include <bldep/dependency.hxx>

namespace bldep
{
  // Resolve dependency requests into verified build configurations.
  //
  // For each request:
  //
  // 1. Look up the family in the registry and parse the modules.
  //
  // 2. If the machine file overrides the family's directories, verify the
  //    family's libraries there and finalize (see probe_override()).
  //
  // 3. Otherwise, run the family's strategies in order until one finds the
  //    library.
  //
  // 4. If found and the strategy did not determine the version, extract it
  //    from the family's version macro, if any.
  //
  // Not finding the library is a normal outcome: the result has found
  // false. Invalid requests and machine configurations are reported by
  // throwing configuration_error. Failures to execute the underlying tools
  // are reported by issuing diagnostics and throwing failed.
  //
  // The resolver does not keep any state between requests. Note, however,
  // that the machine contexts (and their lookups) are shared by all the
  // requests for the same machine.
  //
  class resolver
  {
  public:
    // The build and host contexts may refer to the same object.
    //
    resolver (const family_registry& r,
              machine_context& build,
              machine_context& host,
              ilp64_fallback fb = ilp64_fallback::verify)
        : registry_ (r), build_ (build), host_ (host), fallback_ (fb) {}

    resolved_dependency
    resolve (const dependency_request&) const;

  private:
    // Determine the version of the found library.
    //
    string
    version (const library_family&,
             machine_context&,
             const strategy_result&) const;

    const family_registry& registry_;
    machine_context&       build_;
    machine_context&       host_;
    ilp64_fallback         fallback_;
  };
}

#endif // BLDEP_RESOLVER_HXX
