// file      : bldep/strategy.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_STRATEGY_HXX
#define BLDEP_STRATEGY_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/family.hxx>
#include <bldep/modules.hxx>
#include <bldep/dependency.hxx>
#include <bldep/machine-file.hxx>
#include <bldep/build-config.hxx>
#include <bldep/compiler-probe.hxx>
#include <bldep/symbol-verifier.hxx>
#include <bldep/package-metadata.hxx>

namespace bldep
{
  // Everything the discovery strategies know about the machine a dependency
  // is resolved for.
  //
  // The lookups may be NULL in which case the corresponding strategies never
  // find anything (for example, if pkg-config is not available).
  //
  struct machine_context
  {
    target_triplet target;

    // Host operating system version (for example, 13.3 on macOS) or empty if
    // unknown.
    //
    string os_version;

    // Machine file [properties].
    //
    machine_properties properties;

    // Extra directories to search for libraries and headers.
    //
    dir_paths library_dirs;
    dir_paths include_dirs;

    compiler_probe&          compiler;
    package_metadata_lookup* metadata;
    build_config_lookup*     build_config;

    machine_context (target_triplet t,
                     compiler_probe& c,
                     package_metadata_lookup* m = nullptr,
                     build_config_lookup* b = nullptr)
        : target (move (t)), compiler (c), metadata (m), build_config (b) {}
  };

  // Run the discovery strategy for the family and module set.
  //
  strategy_result
  probe (strategy_kind,
         const library_family&,
         machine_context&,
         const module_set&,
         const symbol_verifier&,
         ilp64_fallback);
}

#endif // BLDEP_STRATEGY_HXX
