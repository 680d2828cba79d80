// file      : bldep/machine-override.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_MACHINE_OVERRIDE_HXX
#define BLDEP_MACHINE_OVERRIDE_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/modules.hxx>
#include <bldep/family.hxx>
#include <bldep/dependency.hxx>
#include <bldep/machine-file.hxx>
#include <bldep/symbol-verifier.hxx>

namespace bldep
{
  // Return the include/library directory override for the family from the
  // <family>_includedir and <family>_librarydir machine properties or
  // nullopt if neither is set (empty values are treated as unset).
  //
  // Throw configuration_error if only one of them is set or if either is not
  // an absolute path.
  //
  optional<machine_override>
  resolve_override (const string& family, const machine_properties&);

  // Verify the family's libraries in the overridden directories. For each
  // library candidate (see library_candidates()) run the symbol verifier
  // with -L<library-dir> -l<name> and return the first that passes along
  // with -I<include-dir>. Return not found if none passes. For ILP64 the
  // family's companion libraries and definitions are added as well.
  //
  // Note that the automatic discovery is not performed for an overridden
  // family, whatever the outcome.
  //
  strategy_result
  probe_override (const library_family&,
                  const machine_override&,
                  const module_set&,
                  const symbol_verifier&,
                  ilp64_fallback);
}

#endif // BLDEP_MACHINE_OVERRIDE_HXX
