// file      : bldep/types-parsers.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// CLI parsers, included into the generated source files.
//

#ifndef BLDEP_TYPES_PARSERS_HXX
#define BLDEP_TYPES_PARSERS_HXX

#include <bldep/types.hxx>

#include <bldep/family.hxx>
#include <bldep/bldep-options.hxx> // bldep::cli namespace

namespace bldep
{
  namespace cli
  {
    template <>
    struct parser<path>
    {
      static void
      parse (path&, bool&, scanner&);

      static void
      merge (path& b, const path& a) {b = a;}
    };

    template <>
    struct parser<dir_path>
    {
      static void
      parse (dir_path&, bool&, scanner&);

      static void
      merge (dir_path& b, const dir_path& a) {b = a;}
    };

    template <>
    struct parser<ilp64_fallback>
    {
      static void
      parse (ilp64_fallback&, bool&, scanner&);

      static void
      merge (ilp64_fallback& b, const ilp64_fallback& a) {b = a;}
    };
  }
}

#endif // BLDEP_TYPES_PARSERS_HXX
