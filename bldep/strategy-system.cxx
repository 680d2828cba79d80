// file      : bldep/strategy-system.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/strategy-system.hxx>

#include <bldep/diagnostics.hxx>

using namespace std;

namespace bldep
{
  bool system_strategy::
  append_companions (strings& las) const
  {
    const dir_paths& lds (context_.library_dirs);

    for (const string& n: family_.ilp64_companions)
    {
      optional<strings> r (context_.compiler.find_library (n, lds));

      if (!r)
        return false;

      if (!lds.empty ())
      {
        string d ("-L" + path (r->front ()).directory ().string ());

        if (find (las.begin (), las.end (), d) == las.end ())
          las.push_back (move (d));

        las.push_back ("-l" + n);
      }
      else
        las.insert (las.end (), r->begin (), r->end ());
    }

    return true;
  }

  strategy_result system_strategy::
  probe (const module_set& ms) const
  {
    tracer trace ("system_strategy::probe");

    const dir_paths& lds (context_.library_dirs);
    bool ilp64 (ms.variant == interface_variant::ilp64);

    strings cas;
    for (const dir_path& d: context_.include_dirs)
      cas.push_back ("-I" + d.string ());

    if (ilp64)
      cas.insert (cas.end (),
                  family_.ilp64_defines.begin (),
                  family_.ilp64_defines.end ());

    // The header does not depend on the library name so only check it once,
    // when the first library is found.
    //
    optional<bool> header;

    for (const string& n: library_candidates (family_, ms.variant, fallback_))
    {
      optional<strings> las (context_.compiler.find_library (n, lds));

      if (!las)
      {
        l4 ([&]{trace << "library " << n << " not found";});
        continue;
      }

      if (!header)
        header = family_.header.empty () ||
                 context_.compiler.has_header (family_.header, cas);

      if (!*header)
      {
        l4 ([&]{trace << "library " << n << " found but header "
                      << family_.header << " is not";});
        continue;
      }

      if (!lds.empty ())
      {
        // The compiler probe returns the library file path in this case.
        //
        path f (las->front ());
        *las = strings {"-L" + f.directory ().string (), "-l" + n};
      }

      if (ilp64 && !family_.ilp64_companions.empty ())
      {
        if (!append_companions (*las))
        {
          l4 ([&]{trace << "library " << n << " found but its companion "
                        << "libraries are not";});
          continue;
        }
      }

      if (!verifier_.verify (ms, *las))
      {
        l4 ([&]{trace << "library " << n << " failed symbol verification";});
        continue;
      }

      l4 ([&]{trace << "library " << n << " found";});

      return strategy_result (move (cas), move (*las));
    }

    return strategy_result ();
  }
}
