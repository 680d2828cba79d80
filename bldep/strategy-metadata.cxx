// file      : bldep/strategy-metadata.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/strategy-metadata.hxx>

#include <iterator> // make_move_iterator()

#include <bldep/diagnostics.hxx>

using namespace std;

namespace bldep
{
  // Append the compile arguments skipping those already present. Packages
  // of the same vendor normally share the include directories.
  //
  static void
  append_compile_args (strings& to, strings&& from)
  {
    for (string& a: from)
    {
      if (find (to.begin (), to.end (), a) == to.end ())
        to.push_back (move (a));
    }
  }

  strategy_result metadata_strategy::
  probe (const module_set& ms) const
  {
    tracer trace ("metadata_strategy::probe");

    if (context_.metadata == nullptr || !family_.metadata_packages)
      return strategy_result ();

    strings cas;
    strings las;
    optional<string> ver;

    for (const string& p: family_.metadata_packages (ms))
    {
      optional<package_metadata> m (context_.metadata->find (p));

      if (!m)
      {
        l4 ([&]{trace << "package " << p << " not found";});
        return strategy_result ();
      }

      append_compile_args (cas, move (m->compile_args));

      // The link arguments are kept as is since the order matters with
      // static libraries.
      //
      las.insert (las.end (),
                  make_move_iterator (m->link_args.begin ()),
                  make_move_iterator (m->link_args.end ()));

      if (!ver && !m->version.empty ())
        ver = move (m->version);
    }

    if (!verifier_.verify (ms, las))
    {
      l4 ([&]{trace << "package metadata failed symbol verification";});
      return strategy_result ();
    }

    return strategy_result (move (cas), move (las), move (ver));
  }
}
