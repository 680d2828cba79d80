// file      : bldep/manifest.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/manifest.hxx>

using namespace std;
using namespace butl;

namespace bldep
{
  string
  join_args (const strings& as)
  {
    string r;

    for (const string& a: as)
    {
      if (!r.empty ())
        r += ' ';

      bool sq (a.find ('\'') != string::npos);

      // Note that parse_quoted() does not support escaping so we pick the
      // quote character that doesn't appear in the argument.
      //
      if (a.empty () || a.find_first_of (" \t\"'") != string::npos)
      {
        char q (sq ? '"' : '\'');
        r += q;
        r += a;
        r += q;
      }
      else
        r += a;
    }

    return r;
  }

  void
  serialize (manifest_serializer& s, const resolved_dependency& d)
  {
    s.next ("", "1"); // Start of manifest.

    s.next ("name", d.name);
    s.next ("found", d.found ? "true" : "false");

    if (d.found)
    {
      s.next ("method", d.method);
      s.next ("version", d.version);
    }

    s.next ("interface", to_string (d.variant));

    if (d.found)
    {
      string cs;
      auto add = [&cs] (bool v, const char* n)
      {
        if (v)
        {
          if (!cs.empty ())
            cs += ' ';

          cs += n;
        }
      };

      add (d.cblas,   "cblas");
      add (d.lapack,  "lapack");
      add (d.lapacke, "lapacke");

      if (!cs.empty ())
        s.next ("capabilities", cs);

      if (!d.compile_args.empty ())
        s.next ("compile-options", join_args (d.compile_args));

      if (!d.link_args.empty ())
        s.next ("link-options", join_args (d.link_args));
    }

    s.next ("", ""); // End of manifest.
  }
}
