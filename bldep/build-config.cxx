// file      : bldep/build-config.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/build-config.hxx>

#include <bldep/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace bldep
{
  build_config_lookup::
  ~build_config_lookup ()
  {
    // vtable
  }

  cmake_package::
  cmake_package (process_path pp, string cid)
      : cmake_ (move (pp)), compiler_id_ (move (cid))
  {
  }

  optional<string> cmake_package::
  run (const string& p, const char* m)
  {
    string n ("-DNAME=" + p);
    string c ("-DCOMPILER_ID=" + compiler_id_);
    string l ("-DLANGUAGE=C");
    string o (string ("-DMODE=") + m);

    cstrings args {cmake_.recall_string (),
                   "--find-package",
                   n.c_str (),
                   c.c_str (),
                   l.c_str (),
                   o.c_str (),
                   nullptr};

    return run_capture (cmake_, args);
  }

  optional<build_config> cmake_package::
  find (const string& p)
  {
    tracer trace ("cmake_package::find");

    // In the EXIST mode cmake exits with non-zero code if the package is not
    // found.
    //
    if (!run (p, "EXIST"))
    {
      l4 ([&]{trace << "no cmake package " << p;});
      return nullopt;
    }

    auto flags = [this, &p] (const char* m) -> strings
    {
      optional<string> s (run (p, m));

      if (!s)
        fail << cmake_.recall_string () << " --find-package " << m
             << " mode failed for package " << p;

      try
      {
        return split_args (*s);
      }
      catch (const invalid_argument& e)
      {
        fail << "invalid " << cmake_.recall_string () << " --find-package "
             << m << " output for package " << p << ": " << e << endf;
      }
    };

    build_config r;
    r.compile_args = flags ("COMPILE");
    r.link_args = flags ("LINK");

    l4 ([&]{trace << "found " << p;});

    return r;
  }
}
