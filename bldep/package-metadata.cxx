// file      : bldep/package-metadata.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/package-metadata.hxx>

#include <bldep/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace bldep
{
  package_metadata_lookup::
  ~package_metadata_lookup ()
  {
    // vtable
  }

  pkg_config::
  pkg_config (process_path pp, strings env)
      : pkg_config_ (move (pp)), env_ (move (env))
  {
    for (const string& v: env_)
      evars_.push_back (v.c_str ());

    evars_.push_back (nullptr);
  }

  optional<string> pkg_config::
  run (const char* o, const string& n)
  {
    cstrings args {pkg_config_.recall_string (), o, n.c_str (), nullptr};
    return run_capture (pkg_config_, args, evars_.data ());
  }

  optional<package_metadata> pkg_config::
  find (const string& n)
  {
    tracer trace ("pkg_config::find");

    // Note that --modversion fails for unknown packages, so we use it as an
    // existence test.
    //
    optional<string> v (run ("--modversion", n));

    if (!v)
    {
      l4 ([&]{trace << "no pkg-config metadata for " << n;});
      return nullopt;
    }

    package_metadata r;
    r.version = move (trim (*v));

    auto flags = [this, &n] (const char* o) -> strings
    {
      optional<string> s (run (o, n));

      if (!s)
        fail << pkg_config_.recall_string () << ' ' << o << ' ' << n
             << " exited with non-zero code" <<
          info << "package " << n << " metadata is present but unusable";

      try
      {
        return split_args (*s);
      }
      catch (const invalid_argument& e)
      {
        fail << "invalid " << pkg_config_.recall_string () << ' ' << o
             << " output for package " << n << ": " << e << endf;
      }
    };

    r.compile_args = flags ("--cflags");
    r.link_args = flags ("--libs");

    l4 ([&]{trace << "found " << n << ' ' << r.version;});

    return r;
  }
}
