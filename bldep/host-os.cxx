// file      : bldep/host-os.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/host-os.hxx>

#include <bldep/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace bldep
{
  string
  host_os_version (const target_triplet& host)
  {
    tracer trace ("host_os_version");

    if (host.class_ != "macos")
      return string ();

    process_path pp;
    try
    {
      pp = process::path_search ("sw_vers", true /* init */);
    }
    catch (const process_error& e)
    {
      l4 ([&]{trace << "unable to find sw_vers: " << e;});
      return string ();
    }

    cstrings args {pp.recall_string (), "-productVersion", nullptr};

    optional<string> o (run_capture (pp, args));

    if (!o)
    {
      l4 ([&]{trace << "sw_vers exited with non-zero code";});
      return string ();
    }

    string r (move (*o));
    trim (r);

    l4 ([&]{trace << "macOS version " << r;});
    return r;
  }
}
