// file      : bldep/manifest.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/manifest.hxx>

#include <sstream>

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;
using namespace butl;

namespace bldep
{
  static string
  serialize (const resolved_dependency& d)
  {
    ostringstream os;
    manifest_serializer s (os, "test");
    serialize (s, d);
    return os.str ();
  }

  static bool
  contains (const string& s, const string& l)
  {
    return s.find (l + '\n') != string::npos;
  }

  int
  main ()
  {
    // Arguments.
    //
    assert (join_args ({}) == "");
    assert (join_args ({"-I/usr/include", "-lopenblas"}) ==
            "-I/usr/include -lopenblas");
    assert (join_args ({"-I/opt/My Libs/include"}) ==
            "'-I/opt/My Libs/include'");
    assert (join_args ({"-DX='1'"}) == "\"-DX='1'\"");
    assert (join_args ({"-framework", "Accelerate"}) ==
            "-framework Accelerate");

    {
      strings as {"-L/opt/My Libs/lib", "-lblas", "-DV=\"x\""};
      assert (split_args (join_args (as)) == as);
    }

    // Found.
    //
    {
      resolved_dependency d;
      d.found = true;
      d.name = "openblas";
      d.method = "pkg-config";
      d.version = "0.3.21";
      d.variant = interface_variant::ilp64;
      d.cblas = d.lapack = true;
      d.compile_args = {"-I/usr/include/openblas64"};
      d.link_args = {"-lopenblas64_"};

      string s (serialize (d));

      assert (s.compare (0, 4, ": 1\n") == 0);
      assert (contains (s, "name: openblas"));
      assert (contains (s, "found: true"));
      assert (contains (s, "method: pkg-config"));
      assert (contains (s, "version: 0.3.21"));
      assert (contains (s, "interface: ilp64"));
      assert (contains (s, "capabilities: cblas lapack"));
      assert (contains (s, "compile-options: -I/usr/include/openblas64"));
      assert (contains (s, "link-options: -lopenblas64_"));
    }

    // Not found.
    //
    {
      resolved_dependency d;
      d.name = "mkl";

      string s (serialize (d));

      assert (contains (s, "name: mkl"));
      assert (contains (s, "found: false"));
      assert (contains (s, "interface: lp64"));
      assert (s.find ("method:") == string::npos);
      assert (s.find ("version:") == string::npos);
      assert (s.find ("link-options:") == string::npos);
    }

    return 0;
  }
}

int
main ()
{
  return bldep::main ();
}
