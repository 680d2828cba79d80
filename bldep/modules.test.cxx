// file      : bldep/modules.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/modules.hxx>

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace bldep
{
  // Return true if parsing the modules throws configuration_error.
  //
  static bool
  invalid (const strings& ms)
  {
    try
    {
      parse_modules (ms);
      return false;
    }
    catch (const configuration_error&)
    {
      return true;
    }
  }

  int
  main ()
  {
    // Defaults.
    //
    {
      module_set r (parse_modules (strings ()));
      assert (r.variant == interface_variant::lp64);
      assert (!r.cblas && !r.lapack && !r.lapacke);
    }

    {
      module_set r (parse_modules ({"cblas", "interface:ilp64", "lapack"}));
      assert (r.variant == interface_variant::ilp64);
      assert (r.cblas && r.lapack && !r.lapacke);
    }

    {
      module_set r (parse_modules ({"interface:lp64", "lapacke"}));
      assert (r.variant == interface_variant::lp64);
      assert (!r.cblas && !r.lapack && r.lapacke);
    }

    // Repeated routine modules are harmless.
    //
    {
      module_set r (parse_modules ({"cblas", "cblas"}));
      assert (r.cblas);
    }

    // Multiple interfaces, even if the same.
    //
    assert (invalid ({"interface:lp64", "interface:ilp64"}));
    assert (invalid ({"interface:ilp64", "interface:ilp64"}));

    // Unknown interface and modules.
    //
    assert (invalid ({"interface:lp32"}));
    assert (invalid ({"interface:"}));
    assert (invalid ({"blas"}));
    assert (invalid ({"CBLAS"}));
    assert (invalid ({"lapack", ""}));

    try
    {
      parse_modules ({"interface:lp64", "interface:ilp64"});
      assert (false);
    }
    catch (const configuration_error& e)
    {
      assert (string (e.what ()).find ("multiple interfaces") !=
              string::npos);
    }

    try
    {
      parse_modules ({"scalapack"});
      assert (false);
    }
    catch (const configuration_error& e)
    {
      assert (string (e.what ()) == "unknown module 'scalapack'");
    }

    return 0;
  }
}

int
main ()
{
  return bldep::main ();
}
