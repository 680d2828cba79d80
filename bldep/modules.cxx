// file      : bldep/modules.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/modules.hxx>

using namespace std;

namespace bldep
{
  module_set
  parse_modules (const strings& ms)
  {
    module_set r;
    optional<string> iface; // First interface token, for diagnostics.

    for (const string& m: ms)
    {
      if (m.compare (0, 10, "interface:") == 0)
      {
        if (iface)
          throw configuration_error (
            "multiple interfaces specified: '" + *iface + "' and '" + m +
            '\'');

        string v (m, 10);

        try
        {
          r.variant = to_interface_variant (v);
        }
        catch (const invalid_argument&)
        {
          throw configuration_error (
            "unknown interface '" + v + "' in module '" + m +
            "': expected lp64 or ilp64");
        }

        iface = m;
      }
      else if (m == "cblas")   r.cblas = true;
      else if (m == "lapack")  r.lapack = true;
      else if (m == "lapacke") r.lapacke = true;
      else
        throw configuration_error ("unknown module '" + m + '\'');
    }

    return r;
  }
}
