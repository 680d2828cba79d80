// file      : bldep/strategy-framework.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/strategy-framework.hxx>

#include <libbutl/semantic-version.hxx>

#include <bldep/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace bldep
{
  bool framework_strategy::
  eligible (const string& v, const string& m)
  {
    if (m.empty ())
      return true;

    if (v.empty ())
      return false;

    try
    {
      // The OS versions may omit the minor and patch components (e.g., 14).
      //
      return semantic_version (v, semantic_version::allow_omit_minor) >=
             semantic_version (m, semantic_version::allow_omit_minor);
    }
    catch (const invalid_argument&)
    {
      return false;
    }
  }

  strategy_result framework_strategy::
  probe (const module_set& ms) const
  {
    tracer trace ("framework_strategy::probe");

    if (family_.framework.empty () || context_.target.class_ != "macos")
      return strategy_result ();

    const string& osv (context_.os_version);

    if (!eligible (osv, family_.framework_min_os_version))
    {
      l4 ([&]{trace << "framework " << family_.framework << " requires "
                    << "OS version " << family_.framework_min_os_version
                    << " or later, have '" << osv << "'";});
      return strategy_result ();
    }

    optional<strings> las (
      context_.compiler.find_framework (family_.framework));

    if (!las)
    {
      l4 ([&]{trace << "framework " << family_.framework << " not found";});
      return strategy_result ();
    }

    if (!family_.header.empty () &&
        !context_.compiler.has_header (family_.header, *las))
    {
      l4 ([&]{trace << "framework " << family_.framework << " found but "
                    << "header " << family_.header << " is not";});
      return strategy_result ();
    }

    strings cas (family_.framework_defines);

    if (ms.variant == interface_variant::ilp64)
      cas.insert (cas.end (),
                  family_.ilp64_defines.begin (),
                  family_.ilp64_defines.end ());

    // The OS version may be major-only (e.g., 15) while the version is
    // expected to be dotted.
    //
    optional<string> v;
    if (!osv.empty ())
      v = osv.find ('.') == string::npos ? osv + ".0" : osv;

    return strategy_result (move (cas), move (*las), move (v));
  }
}
