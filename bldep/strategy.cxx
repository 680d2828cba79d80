// file      : bldep/strategy.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/strategy.hxx>

#include <bldep/strategy-system.hxx>
#include <bldep/strategy-metadata.hxx>
#include <bldep/strategy-framework.hxx>
#include <bldep/strategy-build-config.hxx>

using namespace std;

namespace bldep
{
  strategy_result
  probe (strategy_kind k,
         const library_family& f,
         machine_context& c,
         const module_set& ms,
         const symbol_verifier& v,
         ilp64_fallback fb)
  {
    switch (k)
    {
    case strategy_kind::system:
      return system_strategy (f, c, v, fb).probe (ms);
    case strategy_kind::package_metadata:
      return metadata_strategy (f, c, v).probe (ms);
    case strategy_kind::build_config:
      return build_config_strategy (f, c, v).probe (ms);
    case strategy_kind::framework:
      return framework_strategy (f, c).probe (ms);
    }

    return strategy_result (); // Can't be here.
  }
}
