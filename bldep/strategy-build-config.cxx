// file      : bldep/strategy-build-config.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/strategy-build-config.hxx>

#include <bldep/diagnostics.hxx>

using namespace std;

namespace bldep
{
  strategy_result build_config_strategy::
  probe (const module_set& ms) const
  {
    tracer trace ("build_config_strategy::probe");

    if (context_.build_config == nullptr || family_.cmake_package.empty ())
      return strategy_result ();

    optional<build_config> c (
      context_.build_config->find (family_.cmake_package));

    if (!c)
    {
      l4 ([&]{trace << "package " << family_.cmake_package << " not found";});
      return strategy_result ();
    }

    if (!verifier_.verify (ms, c->link_args))
    {
      l4 ([&]{trace << "package " << family_.cmake_package
                    << " failed symbol verification";});
      return strategy_result ();
    }

    return strategy_result (move (c->compile_args), move (c->link_args));
  }
}
