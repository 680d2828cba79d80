// file      : bldep/resolver.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/resolver.hxx>

#include <bldep/modules.hxx>
#include <bldep/diagnostics.hxx>
#include <bldep/library-version.hxx>
#include <bldep/symbol-verifier.hxx>
#include <bldep/machine-override.hxx>

using namespace std;

namespace bldep
{
  resolved_dependency resolver::
  resolve (const dependency_request& rq) const
  {
    tracer trace ("resolver::resolve");

    const library_family* f (registry_.find (rq.name));

    if (f == nullptr)
      throw configuration_error ("unknown library family '" + rq.name + '\'');

    module_set ms (parse_modules (rq.modules));

    machine_context& mc (rq.for_machine == machine::build ? build_ : host_);

    symbol_verifier sv (mc.compiler, f->ilp64_suffix);

    auto df = make_diag_frame (
      [&rq] (const diag_record& dr)
      {
        dr << info << "while resolving " << rq.name << " for "
           << rq.for_machine << " machine";
      });

    l4 ([&]{trace << "resolving " << f->name << ' ' << ms.variant << " for "
                  << rq.for_machine << " machine";});

    resolved_dependency r;
    r.name = f->name;
    r.variant = ms.variant;

    strategy_result sr;

    if (optional<machine_override> o = resolve_override (f->name,
                                                          mc.properties))
    {
      if (f->lp64_libraries.empty () && f->ilp64_libraries.empty ())
        throw configuration_error (
          "library family '" + f->name + "' cannot be overridden in machine "
          "file");

      l4 ([&]{trace << "using machine file override " << o->include_dir
                    << ' ' << o->library_dir;});

      sr = probe_override (*f, *o, ms, sv, fallback_);

      if (sr.found)
        r.method = "machine-file";
    }
    else
    {
      for (strategy_kind k: f->strategies)
      {
        sr = probe (k, *f, mc, ms, sv, fallback_);

        if (sr.found)
        {
          r.method = to_string (k);
          break;
        }

        l4 ([&]{trace << k << " strategy did not find " << f->name;});
      }
    }

    if (sr.found)
    {
      r.found = true;
      r.version = version (*f, mc, sr);
      r.compile_args = move (sr.compile_args);
      r.link_args = move (sr.link_args);

      r.cblas = ms.cblas;
      r.lapack = ms.lapack;
      r.lapacke = ms.lapacke;

      l2 ([&]{text << "dependency " << r.name << ' ' << r.variant
                   << " found via " << r.method << ", version "
                   << r.version;});
    }
    else
      l2 ([&]{text << "dependency " << f->name << ' ' << ms.variant
                   << " not found";});

    return r;
  }

  string resolver::
  version (const library_family& f,
           machine_context& mc,
           const strategy_result& sr) const
  {
    if (sr.version)
      return extract_version (*sr.version);

    if (f.version_macro.empty () || f.header.empty ())
      return unknown_version;

    optional<string> d (
      mc.compiler.get_define (f.version_macro,
                              "#include <" + f.header + ">",
                              sr.compile_args));

    return d ? extract_version (*d) : unknown_version;
  }
}
