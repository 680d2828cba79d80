// file      : bldep/machine-override.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/machine-override.hxx>

#include <bldep/diagnostics.hxx>

using namespace std;

namespace bldep
{
  optional<machine_override>
  resolve_override (const string& f, const machine_properties& ps)
  {
    string in (f + "_includedir");
    string ln (f + "_librarydir");

    auto value = [&ps] (const string& n) -> const string*
    {
      auto i (ps.find (n));
      return i != ps.end () && !i->second.empty () ? &i->second : nullptr;
    };

    const string* iv (value (in));
    const string* lv (value (ln));

    if (iv == nullptr && lv == nullptr)
      return nullopt;

    if (iv == nullptr || lv == nullptr)
      throw configuration_error (
        "both " + in + " and " + ln + " must be set in machine file (" +
        (iv != nullptr ? in : ln) + " is set alone)");

    auto dir = [] (const string& n, const string& v) -> dir_path
    {
      try
      {
        dir_path r (v);

        if (r.relative ())
          throw configuration_error (
            n + " value '" + v + "' in machine file must be absolute path");

        return r;
      }
      catch (const invalid_path&)
      {
        throw configuration_error (
          "invalid " + n + " value '" + v + "' in machine file");
      }
    };

    machine_override r;
    r.include_dir = dir (in, *iv);
    r.library_dir = dir (ln, *lv);

    return r;
  }

  strategy_result
  probe_override (const library_family& f,
                  const machine_override& o,
                  const module_set& ms,
                  const symbol_verifier& sv,
                  ilp64_fallback fb)
  {
    tracer trace ("probe_override");

    bool ilp64 (ms.variant == interface_variant::ilp64);

    strings cas {"-I" + o.include_dir.string ()};

    if (ilp64)
      cas.insert (cas.end (), f.ilp64_defines.begin (), f.ilp64_defines.end ());

    for (const string& n: library_candidates (f, ms.variant, fb))
    {
      strings las {"-L" + o.library_dir.string (), "-l" + n};

      if (ilp64)
      {
        for (const string& c: f.ilp64_companions)
          las.push_back ("-l" + c);
      }

      if (sv.verify (ms, las))
        return strategy_result (move (cas), move (las));

      l4 ([&]{trace << "library " << n << " in " << o.library_dir
                    << " failed symbol verification";});
    }

    return strategy_result ();
  }
}
