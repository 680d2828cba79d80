// file      : bldep/symbol-verifier.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/symbol-verifier.hxx>

#include <bldep/diagnostics.hxx>

using namespace std;

namespace bldep
{
  strings symbol_verifier::
  symbols (const module_set& ms) const
  {
    strings r {"dgemm_"};

    if (ms.cblas)   r.push_back ("cblas_dgemm");
    if (ms.lapack)  r.push_back ("zungqr_");
    if (ms.lapacke) r.push_back ("LAPACKE_zungqr");

    const string& s (ms.variant == interface_variant::ilp64
                     ? ilp64_suffix_
                     : empty_string);

    if (!s.empty ())
    {
      for (string& n: r)
        n += s;
    }

    return r;
  }

  string symbol_verifier::
  program (const strings& ss)
  {
    // We only care about the symbols being resolved by the linker, not about
    // the signatures, so declare them as taking no arguments. Note that the
    // program is never executed.
    //
    string r;

    for (const string& s: ss)
      r += "extern void " + s + " (void);\n";

    r += "\nint main (void)\n{\n";

    for (const string& s: ss)
      r += "  " + s + " ();\n";

    r += "  return 0;\n}\n";

    return r;
  }

  bool symbol_verifier::
  verify (const module_set& ms, const strings& las) const
  {
    tracer trace ("symbol_verifier::verify");

    strings ss (symbols (ms));

    bool r (cc_.links_program (program (ss), las));

    l4 ([&]{
        diag_record dr (trace);
        dr << (r ? "resolved" : "unresolved") << ' ' << ms.variant
           << " symbols";
        for (const string& s: ss) dr << ' ' << s;
        dr << " with";
        for (const string& a: las) dr << ' ' << a;
      });

    return r;
  }
}
