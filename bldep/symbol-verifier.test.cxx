// file      : bldep/symbol-verifier.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/symbol-verifier.hxx>

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#undef NDEBUG
#include <cassert>

#include <bldep/compiler-probe.test.hxx>

using namespace std;

namespace bldep
{
  int
  main ()
  {
    fake_compiler_probe cc;

    // Symbol names.
    //
    {
      symbol_verifier sv (cc);

      module_set ms;
      assert (sv.symbols (ms) == strings {"dgemm_"});

      ms.cblas = ms.lapack = ms.lapacke = true;
      assert ((sv.symbols (ms) == strings {"dgemm_",
                                            "cblas_dgemm",
                                            "zungqr_",
                                            "LAPACKE_zungqr"}));

      ms.variant = interface_variant::ilp64;
      assert ((sv.symbols (ms) ==
               strings {"dgemm_64_",
                        "cblas_dgemm64_",
                        "zungqr_64_",
                        "LAPACKE_zungqr64_"}));

      ms.cblas = false;
      assert ((sv.symbols (ms) ==
               strings {"dgemm_64_", "zungqr_64_", "LAPACKE_zungqr64_"}));
    }

    // Unsuffixed ILP64 (MKL-like).
    //
    {
      symbol_verifier sv (cc, "");

      module_set ms;
      ms.variant = interface_variant::ilp64;
      ms.lapack = true;
      assert ((sv.symbols (ms) == strings {"dgemm_", "zungqr_"}));
    }

    // Program.
    //
    {
      string p (symbol_verifier::program ({"dgemm_", "cblas_dgemm"}));

      assert (p.find ("extern void dgemm_ (void);") != string::npos);
      assert (p.find ("extern void cblas_dgemm (void);") != string::npos);
      assert (p.find ("int main (void)") != string::npos);
      assert (p.find ("  cblas_dgemm ();") != string::npos);
    }

    // Verification.
    //
    {
      cc.add_library ("openblas", {"dgemm_", "cblas_dgemm"});
      cc.add_library ("openblas64_", {"dgemm_64_", "cblas_dgemm64_"});

      symbol_verifier sv (cc);

      module_set ms;
      ms.cblas = true;

      assert (sv.verify (ms, {"-lopenblas"}));
      assert (!sv.verify (ms, {"-lopenblas64_"}));

      // LAPACK is not provided.
      //
      ms.lapack = true;
      assert (!sv.verify (ms, {"-lopenblas"}));

      // LP64 library does not provide ILP64 symbols.
      //
      ms.lapack = false;
      ms.variant = interface_variant::ilp64;
      assert (!sv.verify (ms, {"-lopenblas"}));
      assert (sv.verify (ms, {"-lopenblas64_"}));

      // Missing library.
      //
      assert (!sv.verify (ms, {"-lblas64"}));

      assert (cc.links_program_calls == 6);
    }

    return 0;
  }
}

int
main ()
{
  return bldep::main ();
}
