// file      : bldep/strategy.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/strategy.hxx>

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/strategy-framework.hxx>

#undef NDEBUG
#include <cassert>

#include <bldep/compiler-probe.test.hxx>

using namespace std;

namespace bldep
{
  static const target_triplet linux_target ("x86_64-linux-gnu");
  static const target_triplet macos_target ("aarch64-apple-darwin23.1.0");

  static void
  test_system (const family_registry& r)
  {
    const library_family& ob (*r.find ("openblas"));

    // Default search paths.
    //
    {
      fake_compiler_probe cc;
      cc.add_library ("openblas", {"dgemm_", "cblas_dgemm"});
      cc.headers.insert ("openblas_config.h");

      machine_context c (linux_target, cc);
      symbol_verifier sv (cc);

      module_set ms;
      ms.cblas = true;

      strategy_result sr (
        probe (strategy_kind::system, ob, c, ms, sv, ilp64_fallback::verify));

      assert (sr.found);
      assert (sr.compile_args.empty ());
      assert ((sr.link_args == strings {"-lopenblas"}));
      assert (!sr.version);

      // LAPACK is not provided.
      //
      ms.lapack = true;
      assert (!probe (strategy_kind::system,
                      ob, c, ms, sv, ilp64_fallback::verify).found);
    }

    // Header is missing.
    //
    {
      fake_compiler_probe cc;
      cc.add_library ("openblas", {"dgemm_"});

      machine_context c (linux_target, cc);
      symbol_verifier sv (cc);

      assert (!probe (strategy_kind::system,
                      ob, c, module_set (), sv, ilp64_fallback::verify).found);
      assert (cc.links_program_calls == 0);
    }

    // Extra directories. The first ILP64 candidate only exports the LP64
    // symbols so the second one is picked.
    //
    {
      fake_compiler_probe cc;
      cc.add_library ("openblas64_", {"dgemm_"}, dir_path ("/opt/a/lib"));
      cc.add_library ("openblas_ilp64",
                      {"dgemm_64_"},
                      dir_path ("/opt/b/lib"));
      cc.headers.insert ("openblas_config.h");

      machine_context c (linux_target, cc);
      c.library_dirs = {dir_path ("/opt/a/lib"), dir_path ("/opt/b/lib")};
      c.include_dirs = {dir_path ("/opt/a/include")};

      symbol_verifier sv (cc);

      module_set ms;
      ms.variant = interface_variant::ilp64;

      strategy_result sr (
        probe (strategy_kind::system, ob, c, ms, sv, ilp64_fallback::verify));

      assert (sr.found);
      assert ((sr.compile_args == strings {"-I/opt/a/include"}));
      assert ((sr.link_args == strings {"-L/opt/b/lib", "-lopenblas_ilp64"}));

      // The header is only checked once.
      //
      assert (cc.has_header_calls == 1);
      assert (cc.links_program_calls == 2);
    }

    // ILP64 fallback to the LP64 library name.
    //
    {
      fake_compiler_probe cc;
      cc.add_library ("openblas", {"dgemm_"});
      cc.headers.insert ("openblas_config.h");

      machine_context c (linux_target, cc);
      symbol_verifier sv (cc);

      module_set ms;
      ms.variant = interface_variant::ilp64;

      // Only LP64 symbols: not found whatever the policy.
      //
      assert (!probe (strategy_kind::system,
                      ob, c, ms, sv, ilp64_fallback::verify).found);

      cc.libraries["openblas"].exports.insert ("dgemm_64_");

      strategy_result sr (
        probe (strategy_kind::system, ob, c, ms, sv, ilp64_fallback::verify));
      assert (sr.found && (sr.link_args == strings {"-lopenblas"}));

      assert (!probe (strategy_kind::system,
                      ob, c, ms, sv, ilp64_fallback::exclude).found);
    }

    // ILP64 interface library followed by its companions.
    //
    {
      const library_family& mkl (*r.find ("mkl"));
      const dir_path d ("/opt/mkl/lib");

      fake_compiler_probe cc;
      cc.add_library ("mkl_intel_ilp64", {"dgemm_", "cblas_dgemm"}, d);
      cc.add_library ("mkl_sequential", {}, d);
      cc.add_library ("mkl_core", {}, d);
      cc.headers.insert ("mkl.h");

      machine_context c (linux_target, cc);
      c.library_dirs = {d};

      symbol_verifier sv (cc, mkl.ilp64_suffix);

      module_set ms;
      ms.variant = interface_variant::ilp64;
      ms.cblas = true;

      strategy_result sr (
        probe (strategy_kind::system, mkl, c, ms, sv, ilp64_fallback::verify));

      assert (sr.found);
      assert ((sr.compile_args == strings {"-DMKL_ILP64"}));
      assert ((sr.link_args == strings {"-L/opt/mkl/lib",
                                        "-lmkl_intel_ilp64",
                                        "-lmkl_sequential",
                                        "-lmkl_core"}));

      // Missing core layer.
      //
      cc.libraries.erase ("mkl_core");
      assert (!probe (strategy_kind::system,
                      mkl, c, ms, sv, ilp64_fallback::verify).found);
    }
  }

  static void
  test_metadata (const family_registry& r)
  {
    const library_family& nl (*r.find ("netlib"));

    fake_compiler_probe cc;
    cc.add_library ("blas", {"dgemm_"});
    cc.add_library ("lapack", {"zungqr_"});

    fake_package_metadata pm;
    pm.packages["blas"] =
      package_metadata {{"-I/usr/include"}, {"-lblas"}, ""};
    pm.packages["lapack"] =
      package_metadata {{"-I/usr/include"}, {"-llapack", "-lblas"}, "3.12.0"};

    machine_context c (linux_target, cc, &pm);
    symbol_verifier sv (cc);

    module_set ms;
    ms.lapack = true;

    strategy_result sr (probe (strategy_kind::package_metadata,
                               nl, c, ms, sv, ilp64_fallback::verify));

    assert (sr.found);
    assert ((pm.queried == strings {"blas", "lapack"}));
    assert ((sr.compile_args == strings {"-I/usr/include"}));
    assert ((sr.link_args == strings {"-lblas", "-llapack", "-lblas"}));
    assert (sr.version && *sr.version == "3.12.0");

    // All the packages must be present.
    //
    ms.lapacke = true;
    assert (!probe (strategy_kind::package_metadata,
                    nl, c, ms, sv, ilp64_fallback::verify).found);

    // Metadata that lies about the interface.
    //
    pm.packages["blas64"] =
      package_metadata {{}, {"-lblas"}, "3.12.0"};

    ms = module_set ();
    ms.variant = interface_variant::ilp64;
    assert (!probe (strategy_kind::package_metadata,
                    nl, c, ms, sv, ilp64_fallback::verify).found);

    // No pkg-config.
    //
    machine_context nc (linux_target, cc);
    assert (!probe (strategy_kind::package_metadata,
                    nl, nc, module_set (), sv, ilp64_fallback::verify).found);
  }

  static void
  test_build_config (const family_registry& r)
  {
    const library_family& mkl (*r.find ("mkl"));

    fake_compiler_probe cc;
    cc.add_library ("mkl_intel_ilp64",
                    {"dgemm_", "cblas_dgemm"},
                    dir_path ("/opt/mkl"));

    fake_build_config bc;
    bc.packages["MKL"] =
      build_config {{"-I/opt/mkl/include", "-DMKL_ILP64"},
                    {"-L/opt/mkl", "-lmkl_intel_ilp64"}};

    machine_context c (linux_target, cc, nullptr, &bc);
    symbol_verifier sv (cc, mkl.ilp64_suffix);

    module_set ms;
    ms.cblas = true;
    ms.variant = interface_variant::ilp64;

    strategy_result sr (probe (strategy_kind::build_config,
                               mkl, c, ms, sv, ilp64_fallback::verify));

    assert (sr.found);
    assert ((bc.queried == strings {"MKL"}));
    assert ((sr.compile_args == strings {"-I/opt/mkl/include",
                                         "-DMKL_ILP64"}));
    assert ((sr.link_args == strings {"-L/opt/mkl", "-lmkl_intel_ilp64"}));
    assert (!sr.version);

    // Family without a CMake package.
    //
    const library_family& ap (*r.find ("armpl"));
    assert (!probe (strategy_kind::build_config,
                    ap, c, ms, sv, ilp64_fallback::verify).found);
    assert (bc.queried.size () == 1);
  }

  static void
  test_framework (const family_registry& r)
  {
    const library_family& ac (*r.find ("accelerate"));

    assert (framework_strategy::eligible ("13.3", "13.3"));
    assert (framework_strategy::eligible ("14", "13.3"));
    assert (framework_strategy::eligible ("13.4.1", "13.3"));
    assert (!framework_strategy::eligible ("13.2.1", "13.3"));
    assert (!framework_strategy::eligible ("", "13.3"));
    assert (!framework_strategy::eligible ("unknown", "13.3"));
    assert (framework_strategy::eligible ("", ""));

    fake_compiler_probe cc;
    cc.frameworks.insert ("Accelerate");
    cc.headers.insert ("Accelerate/Accelerate.h");

    symbol_verifier sv (cc);

    {
      machine_context c (macos_target, cc);
      c.os_version = "14.2.1";

      module_set ms;
      ms.variant = interface_variant::ilp64;
      ms.lapack = true;

      strategy_result sr (probe (strategy_kind::framework,
                                 ac, c, ms, sv, ilp64_fallback::verify));

      assert (sr.found);
      assert ((sr.compile_args == strings {"-DACCELERATE_NEW_LAPACK",
                                           "-DACCELERATE_LAPACK_ILP64"}));
      assert ((sr.link_args == strings {"-framework", "Accelerate"}));
      assert (sr.version && *sr.version == "14.2.1");

      // Not symbol-verified.
      //
      assert (cc.links_program_calls == 0);

      ms.variant = interface_variant::lp64;
      sr = probe (strategy_kind::framework,
                  ac, c, ms, sv, ilp64_fallback::verify);
      assert ((sr.compile_args == strings {"-DACCELERATE_NEW_LAPACK"}));
    }

    // Major-only OS version.
    //
    {
      machine_context c (macos_target, cc);
      c.os_version = "15";

      strategy_result sr (probe (strategy_kind::framework,
                                 ac, c, module_set (), sv,
                                 ilp64_fallback::verify));

      assert (sr.found);
      assert (sr.version && *sr.version == "15.0");
    }

    // Too old.
    //
    {
      machine_context c (macos_target, cc);
      c.os_version = "13.2";

      size_t n (cc.calls ());
      assert (!probe (strategy_kind::framework,
                      ac, c, module_set (), sv, ilp64_fallback::verify).found);
      assert (cc.calls () == n);
    }

    // Not macOS.
    //
    {
      machine_context c (linux_target, cc);
      c.os_version = "14.0";

      assert (!probe (strategy_kind::framework,
                      ac, c, module_set (), sv, ilp64_fallback::verify).found);
    }
  }

  int
  main ()
  {
    family_registry r (default_family_registry ());

    test_system (r);
    test_metadata (r);
    test_build_config (r);
    test_framework (r);

    return 0;
  }
}

int
main ()
{
  return bldep::main ();
}
