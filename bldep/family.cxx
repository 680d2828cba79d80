// file      : bldep/family.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/family.hxx>

using namespace std;

namespace bldep
{
  string
  to_string (strategy_kind k)
  {
    switch (k)
    {
    case strategy_kind::system:           return "system";
    case strategy_kind::package_metadata: return "pkg-config";
    case strategy_kind::build_config:     return "cmake";
    case strategy_kind::framework:        return "framework";
    }

    return string (); // Can't be here.
  }

  string
  to_string (ilp64_fallback p)
  {
    switch (p)
    {
    case ilp64_fallback::verify:  return "verify";
    case ilp64_fallback::exclude: return "exclude";
    }

    return string (); // Can't be here.
  }

  ilp64_fallback
  to_ilp64_fallback (const string& s)
  {
         if (s == "verify")  return ilp64_fallback::verify;
    else if (s == "exclude") return ilp64_fallback::exclude;
    else throw invalid_argument ("invalid ILP64 fallback policy '" + s + '\'');
  }

  strings
  library_candidates (const library_family& f,
                      interface_variant v,
                      ilp64_fallback p)
  {
    if (v == interface_variant::lp64)
      return f.lp64_libraries;

    strings r (f.ilp64_libraries);

    if (p == ilp64_fallback::verify && !f.ilp64_suffix.empty ())
    {
      for (const string& n: f.lp64_libraries)
      {
        if (find (r.begin (), r.end (), n) == r.end ())
          r.push_back (n);
      }
    }

    return r;
  }

  void family_registry::
  insert (library_family f)
  {
    if (families_.find (f.name) != families_.end ())
      throw invalid_argument ("library family '" + f.name +
                              "' is already registered");

    string n (f.name);
    families_.emplace (move (n), move (f));
  }

  const library_family* family_registry::
  find (const string& n) const
  {
    auto i (families_.find (n));
    return i != families_.end () ? &i->second : nullptr;
  }

  // pkg-config package names for the built-in families.
  //
  static strings
  openblas_packages (const module_set& ms)
  {
    return strings {ms.variant == interface_variant::ilp64
                    ? "openblas64"
                    : "openblas"};
  }

  // The reference implementation ships each interface as a separate
  // library with its own .pc file.
  //
  static strings
  netlib_packages (const module_set& ms)
  {
    const char* s (ms.variant == interface_variant::ilp64 ? "64" : "");

    strings r {string ("blas") + s};

    if (ms.cblas)   r.push_back (string ("cblas") + s);
    if (ms.lapack)  r.push_back (string ("lapack") + s);
    if (ms.lapacke) r.push_back (string ("lapacke") + s);

    return r;
  }

  static strings
  mkl_packages (const module_set& ms)
  {
    return strings {ms.variant == interface_variant::ilp64
                    ? "mkl-dynamic-ilp64-seq"
                    : "mkl-dynamic-lp64-seq"};
  }

  static strings
  armpl_packages (const module_set& ms)
  {
    return strings {ms.variant == interface_variant::ilp64
                    ? "armpl-dynamic-ilp64-seq"
                    : "armpl-dynamic-lp64-seq"};
  }

  family_registry
  default_family_registry ()
  {
    family_registry r;

    // OpenBLAS.
    //
    // The ILP64 build is normally shipped as libopenblas64_ (NumPy/SciPy
    // wheels, most Linux distributions) or libopenblas_ilp64, with the 64_
    // symbol suffix in both cases.
    //
    {
      library_family f;
      f.name = "openblas";
      f.strategies = {strategy_kind::system,
                      strategy_kind::package_metadata,
                      strategy_kind::build_config};
      f.lp64_libraries = {"openblas"};
      f.ilp64_libraries = {"openblas64_", "openblas_ilp64"};
      f.header = "openblas_config.h";
      f.version_macro = "OPENBLAS_VERSION";
      f.metadata_packages = &openblas_packages;
      f.cmake_package = "OpenBLAS";
      r.insert (move (f));
    }

    // Netlib reference implementation.
    //
    {
      library_family f;
      f.name = "netlib";
      f.strategies = {strategy_kind::package_metadata,
                      strategy_kind::system};
      f.lp64_libraries = {"blas"};
      f.ilp64_libraries = {"blas64"};
      f.header = "cblas.h";
      f.metadata_packages = &netlib_packages;
      r.insert (move (f));
    }

    // MKL.
    //
    // The single dynamic library (mkl_rt) defaults to LP64. ILP64 is linked
    // explicitly via the interface library followed by the threading and
    // core layers. The ILP64 symbols are not suffixed and the headers need
    // MKL_ILP64 to declare the 64-bit integer types.
    //
    {
      library_family f;
      f.name = "mkl";
      f.strategies = {strategy_kind::package_metadata,
                      strategy_kind::system,
                      strategy_kind::build_config};
      f.lp64_libraries = {"mkl_rt"};
      f.ilp64_libraries = {"mkl_intel_ilp64"};
      f.ilp64_companions = {"mkl_sequential", "mkl_core"};
      f.ilp64_defines = {"-DMKL_ILP64"};
      f.header = "mkl.h";
      f.metadata_packages = &mkl_packages;
      f.cmake_package = "MKL";
      f.ilp64_suffix = "";
      r.insert (move (f));
    }

    // ArmPL.
    //
    // The interfaces are separate libraries with the same unsuffixed symbol
    // names.
    //
    {
      library_family f;
      f.name = "armpl";
      f.strategies = {strategy_kind::system,
                      strategy_kind::package_metadata};
      f.lp64_libraries = {"armpl_lp64"};
      f.ilp64_libraries = {"armpl_ilp64"};
      f.ilp64_defines = {"-DINTEGER64"};
      f.header = "armpl.h";
      f.metadata_packages = &armpl_packages;
      f.ilp64_suffix = "";
      r.insert (move (f));
    }

    // Accelerate.
    //
    // The new LAPACK interface (including ILP64) is only available starting
    // from macOS 13.3 and is selected with the ACCELERATE_* macros. Note that
    // the ILP64 symbols are aliased by the framework headers so the suffix
    // is irrelevant.
    //
    {
      library_family f;
      f.name = "accelerate";
      f.strategies = {strategy_kind::framework};
      f.header = "Accelerate/Accelerate.h";
      f.framework = "Accelerate";
      f.framework_min_os_version = "13.3";
      f.framework_defines = {"-DACCELERATE_NEW_LAPACK"};
      f.ilp64_defines = {"-DACCELERATE_LAPACK_ILP64"};
      r.insert (move (f));
    }

    return r;
  }
}
