// file      : bldep/compiler-probe.test.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_COMPILER_PROBE_TEST_HXX
#define BLDEP_COMPILER_PROBE_TEST_HXX

#include <set>

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/build-config.hxx>
#include <bldep/compiler-probe.hxx>
#include <bldep/package-metadata.hxx>

namespace bldep
{
  // Scripted compiler probe that simulates a toolchain with the specified
  // libraries, headers, macros, and frameworks.
  //
  // A library is installed either into a directory or, if the directory is
  // empty, into the toolchain's default search path. The program links if
  // every -l<name> argument refers to a library that is in the default
  // search path or in one of the -L directories and the libraries together
  // export every symbol the program declares (extern void <name> (void);).
  //
  class fake_compiler_probe: public compiler_probe
  {
  public:
    struct library
    {
      dir_path         dir;
      std::set<string> exports;
    };

    map<string, library> libraries;
    std::set<string>     headers;
    map<string, string>  defines;
    std::set<string>     frameworks;

    // Number of calls of each kind.
    //
    size_t find_library_calls   = 0;
    size_t has_header_calls     = 0;
    size_t get_define_calls     = 0;
    size_t links_program_calls  = 0;
    size_t find_framework_calls = 0;

    size_t
    calls () const
    {
      return find_library_calls +
             has_header_calls +
             get_define_calls +
             links_program_calls +
             find_framework_calls;
    }

    // Argument lists of the links_program() calls.
    //
    vector<strings> linked;

    void
    add_library (const string& n,
                 std::set<string> exports,
                 dir_path d = dir_path ())
    {
      libraries[n] = library {move (d), move (exports)};
    }

    virtual optional<strings>
    find_library (const string& n, const dir_paths& ds) override
    {
      ++find_library_calls;

      auto i (libraries.find (n));
      if (i == libraries.end ())
        return nullopt;

      const dir_path& d (i->second.dir);

      if (ds.empty ())
      {
        if (!d.empty ())
          return nullopt;

        return strings {"-l" + n};
      }

      if (std::find (ds.begin (), ds.end (), d) == ds.end ())
        return nullopt;

      return strings {(d / path ("lib" + n + ".so")).string ()};
    }

    virtual bool
    has_header (const string& n, const strings&) override
    {
      ++has_header_calls;
      return headers.find (n) != headers.end ();
    }

    virtual optional<string>
    get_define (const string& m, const string&, const strings&) override
    {
      ++get_define_calls;

      auto i (defines.find (m));
      if (i == defines.end ())
        return nullopt;

      return i->second;
    }

    virtual bool
    links_program (const string& src, const strings& args) override
    {
      ++links_program_calls;
      linked.push_back (args);

      dir_paths ds;
      for (const string& a: args)
      {
        if (a.compare (0, 2, "-L") == 0)
          ds.push_back (dir_path (string (a, 2)));
      }

      std::set<string> exports;
      for (const string& a: args)
      {
        if (a.compare (0, 2, "-l") != 0)
          continue;

        auto i (libraries.find (string (a, 2)));
        if (i == libraries.end ())
          return false;

        const library& l (i->second);

        if (!l.dir.empty () &&
            std::find (ds.begin (), ds.end (), l.dir) == ds.end ())
          return false;

        exports.insert (l.exports.begin (), l.exports.end ());
      }

      const string p ("extern void ");
      for (size_t b (src.find (p)); b != string::npos; b = src.find (p, b))
      {
        b += p.size ();
        string s (src, b, src.find (' ', b) - b);

        if (exports.find (s) == exports.end ())
          return false;
      }

      return true;
    }

    virtual optional<strings>
    find_framework (const string& n) override
    {
      ++find_framework_calls;

      if (frameworks.find (n) == frameworks.end ())
        return nullopt;

      return strings {"-framework", n};
    }
  };

  // Scripted pkg-config.
  //
  class fake_package_metadata: public package_metadata_lookup
  {
  public:
    map<string, package_metadata> packages;
    strings                       queried;

    virtual optional<package_metadata>
    find (const string& n) override
    {
      queried.push_back (n);

      auto i (packages.find (n));
      if (i == packages.end ())
        return nullopt;

      return i->second;
    }
  };

  // Scripted CMake package lookup.
  //
  class fake_build_config: public build_config_lookup
  {
  public:
    map<string, build_config> packages;
    strings                   queried;

    virtual optional<build_config>
    find (const string& n) override
    {
      queried.push_back (n);

      auto i (packages.find (n));
      if (i == packages.end ())
        return nullopt;

      return i->second;
    }
  };
}

#endif // BLDEP_COMPILER_PROBE_TEST_HXX
