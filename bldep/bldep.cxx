// file      : bldep/bldep.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <cstdlib>   // getenv()
#include <iostream>
#include <exception> // set_terminate(), terminate_handler

#include <libbutl/version.hxx>             // LIBBUTL_VERSION_ID
#include <libbutl/backtrace.hxx>           // backtrace()
#include <libbutl/manifest-serializer.hxx>

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

#include <bldep/version.hxx>
#include <bldep/host-os.hxx>
#include <bldep/manifest.hxx>
#include <bldep/resolver.hxx>
#include <bldep/diagnostics.hxx>
#include <bldep/build-config.hxx>
#include <bldep/machine-file.hxx>
#include <bldep/bldep-options.hxx>
#include <bldep/compiler-probe.hxx>
#include <bldep/package-metadata.hxx>

using namespace std;
using namespace butl;
using namespace bldep;

namespace bldep
{
  // Print backtrace if terminating due to an unhandled exception. Note that
  // custom_terminate is non-static and not a lambda to reduce the noise.
  //
  static terminate_handler default_terminate;

  void
  custom_terminate ()
  {
    *diag_stream << backtrace ();

    if (default_terminate != nullptr)
      default_terminate ();
  }

  // Search for the optional tool. Return empty process path if not found.
  //
  static process_path
  find_tool (const path& n)
  {
    tracer trace ("find_tool");

    process_path r (process::try_path_search (n, true /* init */, exec_dir));

    if (r.empty ())
      l4 ([&]{trace << n << " not found, skipping";});

    return r;
  }

  static process_path
  find_compiler (const path& n)
  {
    try
    {
      return process::path_search (n, true /* init */, exec_dir);
    }
    catch (const process_error& e)
    {
      fail << "unable to find C compiler " << n << ": " << e << endf;
    }
  }

  static target_triplet
  parse_target (const string& t, const char* what)
  {
    try
    {
      return target_triplet (t);
    }
    catch (const invalid_argument& e)
    {
      fail << "invalid " << what << " target '" << t << "': " << e << endf;
    }
  }

  // Query the compiler for its target.
  //
  static target_triplet
  compiler_target (const process_path& cc, const strings& mode)
  {
    cstrings args {cc.recall_string ()};

    for (const string& o: mode)
      args.push_back (o.c_str ());

    args.push_back ("-dumpmachine");
    args.push_back (nullptr);

    optional<string> o (run_capture (cc, args));

    if (!o)
      fail << "unable to obtain " << args[0] << " target" <<
        info << "use --target to specify it explicitly";

    trim (*o);
    return parse_target (*o, args[0]);
  }

  static int
  main (int argc, char* argv[]);
}

int bldep::
main (int argc, char* argv[])
try
{
  using namespace cli;

  tracer trace ("main");

  default_terminate = set_terminate (custom_terminate);

  if (fdterm (stderr_fd ()))
    stderr_term = std::getenv ("TERM");

  exec_dir = path (argv[0]).directory ();

  argv_file_scanner scan (argc, argv, "--options-file");

  options o;
  o.parse (scan, unknown_mode::fail, unknown_mode::stop);

  if (o.version ())
  {
    cout << "bldep " << BLDEP_VERSION_ID << endl
         << "libbutl " << LIBBUTL_VERSION_ID << endl
         << "host " << host_triplet << endl
         << "Copyright (c) " << BLDEP_COPYRIGHT << "." << endl
         << "This is free software released under the MIT license." << endl;
    return 0;
  }

  if (o.help ())
  {
    options::print_usage (cout);
    return 0;
  }

  // Diagnostics verbosity.
  //
  verb = o.verbose_specified ()
    ? o.verbose ()
    : o.v () ? 3 : o.q () ? 0 : 1;

  if (verb > 6)
    fail << "invalid verbosity level " << verb;

  // The family and modules.
  //
  if (!scan.more ())
    fail << "library family expected" <<
      info << "run 'bldep --help' for more information";

  dependency_request rq;
  rq.name = scan.next ();

  while (scan.more ())
    rq.modules.push_back (scan.next ());

  rq.for_machine = o.build () ? machine::build : machine::host;

  init_tmp ();
  keep_tmp = o.keep_tmp ();

  int r (1);
  try
  {
    // Note that the compiler is mandatory while pkg-config and cmake are
    // not.
    //
    process_path cc (find_compiler (o.cc ()));

    const strings& mode (o.cc_option ());

    target_triplet tt (o.target_specified ()
                       ? parse_target (o.target (), "--target")
                       : compiler_target (cc, mode));

    l4 ([&]{trace << "compiler target " << tt;});

    bool native (tt.string () == host_triplet.string ());

    cc_compiler_probe cp (move (cc), mode, tt);

    // The build machine compiler. Only looked up if the build machine is
    // requested and differs from the host compiler.
    //
    unique_ptr<cc_compiler_probe> bcp;
    target_triplet bt (tt);

    if (o.build () && (o.build_cc_specified () || !native))
    {
      process_path bc (find_compiler (o.build_cc_specified ()
                                      ? o.build_cc ()
                                      : path ("cc")));

      const strings& bmode (o.build_cc_option ());

      bt = compiler_target (bc, bmode);

      l4 ([&]{trace << "build compiler target " << bt;});

      bcp.reset (new cc_compiler_probe (move (bc), bmode, bt));
    }

    unique_ptr<pkg_config> pc;
    {
      process_path pp (find_tool (o.pkg_config ()));
      if (!pp.empty ())
        pc.reset (new pkg_config (move (pp)));
    }

    unique_ptr<cmake_package> cm;
    {
      process_path pp (find_tool (o.cmake ()));
      if (!pp.empty ())
        cm.reset (new cmake_package (move (pp)));
    }

    auto context = [&pc, &cm] (const target_triplet& t,
                               compiler_probe& c,
                               const dir_paths& lds,
                               const dir_paths& ids,
                               const path& mf)
    {
      machine_context r (t, c, pc.get (), cm.get ());

      r.os_version = host_os_version (t);
      r.library_dirs = lds;
      r.include_dirs = ids;

      if (!mf.empty ())
        r.properties = load_machine_file (mf);

      return r;
    };

    machine_context host (context (tt,
                                   cp,
                                   o.lib_dir (),
                                   o.include_dir (),
                                   o.machine_file ()));

    // The extra directories are for the host machine libraries so only use
    // them for the build machine if it is the same.
    //
    dir_paths nds;

    machine_context build (context (bt,
                                    bcp != nullptr ? *bcp : cp,
                                    native ? o.lib_dir () : nds,
                                    native ? o.include_dir () : nds,
                                    o.build_machine_file ()));

    family_registry fr (default_family_registry ());
    resolver rs (fr, build, host, o.ilp64_fallback ());

    resolved_dependency d (rs.resolve (rq));

    try
    {
      manifest_serializer s (cout, "stdout");
      serialize (s, d);
    }
    catch (const manifest_serialization& e)
    {
      fail << "unable to serialize manifest: " << e.description;
    }
    catch (const io_error&)
    {
      fail << "unable to write to stdout";
    }

    r = 0;
  }
  catch (const failed& e)
  {
    r = e.code;
  }
  catch (const configuration_error& e)
  {
    error << e;
    r = 1;
  }

  if (!keep_tmp)
    clean_tmp (true /* ignore_error */);
  else if (verb > 1 && exists (tmp_dir))
    info << "keeping temporary directory " << tmp_dir;

  return r;
}
catch (const failed& e)
{
  return e.code; // Diagnostics has already been issued.
}
catch (const cli::exception& e)
{
  error << e;
  return 1;
}

int
main (int argc, char* argv[])
{
  return bldep::main (argc, argv);
}
