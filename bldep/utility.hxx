// file      : bldep/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_UTILITY_HXX
#define BLDEP_UTILITY_HXX

#include <string>    // to_string()
#include <utility>   // move()
#include <cassert>   // assert()
#include <algorithm> // find()

#include <libbutl/utility.hxx>         // trim(), eof()
#include <libbutl/filesystem.hxx>      // auto_rmfile

#include <bldep/types.hxx>

namespace bldep
{
  using std::move;
  using std::to_string;

  // <libbutl/utility.hxx>
  //
  using butl::trim;
  using butl::eof;

  // <libbutl/filesystem.hxx>
  //
  using butl::auto_rmfile;

  // Empty string.
  //
  extern const string empty_string;

  // Host target triplet for which we were built.
  //
  extern const target_triplet host_triplet;

  // Temporary directory facility.
  //
  // The directory is created by init_tmp() in the system temporary
  // directory (e.g., /tmp/bldep-XXX/) and removed by clean_tmp(). Probe
  // sources and outputs are written there as uniquely-named files which are
  // removed as soon as the probe completes (unless keep_tmp is true).
  //
  extern dir_path tmp_dir;

  extern bool keep_tmp; // --keep-tmp

  auto_rmfile
  tmp_file (const string& prefix, const char* ext = nullptr);

  void
  init_tmp ();

  void
  clean_tmp (bool ignore_errors);

  // Diagnostics.
  //
  // If stderr is not a terminal, then the value is absent (so can be used as
  // bool). Otherwise, it is the value of the TERM environment variable (which
  // can be NULL).
  //
  extern optional<const char*> stderr_term;

  // Filesystem.
  //
  bool
  exists (const path&, bool ignore_error = false);

  bool
  exists (const dir_path&, bool ignore_error = false);

  void
  mk (const dir_path&);

  enum class rm_error_mode {ignore, warn, fail};

  void
  rm_r (const dir_path&,
        bool dir_itself = true,
        uint16_t verbosity = 3,
        rm_error_mode = rm_error_mode::fail);

  // Directory extracted from argv[0] (i.e., this process' recall directory)
  // or empty if there is none. Can be used as a search fallback.
  //
  extern dir_path exec_dir;

  // Run the program with the specified arguments (the first being the
  // program name and the last being NULL) and environment, capturing its
  // stdout. Return nullopt if the program exited with non-zero code. Issue
  // diagnostics and throw failed if the program cannot be executed or its
  // output cannot be read.
  //
  // Note that stdin and, unless the verbosity level is 4 or higher, stderr
  // are redirected to /dev/null.
  //
  optional<string>
  run_capture (const process_path&,
               const cstrings& args,
               const char* const* env = nullptr);

  // Split the whitespace-separated (and potentially quoted) tool output into
  // individual arguments. Throw invalid_argument if the quoting is invalid.
  //
  strings
  split_args (const string&);
}

#endif // BLDEP_UTILITY_HXX
