// file      : bldep/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/utility.hxx>

#include <cstdlib> // exit()

#include <libbutl/string-parser.hxx> // parse_quoted()

#include <bldep/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace bldep
{
  const string empty_string;

  const target_triplet host_triplet (BLDEP_HOST_TRIPLET);

  dir_path tmp_dir;

  bool keep_tmp;

  auto_rmfile
  tmp_file (const string& p, const char* e)
  {
    assert (!tmp_dir.empty ());

    path f (tmp_dir / path::traits_type::temp_name (p));

    if (e != nullptr)
      f += e;

    return auto_rmfile (move (f), !keep_tmp);
  }

  void
  init_tmp ()
  {
    dir_path d (dir_path::temp_path ("bldep"));

    if (exists (d))
      rm_r (d, true /* dir_itself */, 2);

    mk (d); // We shouldn't need mk_p().

    tmp_dir = move (d);
  }

  void
  clean_tmp (bool ignore_error)
  {
    if (!tmp_dir.empty () && exists (tmp_dir))
    {
      rm_r (tmp_dir,
            true /* dir_itself */,
            3,
            ignore_error ? rm_error_mode::ignore : rm_error_mode::fail);
    }

    tmp_dir.clear ();
  }

  optional<const char*> stderr_term = nullopt;

  bool
  exists (const path& f, bool ignore_error)
  {
    try
    {
      return file_exists (f, true /* follow_symlinks */, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << f << ": " << e << endf;
    }
  }

  bool
  exists (const dir_path& d, bool ignore_error)
  {
    try
    {
      return dir_exists (d, ignore_error);
    }
    catch (const system_error& e)
    {
      fail << "unable to stat path " << d << ": " << e << endf;
    }
  }

  void
  mk (const dir_path& d)
  {
    if (verb >= 3)
      text << "mkdir " << d;

    try
    {
      try_mkdir (d);
    }
    catch (const system_error& e)
    {
      fail << "unable to create directory " << d << ": " << e;
    }
  }

  void
  rm_r (const dir_path& d, bool dir, uint16_t v, rm_error_mode m)
  {
    if (verb >= v)
      text << (dir ? "rmdir -r " : "rm -r ") << (dir ? d : d / dir_path ("*"));

    try
    {
      rmdir_r (d, dir, m == rm_error_mode::ignore);
    }
    catch (const system_error& e)
    {
      bool w (m == rm_error_mode::warn);

      (w ? warn : error) << "unable to remove " << (dir ? "" : "contents of ")
                         << "directory " << d << ": " << e;

      if (!w)
        throw failed ();
    }
  }

  dir_path exec_dir;

  optional<string>
  run_capture (const process_path& pp,
               const cstrings& args,
               const char* const* env)
  {
    assert (!args.empty () && args.back () == nullptr);

    try
    {
      process_env pe (pp, env);

      if (verb >= 3)
        print_process (pe, args);

      process pr (pp,
                  args,
                  -2                 /* stdin  */,
                  -1                 /* stdout */,
                  verb >= 4 ? 2 : -2 /* stderr */,
                  nullptr            /* cwd    */,
                  env);

      string r;
      try
      {
        ifdstream is (move (pr.in_ofd),
                      fdstream_mode::skip,
                      ifdstream::badbit);
        r = is.read_text ();
        is.close ();
      }
      catch (const io_error& e)
      {
        if (pr.wait ())
          fail << "unable to read " << args[0] << " output: " << e;

        // Fall through.
      }

      if (!pr.wait ())
        return nullopt;

      return r;
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << args[0] << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  strings
  split_args (const string& s)
  {
    // Note that parse_quoted() keeps the quotes by default which we don't
    // want here since the result is passed to the compiler as is.
    //
    return string_parser::parse_quoted (s, true /* unquote */);
  }
}
