// file      : bldep/compiler-probe.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/compiler-probe.hxx>

#include <cstdlib> // exit()

#include <bldep/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace bldep
{
  compiler_probe::
  ~compiler_probe ()
  {
    // vtable
  }

  cc_compiler_probe::
  cc_compiler_probe (process_path cc, strings mode, const target_triplet& t)
      : cc_ (move (cc)), mode_ (move (mode)), target_ (t)
  {
  }

  strings cc_compiler_probe::
  library_file_names (const string& n, const target_triplet& t)
  {
    strings r;

    if (t.class_ == "macos")
    {
      r.push_back ("lib" + n + ".dylib");
      r.push_back ("lib" + n + ".tbd");
      r.push_back ("lib" + n + ".a");
    }
    else if (t.class_ == "windows")
    {
      // MinGW prefers the import library over the static library while
      // MSVC only knows about the .lib.
      //
      if (t.system == "mingw32")
      {
        r.push_back ("lib" + n + ".dll.a");
        r.push_back ("lib" + n + ".a");
      }

      r.push_back (n + ".lib");
    }
    else
    {
      r.push_back ("lib" + n + ".so");
      r.push_back ("lib" + n + ".a");
    }

    return r;
  }

  bool cc_compiler_probe::
  run (const cstrings& a, string* out)
  {
    const char* cc (cc_.recall_string ());

    cstrings args {cc};
    for (const string& m: mode_)
      args.push_back (m.c_str ());
    args.insert (args.end (), a.begin (), a.end ());
    args.push_back (nullptr);

    try
    {
      if (verb >= 3)
        print_process (args);

      // Failing invocations are a normal part of probing so only show the
      // compiler diagnostics when tracing. For good measure also redirect
      // stdin to /dev/null.
      //
      process pr (cc_,
                  args,
                  -2                            /* stdin  */,
                  out != nullptr ? -1 : -2      /* stdout */,
                  verb >= 4 ? 2 : -2            /* stderr */);

      if (out != nullptr)
      {
        try
        {
          ifdstream is (move (pr.in_ofd),
                        fdstream_mode::skip,
                        ifdstream::badbit);
          *out = is.read_text ();
          is.close ();
        }
        catch (const io_error& e)
        {
          if (pr.wait ())
            fail << "unable to read " << cc << " output: " << e;

          // Fall through.
        }
      }

      return pr.wait ();
    }
    catch (const process_error& e)
    {
      error << "unable to execute " << cc << ": " << e;

      if (e.child)
        exit (1);

      throw failed ();
    }
  }

  auto_rmfile cc_compiler_probe::
  write_source (const string& p, const string& s)
  {
    auto_rmfile r (tmp_file (p, ".c"));

    try
    {
      ofdstream os (r.path);
      os << s;
      os.close ();
    }
    catch (const io_error& e)
    {
      fail << "unable to write to " << r.path << ": " << e;
    }

    return r;
  }

  optional<strings> cc_compiler_probe::
  find_library (const string& n, const dir_paths& ds)
  {
    tracer trace ("cc_compiler_probe::find_library");

    if (!ds.empty ())
    {
      strings fs (library_file_names (n, target_));

      for (const dir_path& d: ds)
      {
        for (const string& f: fs)
        {
          path p (d / path (f));

          if (exists (p))
          {
            l4 ([&]{trace << "found " << p;});
            return strings {p.string ()};
          }
        }
      }

      return nullopt;
    }

    string a ("-l" + n);

    if (links_program ("int main (void) {return 0;}\n", strings {a}))
      return strings {move (a)};

    return nullopt;
  }

  bool cc_compiler_probe::
  has_header (const string& n, const strings& cas)
  {
    auto_rmfile src (write_source ("bldep-header", "#include <" + n + ">\n"));

    cstrings args;
    for (const string& a: cas)
      args.push_back (a.c_str ());

    args.push_back ("-E");
    args.push_back (src.path.string ().c_str ());

    return run (args);
  }

  // Markers that delimit the macro expansion in the preprocessed output.
  //
  static const string define_begin ("\"bldep-define-begin\"");
  static const string define_end   ("\"bldep-define-end\"");

  optional<string> cc_compiler_probe::
  get_define (const string& m, const string& prefix, const strings& cas)
  {
    string s (prefix);
    s += '\n';
    s += "#ifdef " + m + '\n';
    s += define_begin + '\n';
    s += m + '\n';
    s += define_end + '\n';
    s += "#endif\n";

    auto_rmfile src (write_source ("bldep-define", s));

    cstrings args;
    for (const string& a: cas)
      args.push_back (a.c_str ());

    args.push_back ("-E");
    args.push_back ("-P");
    args.push_back (src.path.string ().c_str ());

    string out;
    if (!run (args, &out))
      return nullopt;

    // Note that the expansion may span multiple lines, for example, if the
    // macro is defined in terms of other multi-token macros.
    //
    size_t b (out.find (define_begin));
    if (b == string::npos)
      return nullopt;

    b += define_begin.size ();

    size_t e (out.find (define_end, b));
    if (e == string::npos)
      return nullopt;

    string r;
    for (size_t i (b); i != e; ++i)
    {
      char c (out[i]);
      r += (c == '\n' || c == '\r' ? ' ' : c);
    }

    return move (trim (r));
  }

  bool cc_compiler_probe::
  links_program (const string& source, const strings& eas)
  {
    auto_rmfile src (write_source ("bldep-link", source));
    auto_rmfile out (tmp_file ("bldep-link", ".out"));

    cstrings args {src.path.string ().c_str (),
                   "-o", out.path.string ().c_str ()};

    for (const string& a: eas)
      args.push_back (a.c_str ());

    return run (args);
  }

  optional<strings> cc_compiler_probe::
  find_framework (const string& n)
  {
    if (target_.class_ != "macos")
      return nullopt;

    strings r {"-framework", n};

    if (links_program ("int main (void) {return 0;}\n", r))
      return r;

    return nullopt;
  }
}
