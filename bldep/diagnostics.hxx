// file      : bldep/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_DIAGNOSTICS_HXX
#define BLDEP_DIAGNOSTICS_HXX

#include <libbutl/diagnostics.hxx>

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

namespace bldep
{
  using butl::diag_record;

  // Throw this exception to terminate the process. The handler should
  // assume that the diagnostics has already been issued.
  //
  class failed: public std::exception
  {
  public:
    explicit
    failed (int c = 1): code (c) {}

    int code;
  };

  // Print the command line of a probe or tool invocation (the arguments are
  // NULL-terminated), optionally with its environment.
  //
  void
  print_process (const cstrings& args);

  void
  print_process (const process_env&, const cstrings& args);

  // Verbosity level. Update documentation for --verbose in
  // bldep-options.cli if changing.
  //
  // 0 - disabled
  // 1 - essential messages
  // 2 - resolution outcome
  // 3 - underlying commands being executed (compiler, pkg-config, cmake)
  // 4 - discovery steps that could be helpful to the user
  // 5 - information that could be helpful to the developer
  // 6 - even more detailed information
  //
  // While uint8 is more than enough, use uint16 for the ease of printing.
  //
  extern uint16_t verb;

  template <typename F> inline void l1 (const F& f) {if (verb >= 1) f ();}
  template <typename F> inline void l2 (const F& f) {if (verb >= 2) f ();}
  template <typename F> inline void l3 (const F& f) {if (verb >= 3) f ();}
  template <typename F> inline void l4 (const F& f) {if (verb >= 4) f ();}
  template <typename F> inline void l5 (const F& f) {if (verb >= 5) f ();}
  template <typename F> inline void l6 (const F& f) {if (verb >= 6) f ();}

  // Diagnostic facility, base infrastructure.
  //
  using butl::diag_stream;
  using butl::diag_epilogue;
  using butl::diag_frame;
  using butl::make_diag_frame;

  // Diagnostic facility, project specifics.
  //

  // Position in a machine file. Machine file entries are single-line so
  // there is no column.
  //
  struct location
  {
    location () = default;
    location (string f, uint64_t l): file (move (f)), line (l) {}

    bool
    empty () const {return file.empty ();}

    string   file;
    uint64_t line = 0;
  };

  // Print [<file>:<line>: ]<type>: [<name>: ].
  //
  struct prologue_base
  {
    prologue_base (const char* type, const char* name, location l)
        : type_ (type), name_ (name), loc_ (move (l)) {}

    void
    operator() (const diag_record&) const;

  private:
    const char* type_;
    const char* name_;
    location    loc_;
  };

  struct basic_mark_base
  {
    using prologue = butl::diag_prologue<prologue_base>;

    explicit
    basic_mark_base (const char* type,
                     const char* name = nullptr,
                     diag_epilogue* epilogue = &diag_frame::apply)
        : type_ (type), name_ (name), epilogue_ (epilogue) {}

    prologue
    operator() () const
    {
      return prologue (epilogue_, type_, name_, location ());
    }

    prologue
    operator() (location l) const
    {
      return prologue (epilogue_, type_, name_, move (l));
    }

  protected:
    const char* type_;
    const char* name_;
    diag_epilogue* const epilogue_;
  };
  using basic_mark = butl::diag_mark<basic_mark_base>;

  extern const basic_mark error;
  extern const basic_mark warn;
  extern const basic_mark info;
  extern const basic_mark text;

  // trace
  //
  struct trace_mark_base: basic_mark_base
  {
    explicit
    trace_mark_base (const char* name)
        : basic_mark_base ("trace", name) {}
  };
  using trace_mark = butl::diag_mark<trace_mark_base>;
  using tracer = trace_mark;

  // fail
  //
  struct fail_mark_base: basic_mark_base
  {
    explicit
    fail_mark_base (const char* type)
        : basic_mark_base (type,
                           nullptr,
                           [](const diag_record& r, butl::diag_writer* w)
                           {
                             diag_frame::apply (r);
                             r.flush (w);
                             throw failed ();
                           }) {}
  };
  using fail_mark = butl::diag_mark<fail_mark_base>;

  struct fail_end_base
  {
    [[noreturn]] void
    operator() (const diag_record& r) const
    {
      // If we just throw then the record's destructor will see an active
      // exception and will not flush the record.
      //
      r.flush ();
      throw failed ();
    }
  };
  using fail_end = butl::diag_noreturn_end<fail_end_base>;

  extern const fail_mark fail;
  extern const fail_end endf;
}

#endif // BLDEP_DIAGNOSTICS_HXX
