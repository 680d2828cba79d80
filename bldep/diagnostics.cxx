// file      : bldep/diagnostics.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/diagnostics.hxx>

#include <libbutl/process-io.hxx> // operator<<(ostream, process_*)

using namespace std;
using namespace butl;

namespace bldep
{
  void
  print_process (const cstrings& args)
  {
    text << process_args {args.data (), 0};
  }

  void
  print_process (const process_env& pe, const cstrings& args)
  {
    diag_record dr (text);

    if (pe.env ())
      dr << pe << ' ';

    dr << process_args {args.data (), 0};
  }

  uint16_t verb = 1;

  void prologue_base::
  operator() (const diag_record& r) const
  {
    if (!loc_.empty ())
    {
      r << loc_.file << ':';

      if (loc_.line != 0)
        r << loc_.line << ':';

      r << ' ';
    }

    if (type_ != nullptr)
      r << type_ << ": ";

    if (name_ != nullptr)
      r << name_ << ": ";
  }

  const basic_mark error ("error");
  const basic_mark warn  ("warning");
  const basic_mark info  ("info");
  const basic_mark text  (nullptr, nullptr, nullptr); // No frame.
  const fail_mark  fail  ("error");
  const fail_end   endf;
}
