// file      : bldep/machine-file.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/machine-file.hxx>

#include <libbutl/string-parser.hxx> // parse_quoted()

#include <bldep/diagnostics.hxx>

using namespace std;
using namespace butl;

namespace bldep
{
  machine_properties
  parse_machine_file (istream& is, const string& name)
  {
    machine_properties r;

    // Current section name, absent before the first section.
    //
    optional<string> section;

    string l;
    for (uint64_t ln (1); !eof (getline (is, l)); ++ln)
    {
      trim (l);

      // Skip blanks lines and comments.
      //
      if (l.empty () || l[0] == '#')
        continue;

      if (l[0] == '[')
      {
        if (l.back () != ']' || l.size () == 2)
          fail (location (name, ln)) << "invalid section header '" << l << "'";

        section = string (l, 1, l.size () - 2);
        trim (*section);
        continue;
      }

      size_t p (l.find ('='));
      if (p == string::npos)
        fail (location (name, ln)) << "expected <name> = <value> instead of '"
                                   << l << "'";

      if (!section)
        fail (location (name, ln)) << "entry outside of section";

      if (*section != "properties")
        continue;

      string n (l, 0, p);
      trim (n);

      if (n.empty ())
        fail (location (name, ln)) << "empty property name";

      string v (l, p + 1);
      trim (v);

      // Array (and dictionary, etc) values are not interpreted.
      //
      if (!v.empty () && v[0] == '[')
      {
        r[move (n)] = move (v);
        continue;
      }

      using string_parser::parse_quoted;
      using string_parser::invalid_string;

      try
      {
        vector<string> vs (parse_quoted (v, true /* unquote */));
        switch (vs.size ())
        {
        case 0:  r[move (n)] = ""; break;
        case 1:  r[move (n)] = move (vs.front ()); break;
        default: throw invalid_string (0, "multiple values");
        }
      }
      catch (const invalid_string& e)
      {
        fail (location (name, ln)) << "invalid " << n << " value: " << e;
      }
    }

    return r;
  }

  machine_properties
  load_machine_file (const path& f)
  {
    if (!exists (f))
      fail << "machine file " << f << " does not exist";

    try
    {
      ifdstream ifs (f, ifdstream::badbit);
      machine_properties r (parse_machine_file (ifs, f.string ()));
      ifs.close ();
      return r;
    }
    catch (const io_error& e)
    {
      fail << "unable to read from " << f << ": " << e << endf;
    }
  }
}
