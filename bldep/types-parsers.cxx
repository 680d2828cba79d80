// file      : bldep/types-parsers.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <bldep/types-parsers.hxx>

#include <utility> // pair, make_pair()

using namespace std;

namespace bldep
{
  namespace cli
  {
    // Return the option name and its value advancing the scanner past both.
    //
    static pair<const char*, const char*>
    next_value (scanner& s)
    {
      const char* o (s.next ());

      if (!s.more ())
        throw missing_value (o);

      return make_pair (o, s.next ());
    }

    // Parse the value as a non-empty path (file or directory).
    //
    template <typename T>
    static T
    parse_path (scanner& s)
    {
      auto v (next_value (s));

      try
      {
        T r (v.second);

        if (r.empty ())
          throw invalid_value (v.first, v.second);

        return r;
      }
      catch (const invalid_path&)
      {
        throw invalid_value (v.first, v.second);
      }
    }

    void parser<path>::
    parse (path& x, bool& xs, scanner& s)
    {
      x = parse_path<path> (s);
      xs = true;
    }

    void parser<dir_path>::
    parse (dir_path& x, bool& xs, scanner& s)
    {
      x = parse_path<dir_path> (s);
      xs = true;
    }

    void parser<ilp64_fallback>::
    parse (ilp64_fallback& x, bool& xs, scanner& s)
    {
      auto v (next_value (s));

      try
      {
        x = to_ilp64_fallback (v.second);
      }
      catch (const invalid_argument& e)
      {
        throw invalid_value (v.first, v.second, e.what ());
      }

      xs = true;
    }
  }
}
