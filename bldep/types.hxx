// file      : bldep/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_TYPES_HXX
#define BLDEP_TYPES_HXX

#include <map>
#include <vector>
#include <string>
#include <memory>        // unique_ptr
#include <cstddef>       // size_t
#include <cstdint>       // uint{16,64}_t
#include <istream>
#include <ostream>
#include <functional>    // function

#include <ios>           // ios_base::failure
#include <exception>     // exception
#include <stdexcept>     // invalid_argument
#include <system_error>

#include <libbutl/path.hxx>
#include <libbutl/process.hxx>
#include <libbutl/optional.hxx>
#include <libbutl/fdstream.hxx>
#include <libbutl/small-vector.hxx>
#include <libbutl/target-triplet.hxx>

namespace bldep
{
  // Commonly-used types.
  //
  using std::uint16_t;
  using std::uint64_t;

  using std::size_t;

  using std::map;
  using std::string;
  using std::function;

  using std::unique_ptr;

  using std::vector;
  using butl::small_vector; // <libbutl/small-vector.hxx>

  // Compiler, linker, and tool arguments. Note that cstrings are normally
  // NULL-terminated views of strings that must outlive them.
  //
  using strings = vector<string>;
  using cstrings = vector<const char*>;

  using std::istream;
  using std::ostream;

  // Exceptions. While <exception> is included, there is no using for
  // std::exception -- use qualified.
  //
  using std::invalid_argument;
  using std::system_error;
  using io_error = std::ios_base::failure;

  // <libbutl/optional.hxx>
  //
  using butl::optional;
  using butl::nullopt;

  // <libbutl/path.hxx>
  //
  using butl::path;
  using butl::dir_path;
  using butl::invalid_path;

  // Library and header search directories.
  //
  using dir_paths = vector<dir_path>;

  // <libbutl/process.hxx>
  //
  using butl::process;
  using butl::process_env;
  using butl::process_path;
  using butl::process_error;

  // <libbutl/fdstream.hxx>
  //
  using butl::ifdstream;
  using butl::ofdstream;
  using butl::fdstream_mode;

  // <libbutl/target-triplet.hxx>
  //
  using butl::target_triplet;
}

// In order to be found (via ADL) these have to be either in std:: or in
// butl::. The latter is bad idea since libbutl includes the default
// implementation.
//
namespace std
{
  // Custom path printing (canonicalized, with trailing slash for directories).
  //
  inline ostream&
  operator<< (ostream& os, const ::butl::path& p)
  {
    string r (p.representation ());
    ::butl::path::traits_type::canonicalize (r);
    return os << r;
  }
}

#endif // BLDEP_TYPES_HXX
