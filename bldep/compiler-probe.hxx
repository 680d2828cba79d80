// file      : bldep/compiler-probe.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef BLDEP_COMPILER_PROBE_HXX
#define BLDEP_COMPILER_PROBE_HXX

#include <bldep/types.hxx>
#include <bldep/utility.hxx>

namespace bldep
{
  // The compiler/linker capabilities the resolution engine relies on.
  //
  // None of the functions fail if the answer is negative (library not
  // found, header not present, program does not link, etc). However, if the
  // underlying toolchain cannot be executed at all, then the implementation
  // is expected to issue diagnostics and throw failed.
  //
  class compiler_probe
  {
  public:
    // Return the link arguments for the library or nullopt if it cannot be
    // found. If the search directories are specified, then only look in
    // them, in order, and return the path to the library file. Otherwise,
    // check that the library can be linked from the toolchain's default
    // search paths and return -l<name>.
    //
    virtual optional<strings>
    find_library (const string& name, const dir_paths& search_dirs) = 0;

    // Return true if the header can be included with the specified extra
    // compile arguments (normally -I).
    //
    virtual bool
    has_header (const string& name, const strings& compile_args) = 0;

    // Return the expansion of the macro after including the prefix text or
    // nullopt if the macro is not defined (or the prefix cannot be
    // preprocessed).
    //
    virtual optional<string>
    get_define (const string& macro,
                const string& prefix,
                const strings& compile_args) = 0;

    // Return true if the program compiles and links with the specified extra
    // arguments.
    //
    virtual bool
    links_program (const string& source, const strings& extra_args) = 0;

    // Return the link arguments for the platform framework or nullopt if it
    // cannot be found.
    //
    virtual optional<strings>
    find_framework (const string& name) = 0;

    virtual
    ~compiler_probe ();
  };

  // Compiler probe implementation that executes a C compiler driver
  // (GCC, Clang, or compatible).
  //
  // The compiler mode options are passed first on every invocation (for
  // example, -m32 or --sysroot=...).
  //
  // Note that the temporary directory must be initialized (see init_tmp()).
  //
  class cc_compiler_probe: public compiler_probe
  {
  public:
    cc_compiler_probe (process_path cc,
                       strings mode,
                       const target_triplet& target);

    virtual optional<strings>
    find_library (const string&, const dir_paths&) override;

    virtual bool
    has_header (const string&, const strings&) override;

    virtual optional<string>
    get_define (const string&, const string&, const strings&) override;

    virtual bool
    links_program (const string&, const strings&) override;

    virtual optional<strings>
    find_framework (const string&) override;

    // Library file names the linker would consider for -l<name>, in the
    // linker's preference order, for the specified target.
    //
    static strings
    library_file_names (const string& name, const target_triplet&);

  private:
    // Run the compiler with the mode options followed by the specified
    // arguments and return true if it exited with zero code. If the output
    // is not NULL, then capture stdout into it.
    //
    bool
    run (const cstrings& args, string* output = nullptr);

    // Write the source into a temporary file with the C extension.
    //
    auto_rmfile
    write_source (const string& prefix, const string& source);

    process_path   cc_;
    strings        mode_;
    target_triplet target_;
  };
}

#endif // BLDEP_COMPILER_PROBE_HXX
