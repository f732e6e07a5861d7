// file      : cqlgen/cqlgen.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>  // std::unique_ptr
#include <string>
#include <fstream>
#include <iostream>

#include <cutl/fs/path.hxx>

#include <cqlgen/version.hxx>
#include <cqlgen/options.hxx>
#include <cqlgen/parser.hxx>
#include <cqlgen/validator.hxx>
#include <cqlgen/processor.hxx>
#include <cqlgen/generator.hxx>
#include <cqlgen/semantics/model.hxx>

using namespace std;
using cutl::fs::path;
using cutl::fs::invalid_path;

int
main (int argc, char* argv[])
{
  ostream& e (cerr);

  try
  {
    cli::argv_file_scanner scan (argc, argv, "--options-file");
    options ops (scan);

    // Handle --version.
    //
    if (ops.version ())
    {
      e << "cqlgen data access code generator for Cassandra " <<
        CQLGEN_VERSION_STR << endl;

      e << "This is free software; see the source for copying conditions. "
        << "There is NO\nwarranty; not even for MERCHANTABILITY or FITNESS "
        << "FOR A PARTICULAR PURPOSE." << endl;

      return 0;
    }

    // Handle --help.
    //
    if (ops.help ())
    {
      e << "Usage: " << argv[0] << " [options]" << endl
        << "Options:" << endl;

      options::print_usage (e);
      return 0;
    }

    if (scan.more ())
    {
      e << argv[0] << ": error: unexpected argument '" << scan.next ()
        << "'" << endl;
      return 1;
    }

    // Open the input. In the single table mode it is the column list,
    // otherwise the persistence configuration.
    //
    bool single (ops.model_specified ());
    path input;

    if (single)
    {
      if (!ops.dao_specified ())
      {
        e << argv[0] << ": error: no data access class name specified " <<
          "with the --dao option" << endl;
        return 1;
      }

      input = path (ops.model () + ".json");
    }
    else
    {
      input = path (ops.config ());

      // Fall back to the config/ subdirectory.
      //
      if (input.relative ())
      {
        ifstream probe (input.string ().c_str ());

        if (!probe.is_open ())
          input = path ("config") / input;
      }
    }

    ifstream ifs (input.string ().c_str (), ios_base::in);

    if (!ifs.is_open ())
    {
      e << input << ": error: unable to open in read mode" << endl;
      return 1;
    }

    if (ops.trace ())
      e << "reading " << input << endl;

    unique_ptr<semantics::model> m;
    {
      parser p (ops);
      m = single ? p.parse_columns (ifs, input) : p.parse (ifs, input);
    }

    {
      validator v;

      if (!v.validate (ops, *m, input))
        return 1;
    }

    {
      processor p;
      p.process (ops, *m, input);
    }

    {
      generator g;
      g.generate (ops, *m, input);
    }

    return 0;
  }
  catch (parser::failed const&)
  {
    // Diagnostics has already been issued.
    //
    return 1;
  }
  catch (processor::failed const&)
  {
    // Diagnostics has already been issued.
    //
    return 1;
  }
  catch (generator::failed const&)
  {
    // Diagnostics has already been issued.
    //
    return 1;
  }
  catch (invalid_path const& ex)
  {
    e << argv[0] << ": error: invalid path '" << ex.path () << "'" << endl;
    return 1;
  }
  catch (cli::exception const& ex)
  {
    e << ex << endl;
    return 1;
  }
}
