// file      : cqlgen/parser.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_PARSER_HXX
#define CQLGEN_PARSER_HXX

#include <memory>  // std::unique_ptr
#include <istream>

#include <cqlgen/options.hxx>
#include <cqlgen/semantics/model.hxx>

// Build the semantic graph from the JSON persistence configuration.
// Errors are reported to STDERR and result in the failed exception.
//
class parser
{
public:
  class failed {};

  ~parser ();
  parser (options const&);

  // Parse the persistence configuration (an object with the list of
  // tables).
  //
  std::unique_ptr<semantics::model>
  parse (std::istream&, semantics::path const&);

  // Parse the column list of a single table. The rest of the table and
  // model settings comes from the options.
  //
  std::unique_ptr<semantics::model>
  parse_columns (std::istream&, semantics::path const&);

private:
  parser (parser const&);

  parser&
  operator= (parser const&);

private:
  class impl;
  std::unique_ptr<impl> impl_;
};

#endif // CQLGEN_PARSER_HXX
