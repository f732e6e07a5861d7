// file      : cqlgen/context.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_CONTEXT_HXX
#define CQLGEN_CONTEXT_HXX

#include <set>
#include <string>
#include <ostream>
#include <cstddef> // std::size_t
#include <iostream>

#include <cqlgen/options.hxx>
#include <cqlgen/emission.hxx>
#include <cqlgen/semantics/model.hxx>

using std::endl;
using std::cerr;

// Rendering context of a single generated file.
//
class context
{
public:
  typedef std::size_t size_t;
  typedef std::string string;
  typedef std::ostream ostream;

  typedef ::options options_type;
  typedef emission::table_model table_type;

  // Escape a column name so that it can be used as a C++ identifier.
  // Keywords and names used in the generated code get a trailing '_'.
  //
  static string
  escape (string const&);

  // Make a C++ string literal.
  //
  static string
  strlit (string const&);

  static string
  lower (string const&);

  // Lower-case the first character.
  //
  static string
  lower_camel (string const&);

  // Upper-case the name and replace characters that are not valid in
  // a macro name with '_'. A name that would start with a digit gets
  // the CXX_ prefix.
  //
  static string
  macro (string const&);

  // Strip the leading ns:: qualification if present.
  //
  static string
  unqualify (string const& name, string const& ns);

public:
  // Emit namespace opening/closing for a '::'-separated name.
  //
  void
  open_ns (string const&);

  void
  close_ns (string const&);

public:
  std::ostream& os;
  options_type const& options;
  semantics::model& model;
  table_type const& table;

  // Rendered boilerplate text.
  //
  string const& boilerplate;

public:
  ~context ();
  context ();
  context (std::ostream&,
           options_type const&,
           semantics::model&,
           table_type const&,
           string const& boilerplate);

  static context&
  current ()
  {
    return *current_;
  }

private:
  static context* current_;

private:
  context&
  operator= (context const&);
};

#endif // CQLGEN_CONTEXT_HXX
