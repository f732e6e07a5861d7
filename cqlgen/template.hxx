// file      : cqlgen/template.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_TEMPLATE_HXX
#define CQLGEN_TEMPLATE_HXX

#include <string>
#include <vector>
#include <cstddef> // std::size_t

#include <cqlgen/emission.hxx>

// Boilerplate template. The syntax is:
//
// {{name}}               -- substitute the variable
// {{#columns}}{{/columns}} -- repeat the body for each column
// {{! text}}             -- comment
//
// Inside the columns section the column variables are also available.
// There is no escaping: the variable values are substituted verbatim.
//
struct template_error
{
  template_error (std::size_t l, std::string const& d)
      : line (l), description (d)
  {
  }

  std::size_t line;
  std::string description;
};

class template_
{
public:
  // Throw template_error if the template is malformed or refers to an
  // unknown variable.
  //
  explicit
  template_ (std::string const& text);

  std::string
  render (emission::table_model const&) const;

private:
  struct element
  {
    enum kind_type
    {
      text,
      variable,
      section
    };

    element (kind_type k, std::string const& v, std::size_t l)
        : kind (k), value (v), line (l), end (0)
    {
    }

    kind_type kind;
    std::string value;
    std::size_t line;
    std::size_t end; // One past the last element of the section body.
  };

  typedef std::vector<element> elements;

  void
  render (std::string&,
          std::size_t begin,
          std::size_t end,
          emission::table_model const&,
          emission::field const*) const;

  static bool
  scalar (std::string const&);

  static bool
  column (std::string const&);

private:
  elements elements_;
};

#endif // CQLGEN_TEMPLATE_HXX
