// file      : cqlgen/template.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <vector>

#include <cqlgen/template.hxx>

using namespace std;

namespace
{
  char const* scalar_variables[] =
  {
    "all_keys",
    "all_keys_equality",
    "clustering_columns",
    "clustering_order",
    "dao",
    "generated_name",
    "insert_fields",
    "insert_values",
    "keyspace",
    "model",
    "model_type",
    "namespace",
    "partition_keys",
    "partition_keys_equality",
    "table"
  };

  char const* column_variables[] =
  {
    "cql_type",
    "cxx_type",
    "key",
    "name",
    "serialized_type",
    "tag"
  };

  bool
  find (char const* const* b, size_t n, string const& s)
  {
    for (size_t i (0); i < n; ++i)
    {
      if (s == b[i])
        return true;
    }

    return false;
  }

  string
  trim (string const& s)
  {
    string::size_type b (s.find_first_not_of (" \t\r\n"));

    if (b == string::npos)
      return string ();

    string::size_type e (s.find_last_not_of (" \t\r\n"));
    return string (s, b, e - b + 1);
  }
}

bool template_::
scalar (string const& n)
{
  return find (scalar_variables,
               sizeof (scalar_variables) / sizeof (char*),
               n);
}

bool template_::
column (string const& n)
{
  return find (column_variables,
               sizeof (column_variables) / sizeof (char*),
               n);
}

template_::
template_ (string const& text)
{
  // Open sections as indexes into elements_.
  //
  vector<size_t> open;

  size_t line (1);
  string::size_type p (0);

  while (p < text.size ())
  {
    string::size_type b (text.find ("{{", p));

    if (b == string::npos)
      b = text.size ();

    if (b != p)
    {
      string t (text, p, b - p);
      elements_.push_back (element (element::text, t, line));

      for (string::size_type i (0); i < t.size (); ++i)
        if (t[i] == '\n')
          line++;
    }

    if (b == text.size ())
      break;

    string::size_type e (text.find ("}}", b + 2));

    if (e == string::npos)
      throw template_error (line, "unterminated tag");

    string tag (text, b + 2, e - b - 2);
    size_t tag_line (line);

    for (string::size_type i (0); i < tag.size (); ++i)
      if (tag[i] == '\n')
        line++;

    p = e + 2;

    if (tag.empty ())
      throw template_error (tag_line, "empty tag");

    switch (tag[0])
    {
    case '!':
      {
        break;
      }
    case '#':
      {
        string n (trim (tag.substr (1)));

        if (n != "columns")
          throw template_error (tag_line, "unknown section '" + n + "'");

        if (!open.empty ())
          throw template_error (tag_line, "nested section '" + n + "'");

        open.push_back (elements_.size ());
        elements_.push_back (element (element::section, n, tag_line));
        break;
      }
    case '/':
      {
        string n (trim (tag.substr (1)));

        if (open.empty ())
          throw template_error (
            tag_line, "closing tag for section '" + n + "' that is not open");

        element& s (elements_[open.back ()]);

        if (s.value != n)
          throw template_error (
            tag_line,
            "closing tag for section '" + n + "' does not match open " +
            "section '" + s.value + "'");

        s.end = elements_.size ();
        open.pop_back ();
        break;
      }
    default:
      {
        string n (trim (tag));

        if (!(scalar (n) || (!open.empty () && column (n))))
          throw template_error (tag_line, "unknown variable '" + n + "'");

        elements_.push_back (element (element::variable, n, tag_line));
        break;
      }
    }
  }

  if (!open.empty ())
  {
    element const& s (elements_[open.back ()]);
    throw template_error (s.line, "unterminated section '" + s.value + "'");
  }
}

string template_::
render (emission::table_model const& t) const
{
  string r;
  render (r, 0, elements_.size (), t, 0);
  return r;
}

void template_::
render (string& r,
        size_t b,
        size_t e,
        emission::table_model const& t,
        emission::field const* f) const
{
  for (size_t i (b); i < e; ++i)
  {
    element const& x (elements_[i]);

    switch (x.kind)
    {
    case element::text:
      {
        r += x.value;
        break;
      }
    case element::section:
      {
        for (emission::fields::const_iterator j (t.columns.begin ());
             j != t.columns.end (); ++j)
          render (r, i + 1, x.end, t, &*j);

        i = x.end - 1;
        break;
      }
    case element::variable:
      {
        string const& n (x.value);

        if (f != 0 && column (n))
        {
          if (n == "name")
            r += f->name;
          else if (n == "cql_type")
            r += f->cql_type;
          else if (n == "cxx_type")
            r += f->cxx_type;
          else if (n == "serialized_type")
            r += f->serialized_type;
          else if (n == "tag")
            r += f->tag;
          else if (n == "key")
            r += f->key.string ();
        }
        else if (n == "keyspace")
          r += t.keyspace;
        else if (n == "namespace")
          r += t.namespace_;
        else if (n == "model")
          r += t.model;
        else if (n == "model_type")
          r += t.model_type;
        else if (n == "table")
          r += t.table;
        else if (n == "dao")
          r += t.dao;
        else if (n == "generated_name")
          r += t.generated_name;
        else if (n == "partition_keys")
          r += t.partition_keys;
        else if (n == "clustering_columns")
          r += t.clustering_columns;
        else if (n == "clustering_order")
          r += t.clustering_order;
        else if (n == "all_keys")
          r += t.all_keys;
        else if (n == "all_keys_equality")
          r += t.all_keys_equality;
        else if (n == "partition_keys_equality")
          r += t.partition_keys_equality;
        else if (n == "insert_fields")
          r += t.insert_fields;
        else if (n == "insert_values")
          r += t.insert_values;
        else
          throw template_error (x.line, "unknown variable '" + n + "'");

        break;
      }
    }
  }
}
