// file      : cqlgen/context.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cctype> // std::tolower
#include <cassert>

#include <cqlgen/context.hxx>

using namespace std;

namespace
{
  char const* keywords[] =
  {
    "alignas",
    "alignof",
    "and",
    "and_eq",
    "asm",
    "auto",
    "bitand",
    "bitor",
    "bool",
    "break",
    "case",
    "catch",
    "char",
    "char16_t",
    "char32_t",
    "class",
    "compl",
    "const",
    "const_cast",
    "constexpr",
    "continue",
    "decltype",
    "default",
    "delete",
    "do",
    "double",
    "dynamic_cast",
    "else",
    "enum",
    "explicit",
    "export",
    "extern",
    "false",
    "float",
    "for",
    "friend",
    "goto",
    "if",
    "inline",
    "int",
    "long",
    "mutable",
    "namespace",
    "new",
    "noexcept",
    "not",
    "not_eq",
    "nullptr",
    "operator",
    "or",
    "or_eq",
    "private",
    "protected",
    "public",
    "register",
    "reinterpret_cast",
    "return",
    "short",
    "signed",
    "sizeof",
    "static",
    "static_assert",
    "static_cast",
    "struct",
    "switch",
    "template",
    "this",
    "thread_local",
    "throw",
    "true",
    "try",
    "typedef",
    "typeid",
    "typename",
    "union",
    "unsigned",
    "using",
    "virtual",
    "void",
    "volatile",
    "wchar_t",
    "while",
    "xor",
    "xor_eq"
  };

  // Names that the generated functions use for their locals and
  // parameters.
  //
  char const* reserved[] =
  {
    "cqlgen",
    "e",
    "i",
    "model_type",
    "o",
    "r",
    "res",
    "row",
    "s",
    "session",
    "sg",
    "st",
    "std",
    "stream_type",
    "v",
    "x"
  };

  struct name_set: set<string>
  {
    name_set ()
    {
      for (size_t i (0); i < sizeof (keywords) / sizeof (char*); ++i)
        insert (keywords[i]);

      for (size_t i (0); i < sizeof (reserved) / sizeof (char*); ++i)
        insert (reserved[i]);
    }
  };

  name_set const reserved_names;
}

context* context::current_;

context::
~context ()
{
  if (current_ == this)
    current_ = 0;
}

context::
context (ostream& os_,
         options_type const& ops,
         semantics::model& m,
         table_type const& t,
         string const& bp)
    : os (os_),
      options (ops),
      model (m),
      table (t),
      boilerplate (bp)
{
  assert (current_ == 0);
  current_ = this;
}

context::
context ()
    : os (current ().os),
      options (current ().options),
      model (current ().model),
      table (current ().table),
      boilerplate (current ().boilerplate)
{
}

string context::
escape (string const& name)
{
  typedef string::size_type size;

  string r;
  size n (name.size ());

  r.reserve (n);

  for (size i (0); i < n; ++i)
  {
    char c (name[i]);

    if (i == 0 && c >= '0' && c <= '9')
      r = "cxx_";

    if (!((c >= 'a' && c <= 'z') ||
          (c >= 'A' && c <= 'Z') ||
          (c >= '0' && c <= '9') ||
          c == '_'))
      r += '_';
    else
      r += c;
  }

  if (r.empty ())
    r = "cxx";

  if (reserved_names.find (r) != reserved_names.end ())
    r += '_';

  return r;
}

string context::
strlit (string const& str)
{
  string r;
  r.reserve (str.size () + 2);

  r += '"';

  for (string::size_type i (0); i < str.size (); ++i)
  {
    char c (str[i]);

    switch (c)
    {
    case '\n':
      {
        r += "\\n";
        break;
      }
    case '\t':
      {
        r += "\\t";
        break;
      }
    case '\r':
      {
        r += "\\r";
        break;
      }
    case '"':
      {
        r += "\\\"";
        break;
      }
    case '\\':
      {
        r += "\\\\";
        break;
      }
    default:
      {
        // Storage and C++ identifiers are ASCII. Anything else is
        // unrepresentable.
        //
        unsigned char u (static_cast<unsigned char> (c));
        r += (u < 32 || u >= 127) ? '?' : c;
        break;
      }
    }
  }

  r += '"';
  return r;
}

string context::
lower (string const& s)
{
  string r (s);

  for (string::size_type i (0); i < r.size (); ++i)
    r[i] = static_cast<char> (tolower (static_cast<unsigned char> (r[i])));

  return r;
}

string context::
lower_camel (string const& s)
{
  string r (s);

  if (!r.empty ())
    r[0] = static_cast<char> (tolower (static_cast<unsigned char> (r[0])));

  return r;
}

string context::
macro (string const& s)
{
  string r;
  r.reserve (s.size ());

  for (string::size_type i (0); i < s.size (); ++i)
  {
    char c (s[i]);

    if (c >= 'a' && c <= 'z')
      r += static_cast<char> (c - 'a' + 'A');
    else if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))
      r += c;
    else
      r += '_';
  }

  if (r.empty () || (r[0] >= '0' && r[0] <= '9'))
    r = "CXX_" + r;

  return r;
}

string context::
unqualify (string const& name, string const& ns)
{
  if (ns.empty ())
    return name;

  string p (ns + "::");

  if (name.size () <= p.size () || name.compare (0, p.size (), p) != 0)
    return name;

  return string (name, p.size ());
}

void context::
open_ns (string const& ns)
{
  for (string::size_type b (0), e; b < ns.size (); b = e + 2)
  {
    e = ns.find ("::", b);

    if (e == string::npos)
      e = ns.size ();

    os << "namespace " << ns.substr (b, e - b)
       << "{";
  }
}

void context::
close_ns (string const& ns)
{
  for (string::size_type b (0), e; b < ns.size (); b = e + 2)
  {
    e = ns.find ("::", b);

    if (e == string::npos)
      e = ns.size ();

    os << "}";
  }
}
