// file      : cqlgen/semantics/column.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <string>
#include <istream>
#include <ostream>
#include <algorithm> // std::lower_bound

#include <cutl/compiler/type-info.hxx>

#include <cqlgen/semantics/column.hxx>
#include <cqlgen/semantics/table.hxx>

namespace semantics
{
  // key_role
  //
  static const char* key_role_str[] =
  {
    "cluster",
    "cluster-asc",
    "cluster-desc",
    "none",
    "partition"
  };

  const char* key_role::
  string () const
  {
    return key_role_str[v_];
  }

  std::istream&
  operator>> (std::istream& is, key_role& k)
  {
    std::string s;
    is >> s;

    if (is.fail ())
    {
      // Nothing was extracted which for us means the default role.
      //
      if (s.empty () && is.eof ())
      {
        is.clear (std::istream::eofbit);
        k = key_role::none;
      }

      return is;
    }

    const char** e (
      key_role_str + sizeof (key_role_str) / sizeof (char*));
    const char** i (std::lower_bound (key_role_str, e, s));

    if (i != e && *i == s)
      k = key_role::value (i - key_role_str);
    else
      is.setstate (std::istream::failbit);

    return is;
  }

  std::ostream&
  operator<< (std::ostream& os, key_role k)
  {
    return os << k.string ();
  }

  // column
  //
  column::table_type& column::
  table () const
  {
    return dynamic_cast<table_type&> (scope ());
  }

  // type info
  //
  namespace
  {
    struct init
    {
      init ()
      {
        using compiler::type_info;

        type_info ti (typeid (column));
        ti.add_base (typeid (nameable));
        insert (ti);
      }
    } init_;
  }
}
