// file      : cqlgen/semantics/column.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_SEMANTICS_COLUMN_HXX
#define CQLGEN_SEMANTICS_COLUMN_HXX

#include <iosfwd>

#include <cqlgen/semantics/elements.hxx>

namespace semantics
{
  class table;

  // Role of a column in the primary key.
  //
  struct key_role
  {
    enum value
    {
      // Keep in alphabetic order.
      //
      cluster,
      cluster_asc,
      cluster_desc,
      none,
      partition
    };

    key_role (value v = none) : v_ (v) {}
    operator value () const {return v_;}

    const char*
    string () const;

    bool
    clustering () const
    {
      return v_ == cluster || v_ == cluster_asc || v_ == cluster_desc;
    }

  private:
    value v_;
  };

  // An empty string is read as none.
  //
  std::istream&
  operator>> (std::istream&, key_role&);

  std::ostream&
  operator<< (std::ostream&, key_role);

  //
  //
  class column: public nameable
  {
  public:
    // Storage type as written in the configuration, e.g., list<blob>.
    //
    string const&
    type () const {return type_;}

    key_role
    key () const {return key_;}

    // Structured type that blob values are deserialized into. Empty if
    // not specified.
    //
    string const&
    deserialize_to () const {return deserialize_to_;}

    void
    deserialize_to (string const& t) {deserialize_to_ = t;}

  public:
    typedef semantics::table table_type;

    table_type&
    table () const;

  public:
    column (string const& type, key_role key)
        : type_ (type), key_ (key)
    {
    }

    virtual string
    kind () const
    {
      return "column";
    }

  private:
    string type_;
    key_role key_;
    string deserialize_to_;
  };
}

#endif // CQLGEN_SEMANTICS_COLUMN_HXX
