// file      : cqlgen/validator.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <map>
#include <utility> // std::pair
#include <iostream>

#include <cqlgen/context.hxx>
#include <cqlgen/traversal.hxx>
#include <cqlgen/semantics.hxx>
#include <cqlgen/diagnostics.hxx>
#include <cqlgen/type-map.hxx>
#include <cqlgen/validator.hxx>

using namespace std;

namespace
{
  // Escaped member name to the column that claimed it.
  //
  typedef map<string, semantics::column*> members;

  struct column: traversal::column
  {
    column (semantics::path const& f,
            bool& valid,
            size_t& partition,
            members& m)
        : file_ (f), valid_ (valid), partition_ (partition), members_ (m)
    {
    }

    virtual void
    traverse (type& c)
    {
      if (c.name ().empty ())
      {
        error (file_, c.line (), c.column ()) << "column name is empty"
                                              << endl;
        valid_ = false;
      }

      if (c.type ().empty ())
      {
        error (file_, c.line (), c.column ())
          << "column '" << c.name () << "' has no type" << endl;
        valid_ = false;
      }

      if (c.key () == semantics::key_role::partition)
        partition_++;

      // Distinct column names can escape to the same member name, for
      // example 'e' and 'e_'.
      //
      if (!c.name ().empty ())
      {
        string m (context::escape (c.name ()));
        pair<members::iterator, bool> r (
          members_.insert (make_pair (m, &c)));

        if (!r.second)
        {
          semantics::column& o (*r.first->second);

          error (file_, c.line (), c.column ())
            << "column '" << c.name () << "' maps to member name '" << m
            << "' which is already used by column '" << o.name () << "'"
            << endl;
          info (file_, o.line (), o.column ())
            << "column '" << o.name () << "' is defined here" << endl;
          valid_ = false;
        }
      }

      if (!c.deserialize_to ().empty () &&
          !map_type (c.type (), c.deserialize_to ()).serialized ())
      {
        warn (file_, c.line (), c.column ())
          << "'deserializeTo' is ignored for column '" << c.name ()
          << "' of type '" << c.type () << "'" << endl;
        info (file_, c.line (), c.column ())
          << "only list<blob> and map<text,blob> columns can be "
          << "deserialized" << endl;
      }
    }

  private:
    semantics::path const& file_;
    bool& valid_;
    size_t& partition_;
    members& members_;
  };

  struct table: traversal::table
  {
    table (semantics::path const& f, bool& valid)
        : file_ (f), valid_ (valid)
    {
    }

    virtual void
    traverse (type& t)
    {
      string const& n (t.name ());

      if (n.empty ())
      {
        error (file_, t.line (), t.column ()) << "table name is empty"
                                              << endl;
        valid_ = false;
      }

      if (t.model_name ().empty ())
      {
        error (file_, t.line (), t.column ())
          << "table '" << n << "' has no model name" << endl;
        valid_ = false;
      }

      if (t.dao ().empty ())
      {
        error (file_, t.line (), t.column ())
          << "table '" << n << "' has no data access class name" << endl;
        valid_ = false;
      }

      if (t.names_empty ())
      {
        error (file_, t.line (), t.column ())
          << "table '" << n << "' has no columns defined" << endl;
        valid_ = false;
        return;
      }

      size_t partition (0);
      {
        members m;
        column c (file_, valid_, partition, m);
        traversal::names cn (c);
        names (t, cn);
      }

      if (partition == 0)
      {
        error (file_, t.line (), t.column ())
          << "table '" << n << "' has no partition key" << endl;
        info (file_, t.line (), t.column ())
          << "mark at least one column with \"key\": \"partition\"" << endl;
        valid_ = false;
      }
    }

  private:
    semantics::path const& file_;
    bool& valid_;
  };
}

bool validator::
validate (options const& ops, semantics::model& m, semantics::path const& p)
{
  bool valid (true);

  if (m.names_empty ())
  {
    error (p) << "at least one table must be defined" << endl;
    return false;
  }

  if (m.keyspace ().empty ())
  {
    error (p) << "keyspace is not specified" << endl;
    valid = false;
  }

  traversal::model model;
  traversal::names names;
  table t (p, valid);

  model >> names >> t;
  model.dispatch (m);

  if (ops.trace ())
    cerr << "validated " << m.names_size () << " table(s)"
         << (valid ? "" : " with errors") << endl;

  return valid;
}
