// file      : cqlgen/processor.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <iostream>

#include <cqlgen/traversal.hxx>
#include <cqlgen/semantics.hxx>
#include <cqlgen/diagnostics.hxx>
#include <cqlgen/keys.hxx>
#include <cqlgen/type-map.hxx>
#include <cqlgen/processor.hxx>

using namespace std;

namespace
{
  struct column: traversal::column
  {
    column (options const& ops, import_flags& imports)
        : ops_ (ops), imports_ (imports)
    {
    }

    virtual void
    traverse (type& c)
    {
      type_mapping const& m (
        c.set ("type-mapping", map_type (c.type (), c.deserialize_to ())));

      imports_ |= m.imports;

      if (ops_.trace ())
      {
        cerr << "column " << c.table ().name () << "." << c.name ()
             << " " << c.type () << " -> " << m.cxx_type;

        if (m.serialized ())
          cerr << " (" << m.serialized_type << ")";

        if (!m.known)
          cerr << " (unknown storage type)";

        cerr << endl;
      }
    }

  private:
    options const& ops_;
    import_flags& imports_;
  };

  struct table: traversal::table
  {
    table (options const& ops, semantics::path const& f, bool& valid)
        : ops_ (ops), file_ (f), valid_ (valid)
    {
    }

    virtual void
    traverse (type& t)
    {
      try
      {
        t.set ("key-structure", build_keys (t));
      }
      catch (empty_partition_key const&)
      {
        error (file_, t.line (), t.column ())
          << "table '" << t.name () << "' has no partition key" << endl;
        valid_ = false;
        return;
      }

      import_flags imports;
      {
        column c (ops_, imports);
        traversal::names n (c);
        names (t, n);
      }

      t.set ("import-flags", imports);
    }

  private:
    options const& ops_;
    semantics::path const& file_;
    bool& valid_;
  };
}

void processor::
process (options const& ops, semantics::model& m, semantics::path const& p)
{
  bool valid (true);

  traversal::model model;
  traversal::names names;
  table t (ops, p, valid);

  model >> names >> t;
  model.dispatch (m);

  if (!valid)
    throw failed ();
}
