// file      : cqlgen/keys.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cqlgen/keys.hxx>
#include <cqlgen/semantics/column.hxx>

using namespace std;

namespace
{
  string
  join (key_structure::names const& ns, char const* sep, char const* suffix)
  {
    string r;

    for (key_structure::names::const_iterator i (ns.begin ());
         i != ns.end (); ++i)
    {
      if (i != ns.begin ())
        r += sep;

      r += *i;
      r += suffix;
    }

    return r;
  }
}

string key_structure::
partition_key_clause () const
{
  string r (join (partition_keys, ", ", ""));
  return partition_keys.size () > 1 ? '(' + r + ')' : r;
}

string key_structure::
clustering_columns_clause () const
{
  return clustering_keys.empty ()
    ? string ()
    : ", " + join (clustering_keys, ", ", "");
}

string key_structure::
clustering_order_clause () const
{
  return clustering_order.empty ()
    ? string ()
    : " WITH CLUSTERING ORDER BY (" + join (clustering_order, ", ", "") + ')';
}

string key_structure::
all_keys_clause () const
{
  return join (all_keys, ", ", "");
}

string key_structure::
all_keys_equality () const
{
  return join (all_keys, " AND ", "=?");
}

string key_structure::
partition_keys_equality () const
{
  return join (partition_keys, " AND ", "=?");
}

key_structure
build_keys (semantics::table& t)
{
  using semantics::column;
  using semantics::key_role;

  key_structure r;

  for (semantics::scope::names_iterator i (t.names_begin ());
       i != t.names_end (); ++i)
  {
    column* c (dynamic_cast<column*> (&i->named ()));

    if (c == 0)
      continue;

    string const& n (c->name ());
    key_role k (c->key ());

    switch (k)
    {
    case key_role::partition:
      {
        r.partition_keys.push_back (n);
        break;
      }
    case key_role::cluster_asc:
    case key_role::cluster_desc:
      {
        r.clustering_order.push_back (
          n + (k == key_role::cluster_asc ? " ASC" : " DESC"));
      }
      // Fall through.
    case key_role::cluster:
      {
        r.clustering_keys.push_back (n);
        break;
      }
    case key_role::none:
      continue;
    }

    r.all_keys.push_back (n);
  }

  if (r.partition_keys.empty ())
    throw empty_partition_key (t);

  return r;
}
