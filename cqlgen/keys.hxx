// file      : cqlgen/keys.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_KEYS_HXX
#define CQLGEN_KEYS_HXX

#include <string>
#include <vector>

#include <cqlgen/semantics/table.hxx>

// Primary key structure of a table derived from its column key roles.
//
struct key_structure
{
  typedef std::vector<std::string> names;

  names partition_keys;  // In column order.
  names clustering_keys; // In column order.
  names clustering_order; // "name ASC|DESC" for explicitly ordered keys.
  names all_keys;         // Partition and clustering keys in column order.

  // "k" for a single partition key and "(k1, k2)" otherwise.
  //
  std::string
  partition_key_clause () const;

  // ", c1, c2" or empty if there are no clustering keys.
  //
  std::string
  clustering_columns_clause () const;

  // " WITH CLUSTERING ORDER BY (c1 DESC, c2 ASC)" or empty.
  //
  std::string
  clustering_order_clause () const;

  // "k1, c1, c2"
  //
  std::string
  all_keys_clause () const;

  // "k1=? AND c1=? AND c2=?"
  //
  std::string
  all_keys_equality () const;

  // "k1=? AND k2=?"
  //
  std::string
  partition_keys_equality () const;
};

// Thrown by build_keys() if the table has no partition key.
//
struct empty_partition_key
{
  explicit
  empty_partition_key (semantics::table& t): table (t) {}

  semantics::table& table;
};

key_structure
build_keys (semantics::table&);

#endif // CQLGEN_KEYS_HXX
