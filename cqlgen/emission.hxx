// file      : cqlgen/emission.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_EMISSION_HXX
#define CQLGEN_EMISSION_HXX

#include <string>
#include <vector>
#include <cstddef> // std::size_t

#include <json/value.h>

#include <cqlgen/keys.hxx>
#include <cqlgen/type-map.hxx>
#include <cqlgen/semantics/model.hxx>
#include <cqlgen/semantics/table.hxx>
#include <cqlgen/semantics/column.hxx>

// Fully-resolved per-table rendering context. It is built from the
// annotated semantic graph and does not refer back to it.
//
namespace emission
{
  typedef std::vector<std::string> strings;

  struct field
  {
    std::size_t index;       // Position in the column list.

    std::string name;        // Column name.
    std::string member;      // Data member (and parameter) name.
    std::string tag;         // JSON member name.
    semantics::key_role key;

    std::string cql_type;
    std::string cxx_type;    // Type as stored (bound and fetched).
    std::string model_type;  // Type of the model member, as seen by DAO.
    std::string dto_type;    // Type of the model member, as seen by DTO.
    bool known;

    // Blob collection deserialized into serialized_type (qualified as
    // seen by DAO). Empty if the column is not serialized.
    //
    std::string serialized_type;
    type_mapping::collection_kind collection;

    std::string scan_target;  // Destination of the fetched value.
    std::string insert_value; // Source of the bound value.
    std::string raw;          // Local variable for the stored value.

    // Statements that convert between the stored and model values. The
    // deserialize fragment expects row and o in scope; the serialize
    // fragment expects o and declares raw. Both are empty if the column
    // is not serialized.
    //
    std::string deserialize;
    std::string serialize;

    bool
    serialized () const
    {
      return !serialized_type.empty ();
    }
  };

  typedef std::vector<field> fields;

  struct table_model
  {
    std::string keyspace;
    std::string namespace_;     // DAO namespace.
    std::string dto_namespace;  // Empty if no DTO is generated.
    std::string model;          // Model name.
    std::string model_type;     // Model name, qualified as seen by DAO.
    std::string table;
    std::string dao;
    std::string generated_name;

    key_structure keys;

    // Query fragments.
    //
    std::string partition_keys;          // k or (k1, k2)
    std::string clustering_columns;      // , c1, c2
    std::string clustering_order;        //  WITH CLUSTERING ORDER BY (...)
    std::string all_keys;                // k1, c1
    std::string all_keys_equality;       // k1=? AND c1=?
    std::string partition_keys_equality; // k1=?
    std::string insert_fields;           // a, b, c
    std::string insert_values;           // ?, ?, ?

    fields columns;

    // Indexes into columns in the key order.
    //
    std::vector<std::size_t> all_key_columns;
    std::vector<std::size_t> partition_key_columns;

    import_flags imports;
    strings additional_imports;
  };

  // Build the rendering context for a processed table.
  //
  table_model
  build (semantics::model&, semantics::table&);

  // JSON representation of the rendering context (embedded in the
  // generated headers).
  //
  Json::Value
  to_json (table_model const&);
}

#endif // CQLGEN_EMISSION_HXX
