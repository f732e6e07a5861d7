// file      : cqlgen/type-map.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_TYPE_MAP_HXX
#define CQLGEN_TYPE_MAP_HXX

#include <string>

// Runtime headers that the generated code needs.
//
struct import_flags
{
  import_flags (): time (false), json (false), uuid (false) {}

  bool time; // cqlgen/timestamp.hxx
  bool json; // cqlgen/json.hxx
  bool uuid; // cqlgen/uuid.hxx

  import_flags&
  operator|= (import_flags const& x)
  {
    time = time || x.time;
    json = json || x.json;
    uuid = uuid || x.uuid;
    return *this;
  }
};

// Result of mapping a storage type to a C++ type.
//
struct type_mapping
{
  enum collection_kind
  {
    none,
    sequence, // list<blob>
    mapping   // map<text,blob>
  };

  type_mapping (): collection (none), known (false) {}

  // C++ type of the data member that holds the column value as stored.
  //
  std::string cxx_type;

  // Type that each blob value is deserialized into. Empty if the column
  // is not serialized.
  //
  std::string serialized_type;

  // Blob collection form. Only meaningful if serialized_type is not
  // empty.
  //
  collection_kind collection;

  // False if the storage type is not recognized, in which case cxx_type
  // is the unknown sentinel.
  //
  bool known;

  import_flags imports;

  bool
  serialized () const
  {
    return !serialized_type.empty ();
  }
};

// C++ type name emitted for unrecognized storage types.
//
extern char const* const unknown_type;

// Map the storage type to the C++ type. The deserialize_to hint is only
// considered for list<blob> and map<text,blob>. Whitespace in the
// storage type is ignored.
//
type_mapping
map_type (std::string const& storage, std::string const& deserialize_to);

#endif // CQLGEN_TYPE_MAP_HXX
