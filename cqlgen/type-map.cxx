// file      : cqlgen/type-map.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cctype> // std::isspace

#include <cutl/re.hxx>

#include <cqlgen/type-map.hxx>

using namespace std;

char const* const unknown_type = "unknown";

namespace
{
  struct type_map_entry
  {
    const char* const cql_type;
    const char* const cxx_type;        // As a column type.
    const char* const cxx_element_type; // As a collection element type.
    bool time;
    bool uuid;
  };

  type_map_entry type_map[] =
  {
    {"text", "std::string", "std::string", false, false},

    {"uuid", "CassUuid", "CassUuid", false, true},
    {"timeuuid", "CassUuid", "CassUuid", false, true},

    {"int", "int", "int", false, false},
    {"double", "double", "double", false, false},

    {"timestamp",
     "cqlgen::nullable<cqlgen::timestamp>",
     "cqlgen::timestamp",
     true,
     false},

    {"blob", "cqlgen::buffer", "cqlgen::buffer", false, false}
  };

  type_map_entry const*
  find (string const& cql)
  {
    for (size_t i (0); i < sizeof (type_map) / sizeof (type_map_entry); ++i)
    {
      if (cql == type_map[i].cql_type)
        return type_map + i;
    }

    return 0;
  }

  // One level of element type nesting only.
  //
  cutl::re::regex const collection_regex ("(list|set)<([a-z]+)>");

  string
  normalize (string const& s)
  {
    string r;
    r.reserve (s.size ());

    for (string::const_iterator i (s.begin ()); i != s.end (); ++i)
    {
      if (!isspace (static_cast<unsigned char> (*i)))
        r += *i;
    }

    return r;
  }
}

type_mapping
map_type (string const& storage, string const& deserialize_to)
{
  type_mapping r;
  string t (normalize (storage));

  // Blob collections.
  //
  if (t == "list<blob>" || t == "map<text,blob>")
  {
    bool seq (t[0] == 'l');

    r.cxx_type = seq
      ? "std::vector<cqlgen::buffer>"
      : "std::map<std::string, cqlgen::buffer>";
    r.known = true;

    if (!deserialize_to.empty ())
    {
      r.serialized_type = deserialize_to;
      r.collection = seq ? type_mapping::sequence : type_mapping::mapping;
      r.imports.json = true;
    }

    return r;
  }

  // Scalars. The blob entry is only valid as an element type.
  //
  if (t != "blob")
  {
    if (type_map_entry const* e = find (t))
    {
      r.cxx_type = e->cxx_type;
      r.known = true;
      r.imports.time = e->time;
      r.imports.uuid = e->uuid;
      return r;
    }
  }

  // Generic one-level collections.
  //
  if (collection_regex.match (t))
  {
    string et (t, t.find ('<') + 1);
    et.resize (et.size () - 1);

    if (type_map_entry const* e = find (et))
    {
      r.cxx_type = string ("std::vector<") + e->cxx_element_type + ">";
      r.known = true;
      r.imports.time = e->time;
      r.imports.uuid = e->uuid;
      return r;
    }
  }

  r.cxx_type = unknown_type;
  return r;
}
