// file      : cqlgen/uuid.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_UUID_HXX
#define LIBCQLGEN_UUID_HXX

#include <string>

#include <cassandra.h>

#include <json/json.h>

// JSON conversion of the driver's UUID type. These are declared in the
// global namespace (the namespace of CassUuid) so that they are found by
// argument-dependent lookup.
//
inline void
to_json (const CassUuid& x, Json::Value& v)
{
  char s[CASS_UUID_STRING_LENGTH];
  cass_uuid_string (x, s);
  v = s;
}

inline void
from_json (const Json::Value& v, CassUuid& x)
{
  std::string s (v.asString ());

  if (cass_uuid_from_string (s.c_str (), &x) != CASS_OK)
    throw Json::RuntimeError ("invalid UUID '" + s + "'");
}

inline bool
operator== (const CassUuid& x, const CassUuid& y)
{
  return x.time_and_version == y.time_and_version &&
    x.clock_seq_and_node == y.clock_seq_and_node;
}

inline bool
operator!= (const CassUuid& x, const CassUuid& y)
{
  return !(x == y);
}

#endif // LIBCQLGEN_UUID_HXX
