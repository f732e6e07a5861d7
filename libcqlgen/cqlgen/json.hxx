// file      : cqlgen/json.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_JSON_HXX
#define LIBCQLGEN_JSON_HXX

#include <map>
#include <string>
#include <vector>
#include <memory>    // std::unique_ptr
#include <exception>

#include <json/json.h>

#include <cqlgen/buffer.hxx>
#include <cqlgen/nullable.hxx>
#include <cqlgen/timestamp.hxx>

// JSON conversion of the values stored in serialized blob collections.
// User types provide the to_json() and from_json() functions with the
// same signatures in their own namespace.
//
namespace cqlgen
{
  // Scalars.
  //
  inline void
  to_json (const std::string& x, Json::Value& v)
  {
    v = x;
  }

  inline void
  from_json (const Json::Value& v, std::string& x)
  {
    x = v.asString ();
  }

  inline void
  to_json (bool x, Json::Value& v)
  {
    v = x;
  }

  inline void
  from_json (const Json::Value& v, bool& x)
  {
    x = v.asBool ();
  }

  inline void
  to_json (int x, Json::Value& v)
  {
    v = x;
  }

  inline void
  from_json (const Json::Value& v, int& x)
  {
    x = v.asInt ();
  }

  inline void
  to_json (long long x, Json::Value& v)
  {
    v = static_cast<Json::Int64> (x);
  }

  inline void
  from_json (const Json::Value& v, long long& x)
  {
    x = static_cast<long long> (v.asInt64 ());
  }

  inline void
  to_json (double x, Json::Value& v)
  {
    v = x;
  }

  inline void
  from_json (const Json::Value& v, double& x)
  {
    x = v.asDouble ();
  }

  // Milliseconds since the epoch.
  //
  inline void
  to_json (const timestamp& x, Json::Value& v)
  {
    v = static_cast<Json::Int64> (to_milliseconds (x));
  }

  inline void
  from_json (const Json::Value& v, timestamp& x)
  {
    x = from_milliseconds (static_cast<long long> (v.asInt64 ()));
  }

  // Hex string.
  //
  inline void
  to_json (const buffer&, Json::Value&);

  inline void
  from_json (const Json::Value&, buffer&);

  // Wrappers and containers. Null is represented as JSON null.
  //
  template <typename T>
  void
  to_json (const nullable<T>&, Json::Value&);

  template <typename T>
  void
  from_json (const Json::Value&, nullable<T>&);

  template <typename T>
  void
  to_json (const std::vector<T>&, Json::Value&);

  template <typename T>
  void
  from_json (const Json::Value&, std::vector<T>&);

  template <typename T>
  void
  to_json (const std::map<std::string, T>&, Json::Value&);

  template <typename T>
  void
  from_json (const Json::Value&, std::map<std::string, T>&);

  // Encode the value as compact JSON. Return false and set the error
  // description if the value cannot be represented.
  //
  template <typename T>
  bool
  marshal (const T&, buffer&, std::string& error);

  // Decode the value. A buffer that does not contain a valid JSON
  // representation of T leaves the value default-initialized.
  //
  template <typename T>
  void
  unmarshal (const buffer&, T&);
}

#include <cqlgen/json.ixx>
#include <cqlgen/json.txx>

#endif // LIBCQLGEN_JSON_HXX
