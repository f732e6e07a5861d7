// file      : cqlgen/json.txx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

namespace cqlgen
{
  template <typename T>
  void
  to_json (const nullable<T>& x, Json::Value& v)
  {
    if (x.null ())
      v = Json::Value (Json::nullValue);
    else
      to_json (*x, v);
  }

  template <typename T>
  void
  from_json (const Json::Value& v, nullable<T>& x)
  {
    if (v.isNull ())
      x.reset ();
    else
    {
      T y;
      from_json (v, y);
      x = y;
    }
  }

  template <typename T>
  void
  to_json (const std::vector<T>& x, Json::Value& v)
  {
    v = Json::Value (Json::arrayValue);

    for (typename std::vector<T>::const_iterator i (x.begin ());
         i != x.end (); ++i)
    {
      Json::Value e;
      to_json (*i, e);
      v.append (e);
    }
  }

  template <typename T>
  void
  from_json (const Json::Value& v, std::vector<T>& x)
  {
    x.clear ();

    if (v.isNull ())
      return;

    if (!v.isArray ())
      throw Json::RuntimeError ("expected JSON array");

    for (Json::ArrayIndex i (0); i < v.size (); ++i)
    {
      x.push_back (T ());
      from_json (v[i], x.back ());
    }
  }

  template <typename T>
  void
  to_json (const std::map<std::string, T>& x, Json::Value& v)
  {
    v = Json::Value (Json::objectValue);

    for (typename std::map<std::string, T>::const_iterator i (x.begin ());
         i != x.end (); ++i)
      to_json (i->second, v[i->first]);
  }

  template <typename T>
  void
  from_json (const Json::Value& v, std::map<std::string, T>& x)
  {
    x.clear ();

    if (v.isNull ())
      return;

    if (!v.isObject ())
      throw Json::RuntimeError ("expected JSON object");

    Json::Value::Members ms (v.getMemberNames ());

    for (Json::Value::Members::const_iterator i (ms.begin ());
         i != ms.end (); ++i)
      from_json (v[*i], x[*i]);
  }

  template <typename T>
  bool
  marshal (const T& x, buffer& b, std::string& error)
  {
    try
    {
      Json::Value v;
      to_json (x, v);

      Json::StreamWriterBuilder w;
      w["indentation"] = "";

      std::string s (Json::writeString (w, v));
      b.assign (s.begin (), s.end ());
      return true;
    }
    catch (const std::exception& e)
    {
      error = e.what ();
      return false;
    }
  }

  template <typename T>
  void
  unmarshal (const buffer& b, T& x)
  {
    x = T ();

    if (b.empty ())
      return;

    Json::CharReaderBuilder rb;
    std::unique_ptr<Json::CharReader> r (rb.newCharReader ());

    const char* p (reinterpret_cast<const char*> (&b[0]));
    Json::Value v;
    std::string e;

    if (!r->parse (p, p + b.size (), &v, &e))
      return;

    try
    {
      from_json (v, x);
    }
    catch (const Json::Exception&)
    {
      x = T ();
    }
  }
}
