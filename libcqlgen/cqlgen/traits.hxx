// file      : cqlgen/traits.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_TRAITS_HXX
#define LIBCQLGEN_TRAITS_HXX

#include <map>
#include <string>
#include <vector>
#include <cstddef> // std::size_t

#include <cassandra.h>

#include <cqlgen/buffer.hxx>
#include <cqlgen/nullable.hxx>
#include <cqlgen/timestamp.hxx>

namespace cqlgen
{
  namespace details
  {
    // Driver handle owners.
    //
    class collection
    {
    public:
      collection (CassCollectionType t, std::size_t n)
          : c_ (cass_collection_new (t, n))
      {
      }

      ~collection ()
      {
        cass_collection_free (c_);
      }

      CassCollection*
      handle () const
      {
        return c_;
      }

    private:
      collection (const collection&);
      collection& operator= (const collection&);

    private:
      CassCollection* c_;
    };

    class iterator
    {
    public:
      explicit
      iterator (CassIterator* i)
          : i_ (i)
      {
      }

      ~iterator ()
      {
        if (i_ != 0)
          cass_iterator_free (i_);
      }

      CassIterator*
      handle () const
      {
        return i_;
      }

      bool
      next () const
      {
        return i_ != 0 && cass_iterator_next (i_) == cass_true;
      }

    private:
      iterator (const iterator&);
      iterator& operator= (const iterator&);

    private:
      CassIterator* i_;
    };
  }

  // Conversion between C++ values and driver values. Each specialization
  // provides bind() (statement parameter), append() (collection element),
  // and get() (fetched value that is not null).
  //
  template <typename T>
  struct value_traits;

  template <>
  struct value_traits<std::string>
  {
    static CassError
    bind (CassStatement* s, std::size_t i, const std::string& v)
    {
      return cass_statement_bind_string_n (s, i, v.c_str (), v.size ());
    }

    static CassError
    append (CassCollection* c, const std::string& v)
    {
      return cass_collection_append_string_n (c, v.c_str (), v.size ());
    }

    static CassError
    get (const CassValue* x, std::string& v)
    {
      const char* p;
      std::size_t n;
      CassError r (cass_value_get_string (x, &p, &n));

      if (r == CASS_OK)
        v.assign (p, n);

      return r;
    }
  };

  template <>
  struct value_traits<int>
  {
    static CassError
    bind (CassStatement* s, std::size_t i, int v)
    {
      return cass_statement_bind_int32 (s, i, v);
    }

    static CassError
    append (CassCollection* c, int v)
    {
      return cass_collection_append_int32 (c, v);
    }

    static CassError
    get (const CassValue* x, int& v)
    {
      cass_int32_t r;
      CassError e (cass_value_get_int32 (x, &r));

      if (e == CASS_OK)
        v = static_cast<int> (r);

      return e;
    }
  };

  template <>
  struct value_traits<double>
  {
    static CassError
    bind (CassStatement* s, std::size_t i, double v)
    {
      return cass_statement_bind_double (s, i, v);
    }

    static CassError
    append (CassCollection* c, double v)
    {
      return cass_collection_append_double (c, v);
    }

    static CassError
    get (const CassValue* x, double& v)
    {
      return cass_value_get_double (x, &v);
    }
  };

  template <>
  struct value_traits<CassUuid>
  {
    static CassError
    bind (CassStatement* s, std::size_t i, const CassUuid& v)
    {
      return cass_statement_bind_uuid (s, i, v);
    }

    static CassError
    append (CassCollection* c, const CassUuid& v)
    {
      return cass_collection_append_uuid (c, v);
    }

    static CassError
    get (const CassValue* x, CassUuid& v)
    {
      return cass_value_get_uuid (x, &v);
    }
  };

  template <>
  struct value_traits<timestamp>
  {
    static CassError
    bind (CassStatement* s, std::size_t i, const timestamp& v)
    {
      return cass_statement_bind_int64 (s, i, to_milliseconds (v));
    }

    static CassError
    append (CassCollection* c, const timestamp& v)
    {
      return cass_collection_append_int64 (c, to_milliseconds (v));
    }

    static CassError
    get (const CassValue* x, timestamp& v)
    {
      cass_int64_t ms;
      CassError r (cass_value_get_int64 (x, &ms));

      if (r == CASS_OK)
        v = from_milliseconds (ms);

      return r;
    }
  };

  template <>
  struct value_traits<buffer>
  {
    static CassError
    bind (CassStatement* s, std::size_t i, const buffer& v)
    {
      return cass_statement_bind_bytes (
        s, i, v.empty () ? 0 : &v[0], v.size ());
    }

    static CassError
    append (CassCollection* c, const buffer& v)
    {
      return cass_collection_append_bytes (
        c, v.empty () ? 0 : &v[0], v.size ());
    }

    static CassError
    get (const CassValue* x, buffer& v)
    {
      const cass_byte_t* p;
      std::size_t n;
      CassError r (cass_value_get_bytes (x, &p, &n));

      if (r == CASS_OK)
        v.assign (p, p + n);

      return r;
    }
  };

  template <typename T>
  struct value_traits<nullable<T> >
  {
    static CassError
    bind (CassStatement* s, std::size_t i, const nullable<T>& v)
    {
      return v.null ()
        ? cass_statement_bind_null (s, i)
        : value_traits<T>::bind (s, i, *v);
    }

    static CassError
    get (const CassValue* x, nullable<T>& v)
    {
      T y;
      CassError r (value_traits<T>::get (x, y));

      if (r == CASS_OK)
        v = y;

      return r;
    }
  };

  // list<T> and set<T>.
  //
  template <typename T>
  struct value_traits<std::vector<T> >
  {
    static CassError
    bind (CassStatement* s, std::size_t i, const std::vector<T>& v)
    {
      details::collection c (CASS_COLLECTION_TYPE_LIST, v.size ());

      for (typename std::vector<T>::const_iterator j (v.begin ());
           j != v.end (); ++j)
      {
        if (CassError r = value_traits<T>::append (c.handle (), *j))
          return r;
      }

      return cass_statement_bind_collection (s, i, c.handle ());
    }

    static CassError
    get (const CassValue* x, std::vector<T>& v)
    {
      details::iterator i (cass_iterator_from_collection (x));

      v.clear ();

      while (i.next ())
      {
        v.push_back (T ());

        if (CassError r = value_traits<T>::get (
              cass_iterator_get_value (i.handle ()), v.back ()))
          return r;
      }

      return CASS_OK;
    }
  };

  // map<text,T>.
  //
  template <typename T>
  struct value_traits<std::map<std::string, T> >
  {
    static CassError
    bind (CassStatement* s,
          std::size_t i,
          const std::map<std::string, T>& v)
    {
      details::collection c (CASS_COLLECTION_TYPE_MAP, v.size ());

      for (typename std::map<std::string, T>::const_iterator j (v.begin ());
           j != v.end (); ++j)
      {
        if (CassError r = value_traits<std::string>::append (
              c.handle (), j->first))
          return r;

        if (CassError r = value_traits<T>::append (c.handle (), j->second))
          return r;
      }

      return cass_statement_bind_collection (s, i, c.handle ());
    }

    static CassError
    get (const CassValue* x, std::map<std::string, T>& v)
    {
      details::iterator i (cass_iterator_from_map (x));

      v.clear ();

      while (i.next ())
      {
        std::string k;

        if (CassError r = value_traits<std::string>::get (
              cass_iterator_get_map_key (i.handle ()), k))
          return r;

        if (CassError r = value_traits<T>::get (
              cass_iterator_get_map_value (i.handle ()), v[k]))
          return r;
      }

      return CASS_OK;
    }
  };
}

#endif // LIBCQLGEN_TRAITS_HXX
