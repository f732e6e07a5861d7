// file      : cqlgen/result.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_RESULT_HXX
#define LIBCQLGEN_RESULT_HXX

#include <cstddef> // std::size_t

#include <cassandra.h>

#include <cqlgen/traits.hxx>
#include <cqlgen/statement.hxx>

namespace cqlgen
{
  // Row of the current result page. Only valid until the result is
  // advanced.
  //
  class row
  {
  public:
    explicit
    row (const CassRow* r)
        : row_ (r)
    {
    }

    // Null values are returned as default-initialized values.
    //
    template <typename T>
    void
    get (std::size_t column, T& v) const
    {
      const CassValue* x (cass_row_get_column (row_, column));

      if (x == 0 || cass_value_is_null (x))
      {
        v = T ();
        return;
      }

      if (CassError e = value_traits<T>::get (x, v))
        details::translate_error (e);
    }

  private:
    const CassRow* row_;
  };

  // Result of a select statement that transparently fetches the
  // following pages.
  //
  class result
  {
  public:
    // Execute the statement and fetch the first page.
    //
    result (CassSession*, statement&);
    ~result ();

    // Advance to the next row. Return false if there are no more rows.
    //
    bool
    next ();

    row
    current () const
    {
      return row (cass_iterator_get_row (iterator_));
    }

  private:
    result (const result&);
    result& operator= (const result&);

    void
    fetch ();

    void
    free ();

  private:
    CassSession* session_;
    statement& statement_;
    const CassResult* result_;
    CassIterator* iterator_;
  };
}

#include <cqlgen/result.ixx>

#endif // LIBCQLGEN_RESULT_HXX
