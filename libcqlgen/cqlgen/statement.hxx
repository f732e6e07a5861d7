// file      : cqlgen/statement.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_STATEMENT_HXX
#define LIBCQLGEN_STATEMENT_HXX

#include <string>
#include <cstddef> // std::size_t

#include <cassandra.h>

#include <cqlgen/traits.hxx>
#include <cqlgen/exceptions.hxx>

namespace cqlgen
{
  namespace details
  {
    // Wait for the future and translate the driver error, if any, to
    // database_exception. Free the future.
    //
    inline void
    wait (CassFuture*);

    // As above but return the result. The caller owns the result.
    //
    inline const CassResult*
    wait_result (CassFuture*);

    inline void
    translate_error (CassError);
  }

  class statement
  {
  public:
    statement (const std::string& query, std::size_t parameters);
    ~statement ();

    template <typename T>
    void
    bind (std::size_t i, const T& v)
    {
      if (CassError e = value_traits<T>::bind (stmt_, i, v))
        details::translate_error (e);
    }

    void
    page_size (int);

    // Execute the statement ignoring the result.
    //
    void
    execute (CassSession*);

    CassStatement*
    handle () const
    {
      return stmt_;
    }

  private:
    statement (const statement&);
    statement& operator= (const statement&);

  private:
    CassStatement* stmt_;
  };
}

#include <cqlgen/statement.ixx>

#endif // LIBCQLGEN_STATEMENT_HXX
