// file      : cqlgen/dao.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_DAO_HXX
#define LIBCQLGEN_DAO_HXX

#include <cstddef> // std::size_t

#include <cqlgen/buffer.hxx>
#include <cqlgen/nullable.hxx>
#include <cqlgen/stream.hxx>
#include <cqlgen/exceptions.hxx>
#include <cqlgen/traits.hxx>
#include <cqlgen/statement.hxx>
#include <cqlgen/result.hxx>
#include <cqlgen/session.hxx>

namespace cqlgen
{
  // Base of the generated data access classes.
  //
  class dao
  {
  public:
    explicit
    dao (const session_factory& f,
         std::size_t capacity = 100,
         int page_size = 5000)
        : factory_ (f), capacity_ (capacity), page_size_ (page_size)
    {
    }

    // Factory for the sessions the data access class opens itself.
    //
    const session_factory&
    factory () const
    {
      return factory_;
    }

    // Number of rows buffered ahead of the stream consumer.
    //
    std::size_t
    capacity () const
    {
      return capacity_;
    }

    int
    page_size () const
    {
      return page_size_;
    }

  private:
    session_factory factory_;
    std::size_t capacity_;
    int page_size_;
  };
}

#endif // LIBCQLGEN_DAO_HXX
