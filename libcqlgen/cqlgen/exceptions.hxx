// file      : cqlgen/exceptions.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_EXCEPTIONS_HXX
#define LIBCQLGEN_EXCEPTIONS_HXX

#include <string>
#include <exception>

namespace cqlgen
{
  struct exception: std::exception
  {
    virtual const char*
    what () const throw () = 0;
  };

  // Error reported by the driver or the store.
  //
  class database_exception: public exception
  {
  public:
    database_exception (int code, const std::string& message)
        : code_ (code), message_ (message)
    {
    }

    ~database_exception () throw ()
    {
    }

    int
    code () const
    {
      return code_;
    }

    const std::string&
    message () const
    {
      return message_;
    }

    virtual const char*
    what () const throw ()
    {
      return message_.c_str ();
    }

  private:
    int code_;
    std::string message_;
  };

  // Full key lookup matched more than one row.
  //
  struct multiple_rows: exception
  {
    virtual const char*
    what () const throw ()
    {
      return "multiple rows match full key";
    }
  };

  // Session factory is empty or did not produce a session.
  //
  struct session_unavailable: exception
  {
    virtual const char*
    what () const throw ()
    {
      return "session unavailable";
    }
  };
}

#endif // LIBCQLGEN_EXCEPTIONS_HXX
