// file      : cqlgen/session.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#ifndef LIBCQLGEN_SESSION_HXX
#define LIBCQLGEN_SESSION_HXX

#include <functional>

#include <cassandra.h>

#include <cqlgen/exceptions.hxx>

namespace cqlgen
{
  // Create a new connected session. The caller owns the session.
  //
  typedef std::function<CassSession* ()> session_factory;

  // Scoped session. If no session is passed, acquire one from the
  // factory and close and free it on destruction.
  //
  class session_guard
  {
  public:
    explicit
    session_guard (const session_factory&, CassSession* = 0);
    ~session_guard ();

    CassSession*
    session () const
    {
      return session_;
    }

  private:
    session_guard (const session_guard&);
    session_guard& operator= (const session_guard&);

  private:
    CassSession* session_;
    bool owned_;
  };
}

#include <cqlgen/session.ixx>

#endif // LIBCQLGEN_SESSION_HXX
