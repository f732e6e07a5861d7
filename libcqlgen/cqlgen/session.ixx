// file      : cqlgen/session.ixx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

namespace cqlgen
{
  inline session_guard::
  session_guard (const session_factory& f, CassSession* s)
      : session_ (s), owned_ (false)
  {
    if (session_ == 0)
    {
      if (!f || (session_ = f ()) == 0)
        throw session_unavailable ();

      owned_ = true;
    }
  }

  inline session_guard::
  ~session_guard ()
  {
    if (owned_)
    {
      CassFuture* f (cass_session_close (session_));
      cass_future_wait (f);
      cass_future_free (f);
      cass_session_free (session_);
    }
  }
}
