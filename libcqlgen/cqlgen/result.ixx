// file      : cqlgen/result.ixx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

namespace cqlgen
{
  inline result::
  result (CassSession* s, statement& st)
      : session_ (s), statement_ (st), result_ (0), iterator_ (0)
  {
    fetch ();
  }

  inline result::
  ~result ()
  {
    free ();
  }

  inline bool result::
  next ()
  {
    for (;;)
    {
      if (iterator_ != 0 && cass_iterator_next (iterator_))
        return true;

      if (result_ == 0 || !cass_result_has_more_pages (result_))
        return false;

      cass_statement_set_paging_state (statement_.handle (), result_);
      fetch ();
    }
  }

  inline void result::
  fetch ()
  {
    free ();

    result_ = details::wait_result (
      cass_session_execute (session_, statement_.handle ()));

    if (result_ != 0)
      iterator_ = cass_iterator_from_result (result_);
  }

  inline void result::
  free ()
  {
    if (iterator_ != 0)
    {
      cass_iterator_free (iterator_);
      iterator_ = 0;
    }

    if (result_ != 0)
    {
      cass_result_free (result_);
      result_ = 0;
    }
  }
}
