// file      : cqlgen/statement.ixx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

namespace cqlgen
{
  namespace details
  {
    inline void
    translate_error (CassError e)
    {
      throw database_exception (static_cast<int> (e), cass_error_desc (e));
    }

    inline const CassResult*
    wait_result (CassFuture* f)
    {
      cass_future_wait (f);

      CassError e (cass_future_error_code (f));

      if (e != CASS_OK)
      {
        const char* m;
        std::size_t n;
        cass_future_error_message (f, &m, &n);

        std::string s (m, n);
        cass_future_free (f);
        throw database_exception (static_cast<int> (e), s);
      }

      const CassResult* r (cass_future_get_result (f));
      cass_future_free (f);
      return r;
    }

    inline void
    wait (CassFuture* f)
    {
      if (const CassResult* r = wait_result (f))
        cass_result_free (r);
    }
  }

  inline statement::
  statement (const std::string& query, std::size_t parameters)
      : stmt_ (cass_statement_new_n (query.c_str (), query.size (), parameters))
  {
  }

  inline statement::
  ~statement ()
  {
    cass_statement_free (stmt_);
  }

  inline void statement::
  page_size (int n)
  {
    cass_statement_set_paging_size (stmt_, n);
  }

  inline void statement::
  execute (CassSession* s)
  {
    details::wait (cass_session_execute (s, stmt_));
  }
}
