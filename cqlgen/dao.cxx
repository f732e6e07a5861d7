// file      : cqlgen/dao.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <string>
#include <vector>
#include <sstream>

#include <json/json.h>

#include <cqlgen/context.hxx>
#include <cqlgen/generate.hxx>

using namespace std;

namespace
{
  typedef emission::field field;
  typedef emission::fields fields;
  typedef vector<size_t> indexes;

  struct emitter: context
  {
    emitter ()
        : t (table)
    {
    }

    void
    generate ()
    {
      banner ();

      string guard (guard_name ());

      os << "#ifndef " << guard << endl
         << "#define " << guard << endl
         << endl;

      includes ();

      if (!t.namespace_.empty ())
        open_ns (t.namespace_);

      if (!boilerplate.empty ())
        os << boilerplate << endl;

      record ();
      class_ ();

      os << endl;

      init ();
      add ();
      get ();
      list ();
      stream ();
      erase ();
      list_ ();
      stream_ ();
      load ();

      if (!t.namespace_.empty ())
        close_ns (t.namespace_);

      os << endl
         << "#endif // " << guard << endl;
    }

  private:
    string
    guard_name () const
    {
      return macro (t.generated_name) + "_DAO_GEN_HXX";
    }

    void
    banner ()
    {
      Json::StreamWriterBuilder b;
      b["indentation"] = "  ";
      string m (Json::writeString (b, emission::to_json (t)));

      os << "// Generated by cqlgen; do not edit." << endl
         << "//" << endl
         << "// Model that generated this code:" << endl
         << "//" << endl;

      istringstream is (m);
      for (string l; getline (is, l);)
        os << "// " << l << endl;

      os << "//" << endl
         << endl;
    }

    void
    includes ()
    {
      os << "#include <map>" << endl
         << "#include <memory>" << endl
         << "#include <string>" << endl
         << "#include <vector>" << endl
         << "#include <thread>" << endl
         << "#include <iostream>" << endl
         << "#include <exception>" << endl
         << endl
         << "#include <cqlgen/dao.hxx>" << endl;

      if (t.imports.time)
        os << "#include <cqlgen/timestamp.hxx>" << endl;

      if (t.imports.json)
        os << "#include <cqlgen/json.hxx>" << endl;

      if (t.imports.uuid)
        os << "#include <cqlgen/uuid.hxx>" << endl;

      if (!t.additional_imports.empty ())
      {
        os << endl;

        for (emission::strings::const_iterator i (
               t.additional_imports.begin ());
             i != t.additional_imports.end (); ++i)
          os << "#include " << *i << endl;
      }

      os << endl;
    }

    // Parameter list for the key columns, with a trailing separator.
    //
    string
    key_params (indexes const& ks) const
    {
      string r;

      for (indexes::const_iterator i (ks.begin ()); i != ks.end (); ++i)
      {
        field const& f (t.columns[*i]);
        r += "const " + f.model_type + "& " + f.member + ", ";
      }

      return r;
    }

    void
    bind_keys (indexes const& ks, char const* st, char const* prefix)
    {
      size_t n (0);

      for (indexes::const_iterator i (ks.begin ()); i != ks.end (); ++i)
        os << st << "bind (" << n++ << "u, " << prefix <<
          t.columns[*i].member << ");";
    }

    string
    record_name () const
    {
      return t.model + "Stream";
    }

    string
    stream_type () const
    {
      return "std::shared_ptr<cqlgen::stream<" + record_name () + "> >";
    }

    string
    select (string const& predicate) const
    {
      return "SELECT " + t.insert_fields + " FROM " + t.keyspace + "." +
        t.table + " WHERE " + predicate + ";";
    }

    void
    record ()
    {
      os << "// Entry of the stream returned by " << t.dao << "::stream()." <<
        endl
         << "// If err is set, the streaming has failed and this is the " <<
        "last entry." << endl
         << "//" << endl
         << "struct " << record_name ()
         << "{"
         << "std::shared_ptr<" << t.model_type << "> dto;"
         << "std::exception_ptr err;"
         << "};";
    }

    void
    class_ ()
    {
      string pks (key_params (t.partition_key_columns));
      string aks (key_params (t.all_key_columns));

      os << endl
         << "class " << t.dao << ": public cqlgen::dao"
         << "{"
         << "public:" << endl
         << "typedef " << t.model_type << " model_type;"
         << "typedef " << record_name () << " stream_type;"
         << endl
         << "explicit" << endl
         << t.dao << " (const cqlgen::session_factory& f," << endl
         << "std::size_t capacity = 100," << endl
         << "int page_size = 5000)" << endl
         << ": cqlgen::dao (f, capacity, page_size)"
         << "{"
         << "}";

      // If the session is null, the functions below open one with the
      // session factory and close it on return.
      //
      os << "// Create the table if it does not exist." << endl
         << "//" << endl
         << "void" << endl
         << "init (CassSession* session = 0);"
         << endl
         << "void" << endl
         << "add (const model_type& o, CassSession* session = 0);"
         << endl
         << "// Return null if there is no such row." << endl
         << "//" << endl
         << "std::unique_ptr<model_type>" << endl
         << "get (" << aks << "CassSession* session = 0);"
         << endl
         << "std::vector<model_type>" << endl
         << "list (" << pks << "CassSession* session = 0);"
         << endl
         << "// Fetch the partition in a separate thread with its own " <<
        "session." << endl
         << "// The thread blocks while capacity () entries are buffered." <<
        endl
         << "//" << endl
         << "std::shared_ptr<cqlgen::stream<stream_type> >" << endl
         << "stream (" << pks.substr (0, pks.empty () ? 0 : pks.size () - 2)
         << ");"
         << endl
         << "void" << endl
         << "erase (const model_type& o, CassSession* session = 0);"
         << endl
         << "private:" << endl
         << "std::vector<model_type>" << endl
         << "list_ (cqlgen::statement&, CassSession*);"
         << endl
         << "static void" << endl
         << "stream_ (cqlgen::session_factory," << endl
         << "std::shared_ptr<cqlgen::statement>," << endl
         << "std::shared_ptr<cqlgen::stream<stream_type> >);"
         << endl
         << "static void" << endl
         << "load (model_type&, const cqlgen::row&);"
         << "};";
    }

    void
    init ()
    {
      os << "inline void " << t.dao << "::" << endl
         << "init (CassSession* session)"
         << "{"
         << "cqlgen::session_guard sg (factory (), session);"
         << "cqlgen::statement st (" << endl
         << strlit ("CREATE TABLE IF NOT EXISTS " + t.keyspace + "." +
                    t.table + " (") << endl;

      for (fields::const_iterator i (t.columns.begin ());
           i != t.columns.end (); ++i)
        os << strlit (i->name + " " + i->cql_type + ", ") << endl;

      os << strlit ("PRIMARY KEY (" + t.partition_keys +
                    t.clustering_columns + "))" + t.clustering_order + ";")
         << "," << endl
         << "0);"
         << "st.execute (sg.session ());"
         << "}";
    }

    void
    add ()
    {
      os << "inline void " << t.dao << "::" << endl
         << "add (const model_type& o, CassSession* session)"
         << "{";

      for (fields::const_iterator i (t.columns.begin ());
           i != t.columns.end (); ++i)
      {
        if (i->serialized ())
          os << i->serialize << endl;
      }

      os << "cqlgen::session_guard sg (factory (), session);"
         << "cqlgen::statement st (" << endl
         << strlit ("INSERT INTO " + t.keyspace + "." + t.table + " (" +
                    t.insert_fields + ") VALUES (" + t.insert_values + ");")
         << "," << endl
         << t.columns.size () << "u);";

      for (fields::const_iterator i (t.columns.begin ());
           i != t.columns.end (); ++i)
        os << "st.bind (" << i->index << "u, " << i->insert_value << ");";

      os << "st.execute (sg.session ());"
         << "}";
    }

    void
    get ()
    {
      string aks (key_params (t.all_key_columns));

      os << "inline std::unique_ptr<" << t.model_type << "> " << t.dao <<
        "::" << endl
         << "get (" << aks << "CassSession* session)"
         << "{"
         << "cqlgen::session_guard sg (factory (), session);"
         << "cqlgen::statement st (" << endl
         << strlit (select (t.all_keys_equality)) << "," << endl
         << t.all_key_columns.size () << "u);";

      bind_keys (t.all_key_columns, "st.", "");

      os << "std::vector<model_type> r (list_ (st, sg.session ()));"
         << endl
         << "if (r.empty ())" << endl
         << "return std::unique_ptr<model_type> ();"
         << endl
         << "if (r.size () > 1)" << endl
         << "throw cqlgen::multiple_rows ();"
         << endl
         << "return std::unique_ptr<model_type> (new model_type (r.front ()));"
         << "}";
    }

    void
    list ()
    {
      string pks (key_params (t.partition_key_columns));

      os << "inline std::vector<" << t.model_type << "> " << t.dao << "::" <<
        endl
         << "list (" << pks << "CassSession* session)"
         << "{"
         << "cqlgen::session_guard sg (factory (), session);"
         << "cqlgen::statement st (" << endl
         << strlit (select (t.partition_keys_equality)) << "," << endl
         << t.partition_key_columns.size () << "u);";

      bind_keys (t.partition_key_columns, "st.", "");

      os << "return list_ (st, sg.session ());"
         << "}";
    }

    void
    stream ()
    {
      string pks (key_params (t.partition_key_columns));

      os << "inline " << stream_type () << " " << t.dao << "::" << endl
         << "stream (" << pks.substr (0, pks.empty () ? 0 : pks.size () - 2)
         << ")"
         << "{"
         << "std::shared_ptr<cqlgen::statement> st (" << endl
         << "new cqlgen::statement (" << endl
         << strlit (select (t.partition_keys_equality)) << "," << endl
         << t.partition_key_columns.size () << "u));";

      bind_keys (t.partition_key_columns, "st->", "");

      os << "st->page_size (page_size ());"
         << endl
         << "std::shared_ptr<cqlgen::stream<stream_type> > s (" << endl
         << "new cqlgen::stream<stream_type> (capacity ()));"
         << endl
         << "std::thread (&" << t.dao << "::stream_, factory (), st, s)." <<
        "detach ();"
         << "return s;"
         << "}";
    }

    void
    erase ()
    {
      os << "inline void " << t.dao << "::" << endl
         << "erase (const model_type& o, CassSession* session)"
         << "{"
         << "cqlgen::session_guard sg (factory (), session);"
         << "cqlgen::statement st (" << endl
         << strlit ("DELETE FROM " + t.keyspace + "." + t.table +
                    " WHERE " + t.all_keys_equality + ";") << "," << endl
         << t.all_key_columns.size () << "u);";

      bind_keys (t.all_key_columns, "st.", "o.");

      os << "st.execute (sg.session ());"
         << "}";
    }

    void
    list_ ()
    {
      os << "inline std::vector<" << t.model_type << "> " << t.dao << "::" <<
        endl
         << "list_ (cqlgen::statement& st, CassSession* session)"
         << "{"
         << "std::vector<model_type> r;"
         << "st.page_size (page_size ());"
         << endl
         << "cqlgen::result res (session, st);"
         << "while (res.next ())"
         << "{"
         << "model_type o;"
         << "load (o, res.current ());"
         << "r.push_back (o);"
         << "}"
         << "return r;"
         << "}";
    }

    void
    stream_ ()
    {
      os << "inline void " << t.dao << "::" << endl
         << "stream_ (cqlgen::session_factory f," << endl
         << "std::shared_ptr<cqlgen::statement> st," << endl
         << stream_type () << " s)"
         << "{"
         << "try"
         << "{"
         << "cqlgen::session_guard sg (f);"
         << "cqlgen::result res (sg.session (), *st);"
         << endl
         << "while (res.next ())"
         << "{"
         << "stream_type x;"
         << "x.dto.reset (new model_type);"
         << "load (*x.dto, res.current ());"
         << endl
         << "if (!s->push (x))" << endl
         << "break;"
         << "}"
         << "}"
         << "catch (const std::exception& e)"
         << "{"
         << "std::cerr << " << strlit ("unable to stream " + t.table + ": ")
         << " << e.what () << std::endl;"
         << endl
         << "stream_type x;"
         << "x.err = std::current_exception ();"
         << "s->push (x);"
         << "}"
         << "s->close ();"
         << "}";
    }

    void
    load ()
    {
      os << "inline void " << t.dao << "::" << endl
         << "load (model_type& o, const cqlgen::row& row)"
         << "{";

      for (fields::const_iterator i (t.columns.begin ());
           i != t.columns.end (); ++i)
      {
        if (i->serialized ())
          os << i->deserialize;
        else
          os << "row.get (" << i->index << "u, " << i->scan_target << ");";
      }

      os << "}";
    }

  private:
    table_type const& t;
  };
}

namespace dao
{
  void
  generate ()
  {
    emitter e;
    e.generate ();
  }
}
