// file      : cqlgen/dto.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <string>
#include <sstream>

#include <json/json.h>

#include <cqlgen/context.hxx>
#include <cqlgen/generate.hxx>

using namespace std;

namespace
{
  typedef emission::fields fields;

  struct emitter: context
  {
    emitter ()
        : t (table)
    {
    }

    void
    generate ()
    {
      Json::StreamWriterBuilder b;
      b["indentation"] = "  ";
      istringstream is (Json::writeString (b, emission::to_json (t)));

      os << "// Generated by cqlgen; do not edit." << endl
         << "//" << endl
         << "// Model that generated this code:" << endl
         << "//" << endl;

      for (string l; getline (is, l);)
        os << "// " << l << endl;

      string guard (guard_name ());

      os << "//" << endl
         << endl
         << "#ifndef " << guard << endl
         << "#define " << guard << endl
         << endl
         << "#include <map>" << endl
         << "#include <string>" << endl
         << "#include <vector>" << endl
         << endl
         << "#include <json/json.h>" << endl
         << endl
         << "#include <cqlgen/json.hxx>" << endl
         << "#include <cqlgen/buffer.hxx>" << endl
         << "#include <cqlgen/nullable.hxx>" << endl;

      if (t.imports.time)
        os << "#include <cqlgen/timestamp.hxx>" << endl;

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

      open_ns (t.dto_namespace);

      os << "struct " << t.model
         << "{";

      for (fields::const_iterator i (t.columns.begin ());
           i != t.columns.end (); ++i)
        os << i->dto_type << " " << i->member << ";";

      os << "};";

      // JSON conversion with the lower-camel tags.
      //
      os << "inline void" << endl
         << "to_json (const " << t.model << "& o, Json::Value& v)"
         << "{"
         << "using cqlgen::to_json;"
         << endl
         << "v = Json::Value (Json::objectValue);";

      for (fields::const_iterator i (t.columns.begin ());
           i != t.columns.end (); ++i)
        os << "to_json (o." << i->member << ", v[" << strlit (i->tag) <<
          "]);";

      os << "}";

      os << "inline void" << endl
         << "from_json (const Json::Value& v, " << t.model << "& o)"
         << "{"
         << "using cqlgen::from_json;"
         << endl;

      for (fields::const_iterator i (t.columns.begin ());
           i != t.columns.end (); ++i)
        os << "if (v.isMember (" << strlit (i->tag) << "))" << endl
           << "from_json (v[" << strlit (i->tag) << "], o." << i->member <<
          ");";

      os << "}";

      close_ns (t.dto_namespace);

      os << endl
         << "#endif // " << guard << endl;
    }

  private:
    string
    guard_name () const
    {
      return macro (t.generated_name) + "_DTO_GEN_HXX";
    }

  private:
    table_type const& t;
  };
}

namespace dto
{
  void
  generate ()
  {
    emitter e;
    e.generate ();
  }
}
