// file      : cqlgen/emission.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <sstream>

#include <json/value.h>

#include <cqlgen/context.hxx>
#include <cqlgen/emission.hxx>

using namespace std;

namespace emission
{
  namespace
  {
    string
    join (strings const& s, char const* sep)
    {
      string r;

      for (strings::const_iterator i (s.begin ()); i != s.end (); ++i)
      {
        if (i != s.begin ())
          r += sep;

        r += *i;
      }

      return r;
    }

    // Iterate over the stored collection and unmarshal each value into
    // the model member. Values that fail to unmarshal are default-
    // initialized.
    //
    string
    deserialize_fragment (field const& f)
    {
      ostringstream os;
      string it (f.cxx_type + "::const_iterator");

      os << "{"
         << f.cxx_type << " " << f.raw << ";"
         << "row.get (" << f.index << "u, " << f.raw << ");"
         << "o." << f.member << ".clear ();"
         << endl
         << "for (" << it << " i (" << f.raw << ".begin ()); " <<
        "i != " << f.raw << ".end (); ++i)"
         << "{"
         << f.serialized_type << " v;";

      if (f.collection == type_mapping::sequence)
        os << "cqlgen::unmarshal (*i, v);"
           << "o." << f.member << ".push_back (v);";
      else
        os << "cqlgen::unmarshal (i->second, v);"
           << "o." << f.member << "[i->first] = v;";

      os << "}"
         << "}";

      return os.str ();
    }

    // Marshal each value of the model member into the stored collection.
    // Values that fail to marshal are logged and skipped.
    //
    string
    serialize_fragment (field const& f)
    {
      ostringstream os;
      string it (f.model_type + "::const_iterator");
      bool seq (f.collection == type_mapping::sequence);

      os << f.cxx_type << " " << f.raw << ";"
         << endl
         << "for (" << it << " i (o." << f.member << ".begin ()); " <<
        "i != o." << f.member << ".end (); ++i)"
         << "{"
         << "cqlgen::buffer v;"
         << "std::string e;"
         << endl
         << "if (cqlgen::marshal (" << (seq ? "*i" : "i->second") <<
        ", v, e))" << endl;

      if (seq)
        os << f.raw << ".push_back (v);";
      else
        os << f.raw << "[i->first] = v;";

      os << "else" << endl
         << "std::cerr << " << context::strlit (
           "could not marshal " + string (seq ? "value" : "attribute") +
           " of " + f.name + ": ") << " << ";

      if (!seq)
        os << "i->first << \": \" << ";

      os << "e << std::endl;"
         << "}";

      return os.str ();
    }
  }

  table_model
  build (semantics::model& m, semantics::table& t)
  {
    using semantics::column;

    table_model r;

    r.keyspace = m.keyspace ();
    r.namespace_ = m.namespace_ ();
    r.dto_namespace = m.model_generation_namespace ();
    r.model = t.model_name ();
    r.model_type = m.model_namespace ().empty ()
      ? t.model_name ()
      : m.model_namespace () + "::" + t.model_name ();
    r.table = t.name ();
    r.dao = t.dao ();
    r.generated_name = t.generated_name ();

    r.keys = t.get<key_structure> ("key-structure");
    r.partition_keys = r.keys.partition_key_clause ();
    r.clustering_columns = r.keys.clustering_columns_clause ();
    r.clustering_order = r.keys.clustering_order_clause ();
    r.all_keys = r.keys.all_keys_clause ();
    r.all_keys_equality = r.keys.all_keys_equality ();
    r.partition_keys_equality = r.keys.partition_keys_equality ();

    r.imports = t.get<import_flags> ("import-flags");
    r.additional_imports = m.imports ();

    strings names, values;

    for (semantics::scope::names_iterator i (t.names_begin ());
         i != t.names_end (); ++i)
    {
      column& c (dynamic_cast<column&> (i->named ()));
      type_mapping const& tm (c.get<type_mapping> ("type-mapping"));

      field f;
      f.index = r.columns.size ();
      f.name = c.name ();
      f.member = context::escape (c.name ());
      f.tag = context::lower_camel (c.name ());
      f.key = c.key ();
      f.cql_type = c.type ();
      f.cxx_type = tm.cxx_type;
      f.known = tm.known;
      f.serialized_type = tm.serialized_type;
      f.collection = tm.collection;

      if (f.serialized ())
      {
        string const& dt (
          context::unqualify (f.serialized_type, m.model_namespace ()));

        if (f.collection == type_mapping::sequence)
        {
          f.model_type = "std::vector<" + f.serialized_type + ">";
          f.dto_type = "std::vector<" + dt + ">";
        }
        else
        {
          f.model_type = "std::map<std::string, " + f.serialized_type + ">";
          f.dto_type = "std::map<std::string, " + dt + ">";
        }

        f.raw = f.member + "_raw";
        f.scan_target = f.raw;
        f.insert_value = f.raw;
        f.deserialize = deserialize_fragment (f);
        f.serialize = serialize_fragment (f);
      }
      else
      {
        f.model_type = f.cxx_type;
        f.dto_type = f.cxx_type;
        f.scan_target = "o." + f.member;
        f.insert_value = "o." + f.member;
      }

      names.push_back (f.name);
      values.push_back ("?");
      r.columns.push_back (f);
    }

    r.insert_fields = join (names, ", ");
    r.insert_values = join (values, ", ");

    // Key columns in the key order.
    //
    for (strings::const_iterator i (r.keys.all_keys.begin ());
         i != r.keys.all_keys.end (); ++i)
    {
      for (size_t j (0); j < r.columns.size (); ++j)
      {
        if (r.columns[j].name == *i)
        {
          r.all_key_columns.push_back (j);

          if (r.columns[j].key == semantics::key_role::partition)
            r.partition_key_columns.push_back (j);

          break;
        }
      }
    }

    return r;
  }

  Json::Value
  to_json (table_model const& t)
  {
    Json::Value r (Json::objectValue);

    r["keyspace"] = t.keyspace;
    r["namespace"] = t.namespace_;

    if (!t.dto_namespace.empty ())
      r["modelNamespace"] = t.dto_namespace;

    r["model"] = t.model;
    r["modelType"] = t.model_type;
    r["table"] = t.table;
    r["dao"] = t.dao;
    r["generatedName"] = t.generated_name;

    Json::Value& k (r["keys"] = Json::Value (Json::objectValue));
    k["partition"] = Json::Value (Json::arrayValue);
    k["clustering"] = Json::Value (Json::arrayValue);
    k["clusteringOrder"] = Json::Value (Json::arrayValue);

    for (strings::const_iterator i (t.keys.partition_keys.begin ());
         i != t.keys.partition_keys.end (); ++i)
      k["partition"].append (*i);

    for (strings::const_iterator i (t.keys.clustering_keys.begin ());
         i != t.keys.clustering_keys.end (); ++i)
      k["clustering"].append (*i);

    for (strings::const_iterator i (t.keys.clustering_order.begin ());
         i != t.keys.clustering_order.end (); ++i)
      k["clusteringOrder"].append (*i);

    Json::Value& cs (r["columns"] = Json::Value (Json::arrayValue));

    for (fields::const_iterator i (t.columns.begin ());
         i != t.columns.end (); ++i)
    {
      Json::Value c (Json::objectValue);
      c["name"] = i->name;
      c["cqlType"] = i->cql_type;
      c["cxxType"] = i->cxx_type;
      c["key"] = i->key.string ();

      if (i->serialized ())
        c["serializedType"] = i->serialized_type;

      cs.append (c);
    }

    Json::Value& is (r["imports"] = Json::Value (Json::arrayValue));

    if (t.imports.time)
      is.append ("cqlgen/timestamp.hxx");

    if (t.imports.json)
      is.append ("cqlgen/json.hxx");

    if (t.imports.uuid)
      is.append ("cqlgen/uuid.hxx");

    for (strings::const_iterator i (t.additional_imports.begin ());
         i != t.additional_imports.end (); ++i)
      is.append (*i);

    return r;
  }
}
