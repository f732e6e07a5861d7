// file      : tests/harness.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef TESTS_HARNESS_HXX
#define TESTS_HARNESS_HXX

#include <memory>  // std::unique_ptr
#include <string>
#include <vector>
#include <sstream>

#include <cqlgen/options.hxx>
#include <cqlgen/parser.hxx>
#include <cqlgen/validator.hxx>
#include <cqlgen/processor.hxx>
#include <cqlgen/semantics.hxx>

namespace harness
{
  typedef std::vector<std::string> strings;

  inline options
  make_options (strings const& args = strings ())
  {
    static char name[] = "cqlgen";

    std::vector<char*> argv;
    argv.push_back (name);

    for (strings::const_iterator i (args.begin ()); i != args.end (); ++i)
      argv.push_back (const_cast<char*> (i->c_str ()));

    argv.push_back (0);

    int argc (static_cast<int> (argv.size () - 1));
    return options (argc, &argv[0]);
  }

  inline semantics::path
  config_file ()
  {
    return semantics::path ("persist-config.json");
  }

  // Parse the configuration without validating or processing it.
  //
  inline std::unique_ptr<semantics::model>
  parse (std::string const& json, options const& ops)
  {
    std::istringstream is (json);
    parser p (ops);
    return p.parse (is, config_file ());
  }

  class invalid {};

  // Parse, validate, and process the configuration.
  //
  inline std::unique_ptr<semantics::model>
  load (std::string const& json, options const& ops)
  {
    std::unique_ptr<semantics::model> m (parse (json, ops));

    validator v;

    if (!v.validate (ops, *m, config_file ()))
      throw invalid ();

    processor p;
    p.process (ops, *m, config_file ());
    return m;
  }

  inline semantics::table&
  table (semantics::model& m, std::string const& name)
  {
    semantics::table* t (m.find<semantics::table> (name));

    if (t == 0)
      throw invalid ();

    return *t;
  }

  // Configuration with the given tables (JSON array body) and the
  // given top-level members (JSON object body, may be empty).
  //
  inline std::string
  config (std::string const& tables, std::string const& extra = "")
  {
    return "{\"keyspace\": \"app\", \"package\": \"app.store\", " +
      (extra.empty () ? std::string () : extra + ", ") +
      "\"tables\": [" + tables + "]}";
  }

  // Events table used by several tests: uuid partition key, descending
  // timestamp clustering key, and a serialized blob list with a role
  // that is not a key role.
  //
  inline std::string
  events_table ()
  {
    return
      "{\"modelName\": \"Event\", \"tableName\": \"events\", "
      "\"dao\": \"EventDao\", \"generatedName\": \"Events\", "
      "\"columns\": ["
      "{\"name\": \"id\", \"type\": \"uuid\", \"key\": \"partition\"}, "
      "{\"name\": \"ts\", \"type\": \"timestamp\", \"key\": \"cluster-desc\"}, "
      "{\"name\": \"tags\", \"type\": \"list<blob>\", "
      "\"key\": \"cluster-none\", "
      "\"deserializeTo\": \"Tag\"}]}";
  }
}

#endif // TESTS_HARNESS_HXX
