// file      : tests/parser.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>
#include <string>
#include <sstream>

#include <gtest/gtest.h>

#include <cqlgen/parser.hxx>
#include <cqlgen/validator.hxx>
#include <cqlgen/semantics.hxx>

#include "harness.hxx"

using namespace std;
using namespace semantics;

namespace
{
  class Parser: public ::testing::Test
  {
  protected:
    Parser ()
        : ops (harness::make_options ())
    {
    }

    unique_ptr<semantics::model>
    parse (string const& json)
    {
      return harness::parse (json, ops);
    }

    // Parse the configuration expecting it to fail and return the
    // diagnostics.
    //
    string
    parse_error (string const& json)
    {
      ::testing::internal::CaptureStderr ();

      try
      {
        parse (json);
      }
      catch (parser::failed const&)
      {
        return ::testing::internal::GetCapturedStderr ();
      }

      ::testing::internal::GetCapturedStderr ();
      ADD_FAILURE () << "configuration parsed: " << json;
      return string ();
    }

    // Parse the configuration and return the validation diagnostics or
    // an empty string if it is valid.
    //
    string
    validation_error (string const& json)
    {
      unique_ptr<semantics::model> m (parse (json));

      ::testing::internal::CaptureStderr ();

      validator v;
      bool r (v.validate (ops, *m, harness::config_file ()));

      string e (::testing::internal::GetCapturedStderr ());
      return r ? string () : e;
    }

    options ops;
  };
}

TEST_F (Parser, Configuration)
{
  unique_ptr<semantics::model> m (
    parse ("{\"keyspace\": \"app\", \"package\": \"com.example.store\", "
           "\"boilerplate\": \"bp.tmpl\", "
           "\"imports\": [\"model/event.hxx\", \"<vector>\", "
           "\"\\\"quoted.hxx\\\"\"], "
           "\"modelPackage\": \"model\", "
           "\"ModelGeneration\": {\"Package\": \"com.example.model\", "
           "\"Location\": \"model\"}, "
           "\"unknownMember\": 1, "
           "\"tables\": [" + harness::events_table () + "]}"));

  EXPECT_EQ (m->keyspace (), "app");
  EXPECT_EQ (m->namespace_ (), "com::example::store");
  EXPECT_EQ (m->boilerplate ().string (), "bp.tmpl");
  EXPECT_EQ (m->model_namespace (), "model");
  EXPECT_TRUE (m->model_generation ());
  EXPECT_EQ (m->model_generation_namespace (), "com::example::model");
  EXPECT_EQ (m->model_generation_location ().string (), "model");

  ASSERT_EQ (m->imports ().size (), 3u);
  EXPECT_EQ (m->imports ()[0], "\"model/event.hxx\"");
  EXPECT_EQ (m->imports ()[1], "<vector>");
  EXPECT_EQ (m->imports ()[2], "\"quoted.hxx\"");

  semantics::table& t (harness::table (*m, "events"));
  EXPECT_EQ (t.model_name (), "Event");
  EXPECT_EQ (t.dao (), "EventDao");
  EXPECT_EQ (t.generated_name (), "Events");
  EXPECT_EQ (t.names_size (), 3u);

  column* c (t.find<column> ("tags"));
  ASSERT_TRUE (c != 0);
  EXPECT_EQ (c->type (), "list<blob>");
  EXPECT_EQ (c->deserialize_to (), "Tag");
  EXPECT_EQ (c->key (), key_role::none);
  EXPECT_EQ (&c->table (), &t);

  // Columns keep the configuration order.
  //
  scope::names_iterator i (t.names_begin ());
  EXPECT_EQ (i->name (), "id");
  EXPECT_EQ ((++i)->name (), "ts");
  EXPECT_EQ ((++i)->name (), "tags");
}

TEST_F (Parser, GeneratedNameDefaultsToTableName)
{
  unique_ptr<semantics::model> m (
    parse (harness::config (
             "{\"modelName\": \"User\", \"tableName\": \"users\", "
             "\"dao\": \"UserDao\", \"columns\": ["
             "{\"name\": \"id\", \"type\": \"uuid\", \"key\": \"partition\"}"
             "]}")));

  EXPECT_EQ (harness::table (*m, "users").generated_name (), "users");
  EXPECT_FALSE (m->model_generation ());
}

TEST_F (Parser, Locations)
{
  unique_ptr<semantics::model> m (
    parse ("{\"keyspace\": \"app\",\n"
           " \"tables\": [\n"
           "  {\"modelName\": \"A\", \"tableName\": \"a\", \"dao\": \"D\",\n"
           "   \"columns\": [\n"
           "    {\"name\": \"id\", \"type\": \"int\", \"key\": \"partition\"}]}]}"));

  semantics::table& t (harness::table (*m, "a"));
  EXPECT_EQ (t.line (), 3u);
  EXPECT_EQ (t.column (), 3u);

  column* c (t.find<column> ("id"));
  ASSERT_TRUE (c != 0);
  EXPECT_EQ (c->line (), 5u);
  EXPECT_EQ (c->column (), 5u);
}

TEST_F (Parser, EmptyConfiguration)
{
  EXPECT_NE (parse_error ("").find ("configuration is empty"), string::npos);
  EXPECT_NE (parse_error (" \n\t").find ("configuration is empty"),
             string::npos);
}

TEST_F (Parser, MalformedConfiguration)
{
  EXPECT_NE (parse_error ("{\"keyspace\": ").find ("invalid JSON"),
             string::npos);
  EXPECT_NE (parse_error ("[]").find ("expected a configuration object"),
             string::npos);
  EXPECT_NE (parse_error ("{\"keyspace\": 1}").find (
               "'keyspace' must be a string"),
             string::npos);
  EXPECT_NE (parse_error ("{\"tables\": {}}").find (
               "'tables' must be an array"),
             string::npos);
}

TEST_F (Parser, UnknownKeyRole)
{
  ::testing::internal::CaptureStderr ();

  unique_ptr<semantics::model> m (
    parse (
      harness::config (
        "{\"modelName\": \"A\", \"tableName\": \"a\", \"dao\": \"D\", "
        "\"columns\": [{\"name\": \"id\", \"type\": \"int\", "
        "\"key\": \"partition\"}, {\"name\": \"tags\", "
        "\"type\": \"list<blob>\", \"key\": \"cluster-none\"}]}")));

  string e (::testing::internal::GetCapturedStderr ());

  EXPECT_NE (e.find ("warning: unknown key role 'cluster-none'"),
             string::npos);
  EXPECT_NE (e.find ("persist-config.json:1:"), string::npos);

  semantics::table& t (harness::table (*m, "a"));
  column* c (t.find<column> ("tags"));

  ASSERT_TRUE (c != 0);
  EXPECT_EQ (c->key (), key_role::none);
}

TEST_F (Parser, DuplicateNames)
{
  string col ("{\"name\": \"id\", \"type\": \"int\", \"key\": \"partition\"}");
  string table (
    "{\"modelName\": \"A\", \"tableName\": \"a\", \"dao\": \"D\", "
    "\"columns\": [" + col + "]}");

  EXPECT_NE (parse_error (harness::config (table + ", " + table)).find (
               "table 'a' is already defined"),
             string::npos);

  EXPECT_NE (
    parse_error (
      harness::config (
        "{\"modelName\": \"A\", \"tableName\": \"a\", \"dao\": \"D\", "
        "\"columns\": [" + col + ", " + col + "]}")).find (
          "column 'id' is already defined in table 'a'"),
    string::npos);
}

TEST_F (Parser, ModelGenerationRequiresPackage)
{
  EXPECT_NE (
    parse_error (
      harness::config (harness::events_table (),
                       "\"ModelGeneration\": {\"Location\": \"model\"}")).find (
                         "requires the 'Package' member"),
    string::npos);
}

TEST_F (Parser, SingleTableColumns)
{
  options ops (harness::make_options (
                 {"--model", "Event", "--dao", "EventDao",
                  "--keyspace", "app", "--namespace", "app.store"}));

  istringstream is (
    "[{\"name\": \"id\", \"type\": \"uuid\", \"key\": \"partition\"},"
    " {\"name\": \"body\", \"type\": \"text\"}]");

  parser p (ops);
  unique_ptr<semantics::model> m (
    p.parse_columns (is, semantics::path ("Event.json")));

  EXPECT_EQ (m->keyspace (), "app");
  EXPECT_EQ (m->namespace_ (), "app::store");

  semantics::table& t (harness::table (*m, "event"));
  EXPECT_EQ (t.model_name (), "Event");
  EXPECT_EQ (t.dao (), "EventDao");
  EXPECT_EQ (t.generated_name (), "event");
  EXPECT_EQ (t.names_size (), 2u);
}

TEST_F (Parser, MemberNameCollision)
{
  string e (
    validation_error (
      harness::config (
        "{\"modelName\": \"A\", \"tableName\": \"a\", \"dao\": \"D\", "
        "\"columns\": [{\"name\": \"id\", \"type\": \"int\", "
        "\"key\": \"partition\"}, "
        "{\"name\": \"session\", \"type\": \"text\"}, "
        "{\"name\": \"session_\", \"type\": \"text\"}]}")));

  EXPECT_NE (e.find ("column 'session_' maps to member name 'session_' "
                     "which is already used by column 'session'"),
             string::npos);
  EXPECT_NE (e.find ("column 'session' is defined here"), string::npos);

  // Distinct escaped names are fine.
  //
  EXPECT_EQ (
    validation_error (
      harness::config (
        "{\"modelName\": \"A\", \"tableName\": \"a\", \"dao\": \"D\", "
        "\"columns\": [{\"name\": \"id\", \"type\": \"int\", "
        "\"key\": \"partition\"}, "
        "{\"name\": \"e\", \"type\": \"text\"}, "
        "{\"name\": \"e__\", \"type\": \"text\"}]}")),
    "");
}

TEST_F (Parser, Validation)
{
  EXPECT_EQ (validation_error (harness::config (harness::events_table ())),
             "");

  EXPECT_NE (validation_error (harness::config ("")).find (
               "at least one table must be defined"),
             string::npos);

  EXPECT_NE (validation_error ("{\"tables\": [" + harness::events_table () +
                               "]}").find ("keyspace is not specified"),
             string::npos);

  EXPECT_NE (
    validation_error (
      harness::config (
        "{\"modelName\": \"A\", \"tableName\": \"a\", \"dao\": \"D\", "
        "\"columns\": []}")).find ("table 'a' has no columns defined"),
    string::npos);

  EXPECT_NE (
    validation_error (
      harness::config (
        "{\"modelName\": \"A\", \"tableName\": \"a\", \"dao\": \"D\", "
        "\"columns\": [{\"name\": \"x\", \"type\": \"int\", "
        "\"key\": \"cluster\"}]}")).find ("table 'a' has no partition key"),
    string::npos);

  EXPECT_NE (
    validation_error (
      harness::config (
        "{\"tableName\": \"a\", \"columns\": [{\"name\": \"x\", "
        "\"type\": \"int\", \"key\": \"partition\"}]}")).find (
          "table 'a' has no model name"),
    string::npos);
}

TEST_F (Parser, IgnoredDeserializeHintIsOnlyWarned)
{
  string json (
    harness::config (
      "{\"modelName\": \"A\", \"tableName\": \"a\", \"dao\": \"D\", "
      "\"columns\": [{\"name\": \"id\", \"type\": \"int\", "
      "\"key\": \"partition\", \"deserializeTo\": \"Tag\"}]}"));

  unique_ptr<semantics::model> m (parse (json));

  ::testing::internal::CaptureStderr ();
  validator v;
  bool r (v.validate (ops, *m, harness::config_file ()));
  string e (::testing::internal::GetCapturedStderr ());

  EXPECT_TRUE (r);
  EXPECT_NE (e.find ("warning: 'deserializeTo' is ignored"), string::npos);
}
