// file      : tests/template.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include <cqlgen/template.hxx>
#include <cqlgen/emission.hxx>

#include "harness.hxx"

using namespace std;

namespace
{
  class Template: public ::testing::Test
  {
  protected:
    Template ()
        : ops (harness::make_options ()),
          m (harness::load (harness::config (harness::events_table ()), ops)),
          t (emission::build (*m, harness::table (*m, "events")))
    {
    }

    string
    render (string const& text) const
    {
      return template_ (text).render (t);
    }

    size_t
    error_line (string const& text) const
    {
      try
      {
        template_ x (text);
      }
      catch (template_error const& e)
      {
        return e.line;
      }

      return 0;
    }

    options ops;
    unique_ptr<semantics::model> m;
    emission::table_model t;
  };
}

TEST_F (Template, PlainText)
{
  EXPECT_EQ (render (""), "");
  EXPECT_EQ (render ("// nothing to substitute\n"),
             "// nothing to substitute\n");
}

TEST_F (Template, ScalarVariables)
{
  EXPECT_EQ (render ("{{keyspace}}.{{table}}"), "app.events");
  EXPECT_EQ (render ("{{ dao }}/{{model}}/{{generated_name}}"),
             "EventDao/Event/Events");
  EXPECT_EQ (render ("PRIMARY KEY ({{partition_keys}}{{clustering_columns}})"
                     "{{clustering_order}}"),
             "PRIMARY KEY (id, ts) WITH CLUSTERING ORDER BY (ts DESC)");
  EXPECT_EQ (render ("{{all_keys_equality}}|{{partition_keys_equality}}"),
             "id=? AND ts=?|id=?");
  EXPECT_EQ (render ("({{insert_fields}}) ({{insert_values}})"),
             "(id, ts, tags) (?, ?, ?)");
  EXPECT_EQ (render ("{{namespace}}"), "app::store");
}

TEST_F (Template, ColumnsSection)
{
  EXPECT_EQ (render ("{{#columns}}{{name}}:{{cql_type}};{{/columns}}"),
             "id:uuid;ts:timestamp;tags:list<blob>;");

  EXPECT_EQ (render ("{{#columns}}[{{serialized_type}}]{{/columns}}"),
             "[][][Tag]");

  EXPECT_EQ (render ("{{#columns}}{{key}} {{/columns}}"),
             "partition cluster-desc none ");

  // Scalars are available inside the section.
  //
  EXPECT_EQ (render ("{{#columns}}{{table}}.{{tag}} {{/columns}}"),
             "events.id events.ts events.tags ");
}

TEST_F (Template, Comments)
{
  EXPECT_EQ (render ("a{{! ignored }}b"), "ab");
  EXPECT_EQ (render ("{{!{{table}}}}x"), "}}x");
}

TEST_F (Template, Errors)
{
  EXPECT_EQ (error_line ("{{table"), 1u);
  EXPECT_EQ (error_line ("\n\n{{}}"), 3u);
  EXPECT_EQ (error_line ("{{unknown}}"), 1u);
  EXPECT_EQ (error_line ("\n{{name}}"), 2u);
  EXPECT_EQ (error_line ("{{#tables}}{{/tables}}"), 1u);
  EXPECT_EQ (error_line ("{{/columns}}"), 1u);
  EXPECT_EQ (error_line ("{{#columns}}\n{{#columns}}{{/columns}}"), 2u);
  EXPECT_EQ (error_line ("{{#columns}}{{name}}\n\n"), 1u);
  EXPECT_THROW (template_ ("{{#columns}}{{/rows}}"), template_error);
}
