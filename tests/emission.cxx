// file      : tests/emission.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>
#include <string>

#include <gtest/gtest.h>

#include <json/json.h>

#include <cqlgen/context.hxx>
#include <cqlgen/emission.hxx>

#include "harness.hxx"

using namespace std;

namespace
{
  emission::table_model
  build (string const& json, string const& table)
  {
    options ops (harness::make_options ());
    unique_ptr<semantics::model> m (harness::load (json, ops));
    return emission::build (*m, harness::table (*m, table));
  }

  string const models (
    "\"modelPackage\": \"model\", "
    "\"ModelGeneration\": {\"Package\": \"model\", \"Location\": \"model\"}");
}

TEST (Emission, EventsTable)
{
  emission::table_model t (
    build (harness::config (harness::events_table ()), "events"));

  EXPECT_EQ (t.keyspace, "app");
  EXPECT_EQ (t.namespace_, "app::store");
  EXPECT_EQ (t.model, "Event");
  EXPECT_EQ (t.model_type, "Event");
  EXPECT_EQ (t.dao, "EventDao");
  EXPECT_EQ (t.generated_name, "Events");
  EXPECT_TRUE (t.dto_namespace.empty ());

  EXPECT_EQ (t.partition_keys, "id");
  EXPECT_EQ (t.clustering_columns, ", ts");
  EXPECT_EQ (t.clustering_order, " WITH CLUSTERING ORDER BY (ts DESC)");
  EXPECT_EQ (t.all_keys, "id, ts");
  EXPECT_EQ (t.all_keys_equality, "id=? AND ts=?");
  EXPECT_EQ (t.partition_keys_equality, "id=?");
  EXPECT_EQ (t.insert_fields, "id, ts, tags");
  EXPECT_EQ (t.insert_values, "?, ?, ?");

  ASSERT_EQ (t.columns.size (), 3u);
  ASSERT_EQ (t.all_key_columns.size (), 2u);
  EXPECT_EQ (t.all_key_columns[0], 0u);
  EXPECT_EQ (t.all_key_columns[1], 1u);
  ASSERT_EQ (t.partition_key_columns.size (), 1u);
  EXPECT_EQ (t.partition_key_columns[0], 0u);

  EXPECT_TRUE (t.imports.time);
  EXPECT_TRUE (t.imports.json);
  EXPECT_TRUE (t.imports.uuid);
}

TEST (Emission, PlainColumnsScanIntoModel)
{
  emission::table_model t (
    build (harness::config (harness::events_table ()), "events"));

  emission::field const& id (t.columns[0]);
  EXPECT_EQ (id.cxx_type, "CassUuid");
  EXPECT_EQ (id.model_type, "CassUuid");
  EXPECT_EQ (id.scan_target, "o.id");
  EXPECT_EQ (id.insert_value, "o.id");
  EXPECT_FALSE (id.serialized ());
  EXPECT_TRUE (id.serialize.empty ());
  EXPECT_TRUE (id.deserialize.empty ());

  emission::field const& ts (t.columns[1]);
  EXPECT_EQ (ts.cxx_type, "cqlgen::nullable<cqlgen::timestamp>");
  EXPECT_EQ (ts.key, semantics::key_role::cluster_desc);
}

TEST (Emission, SerializedSequence)
{
  emission::table_model t (
    build (harness::config (harness::events_table ()), "events"));

  emission::field const& f (t.columns[2]);

  EXPECT_TRUE (f.serialized ());
  EXPECT_EQ (f.cxx_type, "std::vector<cqlgen::buffer>");
  EXPECT_EQ (f.serialized_type, "Tag");
  EXPECT_EQ (f.model_type, "std::vector<Tag>");
  EXPECT_EQ (f.dto_type, "std::vector<Tag>");
  EXPECT_EQ (f.raw, "tags_raw");
  EXPECT_EQ (f.scan_target, "tags_raw");
  EXPECT_EQ (f.insert_value, "tags_raw");

  // Rebuild the Tag values from the stored bytes.
  //
  EXPECT_NE (f.deserialize.find ("row.get (2u, tags_raw);"), string::npos);
  EXPECT_NE (f.deserialize.find ("Tag v;"), string::npos);
  EXPECT_NE (f.deserialize.find ("cqlgen::unmarshal (*i, v);"),
             string::npos);
  EXPECT_NE (f.deserialize.find ("o.tags.push_back (v);"), string::npos);

  // Marshal failures are logged and the element is skipped.
  //
  EXPECT_NE (f.serialize.find ("cqlgen::marshal (*i, v, e)"), string::npos);
  EXPECT_NE (f.serialize.find ("tags_raw.push_back (v);"), string::npos);
  EXPECT_NE (f.serialize.find ("std::cerr"), string::npos);
  EXPECT_EQ (f.serialize.find ("throw"), string::npos);
}

TEST (Emission, SerializedMappingWithModelNamespace)
{
  string table (
    "{\"modelName\": \"Profile\", \"tableName\": \"profiles\", "
    "\"dao\": \"ProfileDao\", \"columns\": ["
    "{\"name\": \"user\", \"type\": \"text\", \"key\": \"partition\"}, "
    "{\"name\": \"attrs\", \"type\": \"map<text,blob>\", "
    "\"deserializeTo\": \"model::Attr\"}]}");

  emission::table_model t (build (harness::config (table, models),
                                  "profiles"));

  EXPECT_EQ (t.model_type, "model::Profile");
  EXPECT_EQ (t.dto_namespace, "model");
  EXPECT_EQ (t.generated_name, "profiles");

  emission::field const& f (t.columns[1]);

  EXPECT_EQ (f.collection, type_mapping::mapping);
  EXPECT_EQ (f.model_type, "std::map<std::string, model::Attr>");
  EXPECT_EQ (f.dto_type, "std::map<std::string, Attr>");
  EXPECT_NE (f.deserialize.find ("cqlgen::unmarshal (i->second, v);"),
             string::npos);
  EXPECT_NE (f.deserialize.find ("o.attrs[i->first] = v;"), string::npos);
  EXPECT_NE (f.serialize.find ("attrs_raw[i->first] = v;"), string::npos);
  EXPECT_NE (f.serialize.find ("could not marshal attribute of attrs"),
             string::npos);
}

TEST (Emission, MemberNamesAndTags)
{
  string table (
    "{\"modelName\": \"Odd\", \"tableName\": \"odd\", \"dao\": \"OddDao\", "
    "\"columns\": ["
    "{\"name\": \"UserId\", \"type\": \"text\", \"key\": \"partition\"}, "
    "{\"name\": \"class\", \"type\": \"int\"}, "
    "{\"name\": \"row\", \"type\": \"int\"}, "
    "{\"name\": \"2fa\", \"type\": \"text\"}]}");

  emission::table_model t (build (harness::config (table), "odd"));

  EXPECT_EQ (t.columns[0].member, "UserId");
  EXPECT_EQ (t.columns[0].tag, "userId");
  EXPECT_EQ (t.columns[1].member, "class_");
  EXPECT_EQ (t.columns[2].member, "row_");
  EXPECT_EQ (t.columns[3].member, "cxx_2fa");
}

TEST (Emission, ModelDump)
{
  emission::table_model t (
    build (harness::config (harness::events_table ()), "events"));

  Json::Value v (emission::to_json (t));

  EXPECT_EQ (v["keyspace"].asString (), "app");
  EXPECT_EQ (v["table"].asString (), "events");
  EXPECT_FALSE (v.isMember ("modelNamespace"));
  ASSERT_EQ (v["keys"]["partition"].size (), 1u);
  EXPECT_EQ (v["keys"]["partition"][0].asString (), "id");
  EXPECT_EQ (v["keys"]["clusteringOrder"][0].asString (), "ts DESC");
  ASSERT_EQ (v["columns"].size (), 3u);
  EXPECT_EQ (v["columns"][2]["serializedType"].asString (), "Tag");
  EXPECT_FALSE (v["columns"][0].isMember ("serializedType"));
  EXPECT_EQ (v["imports"].size (), 3u);
}

TEST (Context, Strlit)
{
  EXPECT_EQ (context::strlit ("a \"b\"\n"), "\"a \\\"b\\\"\\n\"");
  EXPECT_EQ (context::strlit ("c:\\d"), "\"c:\\\\d\"");
}

TEST (Context, Unqualify)
{
  EXPECT_EQ (context::unqualify ("model::Tag", "model"), "Tag");
  EXPECT_EQ (context::unqualify ("other::Tag", "model"), "other::Tag");
  EXPECT_EQ (context::unqualify ("Tag", ""), "Tag");
  EXPECT_EQ (context::unqualify ("othermodel::Tag", "model"),
             "othermodel::Tag");
  EXPECT_EQ (context::unqualify ("app::model::Tag", "model"),
             "app::model::Tag");
}

TEST (Context, Macro)
{
  EXPECT_EQ (context::macro ("Events"), "EVENTS");
  EXPECT_EQ (context::macro ("user-events.v2"), "USER_EVENTS_V2");
  EXPECT_EQ (context::macro ("1Events"), "CXX_1EVENTS");
}
