// file      : tests/keys.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <string>
#include <sstream>

#include <gtest/gtest.h>

#include <cqlgen/keys.hxx>
#include <cqlgen/semantics.hxx>

using namespace std;
using namespace semantics;

namespace
{
  class Keys: public ::testing::Test
  {
  protected:
    Keys ()
        : t (m.new_node<semantics::table> ("Item", "ItemDao", "items"))
    {
      m.new_edge<names> (m, t, "items");
    }

    void
    add (string const& name, string const& type, key_role k)
    {
      column& c (m.new_node<column> (type, k));
      m.new_edge<names> (t, c, name);
    }

    semantics::model m;
    semantics::table& t;
  };
}

TEST_F (Keys, SinglePartitionKeyIsNotParenthesized)
{
  add ("id", "uuid", key_role::partition);
  add ("ts", "timestamp", key_role::cluster_desc);
  add ("tags", "list<blob>", key_role::none);

  key_structure k (build_keys (t));

  EXPECT_EQ (k.partition_key_clause (), "id");
  EXPECT_EQ (k.clustering_columns_clause (), ", ts");
  EXPECT_EQ (k.clustering_order_clause (),
             " WITH CLUSTERING ORDER BY (ts DESC)");
  EXPECT_EQ (k.all_keys_clause (), "id, ts");
  EXPECT_EQ (k.all_keys_equality (), "id=? AND ts=?");
  EXPECT_EQ (k.partition_keys_equality (), "id=?");
}

TEST_F (Keys, CompositePartitionKey)
{
  add ("k1", "text", key_role::partition);
  add ("value", "int", key_role::none);
  add ("k2", "int", key_role::partition);

  key_structure k (build_keys (t));

  EXPECT_EQ (k.partition_key_clause (), "(k1, k2)");
  EXPECT_EQ (k.clustering_columns_clause (), "");
  EXPECT_EQ (k.clustering_order_clause (), "");
  EXPECT_EQ (k.partition_keys_equality (), "k1=? AND k2=?");
  EXPECT_EQ (k.all_keys_equality (), "k1=? AND k2=?");
}

TEST_F (Keys, UnorderedClusteringKeysHaveNoOrderClause)
{
  add ("id", "uuid", key_role::partition);
  add ("a", "text", key_role::cluster);
  add ("b", "text", key_role::cluster);

  key_structure k (build_keys (t));

  EXPECT_EQ (k.clustering_columns_clause (), ", a, b");
  EXPECT_TRUE (k.clustering_order.empty ());
  EXPECT_EQ (k.clustering_order_clause (), "");
}

TEST_F (Keys, MixedClusteringOrder)
{
  add ("id", "uuid", key_role::partition);
  add ("a", "text", key_role::cluster_asc);
  add ("b", "text", key_role::cluster);
  add ("c", "timestamp", key_role::cluster_desc);

  key_structure k (build_keys (t));

  EXPECT_EQ (k.clustering_columns_clause (), ", a, b, c");
  EXPECT_EQ (k.clustering_order_clause (),
             " WITH CLUSTERING ORDER BY (a ASC, c DESC)");
}

TEST_F (Keys, KeysFollowColumnOrder)
{
  add ("ts", "timestamp", key_role::cluster);
  add ("id", "uuid", key_role::partition);

  key_structure k (build_keys (t));

  EXPECT_EQ (k.all_keys_clause (), "ts, id");
  EXPECT_EQ (k.partition_key_clause (), "id");
}

TEST_F (Keys, NoPartitionKey)
{
  add ("a", "text", key_role::cluster);
  add ("b", "text", key_role::none);

  EXPECT_THROW (build_keys (t), empty_partition_key);
}

TEST (KeyRole, Parse)
{
  struct
  {
    char const* text;
    key_role::value role;
  } const roles[] =
  {
    {"", key_role::none},
    {"none", key_role::none},
    {"partition", key_role::partition},
    {"cluster", key_role::cluster},
    {"cluster-asc", key_role::cluster_asc},
    {"cluster-desc", key_role::cluster_desc}
  };

  for (size_t i (0); i < sizeof (roles) / sizeof (roles[0]); ++i)
  {
    istringstream is (roles[i].text);
    key_role k (key_role::partition);

    if (roles[i].role == key_role::partition)
      k = key_role::none;

    EXPECT_TRUE (static_cast<bool> (is >> k)) << roles[i].text;
    EXPECT_EQ (static_cast<key_role::value> (k), roles[i].role)
      << roles[i].text;
  }

  // Unknown roles are not extracted. The parser turns them into none.
  //
  istringstream is ("cluster-none");
  key_role k;
  EXPECT_FALSE (static_cast<bool> (is >> k));
}
