// file      : tests/runtime.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v2; see accompanying LICENSE file

#include <map>
#include <string>
#include <chrono>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <json/json.h>

#include <cqlgen/json.hxx>
#include <cqlgen/buffer.hxx>
#include <cqlgen/stream.hxx>
#include <cqlgen/nullable.hxx>
#include <cqlgen/timestamp.hxx>

using namespace std;

namespace app
{
  // Application type stored in a blob collection.
  //
  struct Tag
  {
    Tag (): weight (0) {}

    string name;
    int weight;
    vector<string> aliases;
  };

  inline void
  to_json (const Tag& x, Json::Value& v)
  {
    using cqlgen::to_json;

    v = Json::Value (Json::objectValue);
    to_json (x.name, v["name"]);
    to_json (x.weight, v["weight"]);
    to_json (x.aliases, v["aliases"]);
  }

  inline void
  from_json (const Json::Value& v, Tag& x)
  {
    using cqlgen::from_json;

    if (v.isMember ("name"))
      from_json (v["name"], x.name);

    if (v.isMember ("weight"))
      from_json (v["weight"], x.weight);

    if (v.isMember ("aliases"))
      from_json (v["aliases"], x.aliases);
  }
}

namespace
{
  cqlgen::buffer
  bytes (string const& s)
  {
    return cqlgen::buffer (s.begin (), s.end ());
  }

  string
  text (cqlgen::buffer const& b)
  {
    return string (b.begin (), b.end ());
  }
}

//
// stream
//

TEST (Stream, DrainsAfterClose)
{
  cqlgen::stream<int> s (4);

  EXPECT_TRUE (s.push (1));
  EXPECT_TRUE (s.push (2));
  s.close ();

  EXPECT_TRUE (s.closed ());
  EXPECT_FALSE (s.push (3));

  int x;
  ASSERT_TRUE (s.pop (x));
  EXPECT_EQ (x, 1);
  ASSERT_TRUE (s.pop (x));
  EXPECT_EQ (x, 2);
  EXPECT_FALSE (s.pop (x));
  EXPECT_FALSE (s.pop (x));
}

TEST (Stream, ZeroCapacityIsOne)
{
  cqlgen::stream<int> s (0);
  EXPECT_EQ (s.capacity (), 1u);
}

TEST (Stream, ProducerBlocksAtCapacity)
{
  const size_t capacity (2);
  const int count (100);

  cqlgen::stream<int> s (capacity);
  size_t max_size (0);

  thread producer ([&s, count] ()
  {
    for (int i (0); i < count; ++i)
      s.push (i);

    s.close ();
  });

  vector<int> r;
  for (int x; s.pop (x);)
  {
    r.push_back (x);

    size_t n (s.size ());
    if (n > max_size)
      max_size = n;
  }

  producer.join ();

  ASSERT_EQ (r.size (), static_cast<size_t> (count));

  for (int i (0); i < count; ++i)
    EXPECT_EQ (r[i], i);

  EXPECT_LE (max_size, capacity);
}

TEST (Stream, CloseWakesBlockedConsumer)
{
  cqlgen::stream<string> s (1);

  thread closer ([&s] ()
  {
    this_thread::sleep_for (chrono::milliseconds (10));
    s.close ();
  });

  string x;
  EXPECT_FALSE (s.pop (x));

  closer.join ();
}

//
// nullable and timestamp
//

TEST (Nullable, NullAndValue)
{
  cqlgen::nullable<int> n;
  EXPECT_TRUE (n.null ());
  EXPECT_FALSE (n);

  n = 5;
  EXPECT_FALSE (n.null ());
  EXPECT_TRUE (n);
  EXPECT_EQ (*n, 5);

  cqlgen::nullable<int> m (n);
  EXPECT_TRUE (m == n);

  n.reset ();
  EXPECT_TRUE (n.null ());
  EXPECT_TRUE (m != n);
}

TEST (Timestamp, Milliseconds)
{
  cqlgen::timestamp t (cqlgen::from_milliseconds (1500000000123LL));
  EXPECT_EQ (cqlgen::to_milliseconds (t), 1500000000123LL);
}

//
// JSON marshalling
//

TEST (Json, MarshalUserType)
{
  app::Tag t;
  t.name = "red";
  t.weight = 3;
  t.aliases.push_back ("crimson");

  cqlgen::buffer b;
  string e;
  ASSERT_TRUE (cqlgen::marshal (t, b, e));
  EXPECT_TRUE (e.empty ());
  EXPECT_EQ (text (b), "{\"aliases\":[\"crimson\"],\"name\":\"red\",\"weight\":3}");

  app::Tag r;
  cqlgen::unmarshal (b, r);
  EXPECT_EQ (r.name, "red");
  EXPECT_EQ (r.weight, 3);
  ASSERT_EQ (r.aliases.size (), 1u);
  EXPECT_EQ (r.aliases[0], "crimson");
}

TEST (Json, UnmarshalFailureLeavesDefault)
{
  app::Tag r;
  r.name = "stale";

  cqlgen::unmarshal (bytes ("{not json"), r);
  EXPECT_EQ (r.name, "");
  EXPECT_EQ (r.weight, 0);

  // Type mismatch.
  //
  r.name = "stale";
  cqlgen::unmarshal (bytes ("{\"name\": \"x\", \"weight\": [1]}"), r);
  EXPECT_EQ (r.name, "");
  EXPECT_EQ (r.weight, 0);

  int i (7);
  cqlgen::unmarshal (cqlgen::buffer (), i);
  EXPECT_EQ (i, 0);
}

TEST (Json, Scalars)
{
  string s;
  cqlgen::unmarshal (bytes ("\"a\\nb\""), s);
  EXPECT_EQ (s, "a\nb");

  double d (0);
  cqlgen::unmarshal (bytes ("2.5"), d);
  EXPECT_EQ (d, 2.5);

  cqlgen::nullable<cqlgen::timestamp> t;
  cqlgen::unmarshal (bytes ("1000"), t);
  ASSERT_FALSE (t.null ());
  EXPECT_EQ (cqlgen::to_milliseconds (*t), 1000);

  cqlgen::unmarshal (bytes ("null"), t);
  EXPECT_TRUE (t.null ());
}

TEST (Json, BufferAsHex)
{
  cqlgen::buffer b;
  b.push_back (0x00);
  b.push_back (0xAB);
  b.push_back (0x7f);

  Json::Value v;
  cqlgen::to_json (b, v);
  EXPECT_EQ (v.asString (), "00ab7f");

  cqlgen::buffer r;
  cqlgen::from_json (v, r);
  EXPECT_EQ (r, b);

  EXPECT_THROW (cqlgen::from_json (Json::Value ("abc"), r),
                Json::RuntimeError);
  EXPECT_THROW (cqlgen::from_json (Json::Value ("zz"), r),
                Json::RuntimeError);
}

TEST (Json, Containers)
{
  map<string, vector<int> > m;
  m["a"].push_back (1);
  m["a"].push_back (2);
  m["b"];

  cqlgen::buffer b;
  string e;
  ASSERT_TRUE (cqlgen::marshal (m, b, e));
  EXPECT_EQ (text (b), "{\"a\":[1,2],\"b\":[]}");

  map<string, vector<int> > r;
  cqlgen::unmarshal (b, r);
  EXPECT_TRUE (r == m);
}
