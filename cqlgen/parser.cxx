// file      : cqlgen/parser.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cctype>   // std::tolower
#include <string>
#include <memory>   // std::unique_ptr
#include <sstream>
#include <iterator> // std::istreambuf_iterator
#include <iostream>

#include <json/json.h>

#include <cqlgen/diagnostics.hxx>
#include <cqlgen/parser.hxx>
#include <cqlgen/semantics.hxx>

using namespace std;
using namespace semantics;

class parser::impl
{
public:
  impl (options const&);

  unique_ptr<model>
  parse (istream&, path const&, bool columns_only);

private:
  typedef Json::Value value;

  bool
  load (istream&, value&);

  void
  emit_config (value const&);

  void
  emit_table (value const&);

  void
  emit_column (table&, value const&);

  // Member extraction. Return false if the member is absent. Issue a
  // diagnostics if it is present but has a wrong type.
  //
  bool
  get_string (value const& o, char const* name, string& r);

  bool
  get_object (value const& o, char const* name, value const*& r);

  bool
  get_array (value const& o, char const* name, value const*& r);

  // Diagnostics.
  //
  ostream&
  error (value const&);

  ostream&
  warning (value const&);

  void
  location (value const&, size_t& line, size_t& clmn) const;

  static string
  namespace_name (string const&);

  static string
  lower (string const&);

private:
  options const& ops_;

  bool trace;
  ostream& ts;

  path file_;
  string text_;

  model* model_;
  size_t error_;
};

parser::impl::
impl (options const& ops)
    : ops_ (ops), trace (ops.trace ()), ts (cerr), model_ (0), error_ (0)
{
}

unique_ptr<model> parser::impl::
parse (istream& is, path const& p, bool columns_only)
{
  unique_ptr<model> m (new model);

  file_ = p;
  model_ = m.get ();
  error_ = 0;

  value root;

  if (!load (is, root))
    throw failed ();

  if (trace)
    ts << "parsing " << p << endl;

  if (columns_only)
  {
    // Single table: the document is the list of columns.
    //
    if (!root.isArray ())
    {
      error (root) << "expected an array of columns" << endl;
      throw failed ();
    }

    model_->keyspace (ops_.keyspace ());
    model_->namespace_ (namespace_name (ops_.namespace_ ()));

    string n (lower (ops_.model ()));

    table& t (model_->new_node<table> (ops_.model (), ops_.dao (), n));
    t.location (1, 1);

    model_->new_edge<names> (*model_, t, n);

    for (Json::ArrayIndex i (0); i < root.size (); ++i)
      emit_column (t, root[i]);
  }
  else
  {
    if (!root.isObject ())
    {
      error (root) << "expected a configuration object" << endl;
      throw failed ();
    }

    emit_config (root);
  }

  if (error_ != 0)
    throw failed ();

  return m;
}

bool parser::impl::
load (istream& is, value& root)
{
  text_.assign (istreambuf_iterator<char> (is), istreambuf_iterator<char> ());

  if (is.bad ())
  {
    ::error (file_) << "unable to read" << endl;
    return false;
  }

  if (text_.find_first_not_of (" \t\r\n") == string::npos)
  {
    ::error (file_) << "configuration is empty" << endl;
    return false;
  }

  Json::CharReaderBuilder b;
  b["collectComments"] = false;

  unique_ptr<Json::CharReader> r (b.newCharReader ());
  string errs;

  if (!r->parse (text_.data (), text_.data () + text_.size (), &root, &errs))
  {
    ::error (file_) << "invalid JSON" << endl
                    << errs;
    return false;
  }

  return true;
}

void parser::impl::
emit_config (value const& o)
{
  string s;

  if (get_string (o, "keyspace", s))
    model_->keyspace (s);

  if (get_string (o, "package", s))
    model_->namespace_ (namespace_name (s));

  if (get_string (o, "boilerplate", s) && !s.empty ())
  {
    try
    {
      model_->boilerplate (path (s));
    }
    catch (invalid_path const&)
    {
      error (o["boilerplate"]) << "invalid boilerplate path '" << s << "'"
                               << endl;
    }
  }

  if (get_string (o, "modelPackage", s))
    model_->model_namespace (namespace_name (s));

  value const* a;

  if (get_array (o, "imports", a))
  {
    for (Json::ArrayIndex i (0); i < a->size (); ++i)
    {
      value const& v ((*a)[i]);

      if (!v.isString ())
      {
        error (v) << "import must be a string" << endl;
        continue;
      }

      string h (v.asString ());

      if (h.empty ())
        continue;

      // Keep quoted and bracketed headers as is.
      //
      if (h[0] != '"' && h[0] != '<')
        h = '"' + h + '"';

      model_->imports ().push_back (h);
    }
  }

  value const* g;

  if (get_object (o, "ModelGeneration", g))
  {
    if (get_string (*g, "Package", s))
      model_->model_generation_namespace (namespace_name (s));

    if (get_string (*g, "Location", s) && !s.empty ())
    {
      try
      {
        model_->model_generation_location (path (s));
      }
      catch (invalid_path const&)
      {
        error ((*g)["Location"]) << "invalid model location '" << s << "'"
                                 << endl;
      }
    }

    if (!model_->model_generation ())
      error (*g) << "model generation requires the 'Package' member" << endl;
  }

  if (get_array (o, "tables", a))
  {
    for (Json::ArrayIndex i (0); i < a->size (); ++i)
      emit_table ((*a)[i]);
  }
}

void parser::impl::
emit_table (value const& o)
{
  if (!o.isObject ())
  {
    error (o) << "table must be an object" << endl;
    return;
  }

  string mn, tn, dao, gn;

  get_string (o, "modelName", mn);
  get_string (o, "tableName", tn);
  get_string (o, "dao", dao);
  get_string (o, "generatedName", gn);

  // File names default to the table name.
  //
  if (gn.empty ())
    gn = tn;

  table& t (model_->new_node<table> (mn, dao, gn));

  size_t l, c;
  location (o, l, c);
  t.location (l, c);

  if (trace)
    ts << "table " << tn << " at " << l << ":" << c << endl;

  try
  {
    model_->new_edge<names> (*model_, t, tn);
  }
  catch (duplicate_name const& e)
  {
    error (o) << "table '" << tn << "' is already defined" << endl;
    ::info (file_, e.orig.line (), e.orig.column ())
      << "'" << tn << "' is previously defined here" << endl;
    return;
  }

  value const* a;

  if (get_array (o, "columns", a))
  {
    for (Json::ArrayIndex i (0); i < a->size (); ++i)
      emit_column (t, (*a)[i]);
  }
}

void parser::impl::
emit_column (table& t, value const& o)
{
  if (!o.isObject ())
  {
    error (o) << "column must be an object" << endl;
    return;
  }

  string n, type, key, des;

  get_string (o, "name", n);
  get_string (o, "type", type);
  get_string (o, "key", key);
  get_string (o, "deserializeTo", des);

  key_role k;
  {
    istringstream is (key);

    // An unknown role makes the column a regular, non-key column.
    //
    if (!(is >> k) || !is.eof ())
    {
      k = key_role::none;

      warning (o["key"]) << "unknown key role '" << key << "'; column '"
                         << n << "' is not part of the primary key" << endl;
      info (file_) << "key roles are 'partition', 'cluster', "
                   << "'cluster-asc', and 'cluster-desc'" << endl;
    }
  }

  column& c (model_->new_node<column> (type, k));
  c.deserialize_to (des);

  size_t l, cl;
  location (o, l, cl);
  c.location (l, cl);

  try
  {
    model_->new_edge<names> (t, c, n);
  }
  catch (duplicate_name const& e)
  {
    error (o) << "column '" << n << "' is already defined in table '"
              << t.name () << "'" << endl;
    ::info (file_, e.orig.line (), e.orig.column ())
      << "'" << n << "' is previously defined here" << endl;
  }
}

bool parser::impl::
get_string (value const& o, char const* name, string& r)
{
  if (!o.isMember (name))
    return false;

  value const& v (o[name]);

  if (v.isNull ())
    return false;

  if (!v.isString ())
  {
    error (v) << "'" << name << "' must be a string" << endl;
    return false;
  }

  r = v.asString ();
  return true;
}

bool parser::impl::
get_object (value const& o, char const* name, value const*& r)
{
  if (!o.isMember (name) || o[name].isNull ())
    return false;

  value const& v (o[name]);

  if (!v.isObject ())
  {
    error (v) << "'" << name << "' must be an object" << endl;
    return false;
  }

  r = &v;
  return true;
}

bool parser::impl::
get_array (value const& o, char const* name, value const*& r)
{
  if (!o.isMember (name) || o[name].isNull ())
    return false;

  value const& v (o[name]);

  if (!v.isArray ())
  {
    error (v) << "'" << name << "' must be an array" << endl;
    return false;
  }

  r = &v;
  return true;
}

ostream& parser::impl::
error (value const& v)
{
  size_t l, c;
  location (v, l, c);

  error_++;
  return ::error (file_, l, c);
}

ostream& parser::impl::
warning (value const& v)
{
  size_t l, c;
  location (v, l, c);

  return ::warn (file_, l, c);
}

void parser::impl::
location (value const& v, size_t& line, size_t& clmn) const
{
  size_t off (static_cast<size_t> (v.getOffsetStart ()));

  line = 1;
  clmn = 1;

  for (size_t i (0); i < off && i < text_.size (); ++i)
  {
    if (text_[i] == '\n')
    {
      line++;
      clmn = 1;
    }
    else
      clmn++;
  }
}

string parser::impl::
namespace_name (string const& s)
{
  // Accept both foo.bar and foo::bar.
  //
  string r;

  for (string::size_type i (0); i < s.size (); ++i)
  {
    if (s[i] == '.')
      r += "::";
    else
      r += s[i];
  }

  if (r.compare (0, 2, "::") == 0)
    r.erase (0, 2);

  return r;
}

string parser::impl::
lower (string const& s)
{
  string r (s);

  for (string::size_type i (0); i < r.size (); ++i)
    r[i] = static_cast<char> (tolower (static_cast<unsigned char> (r[i])));

  return r;
}

//
// parser
//

parser::
~parser ()
{
}

parser::
parser (options const& ops)
    : impl_ (new impl (ops))
{
}

unique_ptr<model> parser::
parse (istream& is, path const& p)
{
  return impl_->parse (is, p, false);
}

unique_ptr<model> parser::
parse_columns (istream& is, path const& p)
{
  return impl_->parse (is, p, true);
}
