// file      : cqlgen/generator.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <memory>   // std::unique_ptr
#include <vector>
#include <utility>  // std::pair
#include <fstream>
#include <sstream>
#include <iostream>

#include <cutl/fs/auto-remove.hxx>
#include <cutl/fs/exception.hxx>

#include <cutl/compiler/code-stream.hxx>
#include <cutl/compiler/cxx-indenter.hxx>
#include <cutl/compiler/sloc-counter.hxx>

#include <cqlgen/context.hxx>
#include <cqlgen/generate.hxx>
#include <cqlgen/emission.hxx>
#include <cqlgen/template.hxx>
#include <cqlgen/traversal.hxx>
#include <cqlgen/semantics.hxx>
#include <cqlgen/generator.hxx>
#include <cqlgen/diagnostics.hxx>

using namespace std;
using namespace cutl;

using semantics::path;

typedef compiler::ostream_filter<compiler::cxx_indenter, char> ind_filter;
typedef compiler::ostream_filter<compiler::sloc_counter, char> sloc_filter;

namespace
{
  // Return 0 if all the braces and parentheses outside of comments and
  // literals are balanced. Otherwise return the line of the first
  // unbalanced one.
  //
  size_t
  unbalanced (string const& s)
  {
    enum state {code, line_comment, block_comment, string_lit, char_lit};

    state st (code);
    size_t line (1);
    vector<pair<char, size_t> > open;

    for (string::size_type i (0), n (s.size ()); i < n; ++i)
    {
      char c (s[i]);

      if (c == '\n')
      {
        ++line;

        if (st == line_comment)
          st = code;

        continue;
      }

      switch (st)
      {
      case code:
        {
          if (c == '/' && i + 1 < n && s[i + 1] == '/')
          {
            st = line_comment;
            ++i;
          }
          else if (c == '/' && i + 1 < n && s[i + 1] == '*')
          {
            st = block_comment;
            ++i;
          }
          else if (c == '"')
            st = string_lit;
          else if (c == '\'')
            st = char_lit;
          else if (c == '{' || c == '(')
            open.push_back (make_pair (c, line));
          else if (c == '}' || c == ')')
          {
            if (open.empty () || open.back ().first != (c == '}' ? '{' : '('))
              return line;

            open.pop_back ();
          }
          break;
        }
      case line_comment:
        break;
      case block_comment:
        {
          if (c == '*' && i + 1 < n && s[i + 1] == '/')
          {
            st = code;
            ++i;
          }
          break;
        }
      case string_lit:
      case char_lit:
        {
          if (c == '\\')
            ++i;
          else if (c == (st == string_lit ? '"' : '\''))
            st = code;
          break;
        }
      }
    }

    if (st == string_lit || st == char_lit || st == block_comment)
      return line;

    return open.empty () ? 0 : open.back ().second;
  }

  struct table: traversal::table
  {
    table (options const& ops,
           semantics::model& m,
           template_ const* bp,
           path const& bp_file,
           generator::artifacts& r,
           bool& valid)
        : ops_ (ops),
          model_ (m),
          bp_ (bp),
          bp_file_ (bp_file),
          artifacts_ (r),
          valid_ (valid)
    {
    }

    virtual void
    traverse (type& t)
    {
      emission::table_model tm (emission::build (model_, t));

      string bp;

      if (bp_ != 0)
      {
        try
        {
          bp = bp_->render (tm);
        }
        catch (template_error const& e)
        {
          error (bp_file_, e.line, 0) << e.description << endl;
          info (bp_file_) << "while rendering boilerplate for table '" <<
            t.name () << "'" << endl;
          valid_ = false;
          return;
        }
      }

      string name (context::lower (tm.generated_name));
      path dir (ops_.output_dir ());

      emit (dir / path (name + "-dao_gen.hxx"), tm, bp, &dao::generate);

      if (model_.model_generation ())
        emit (dir / model_.model_generation_location () /
              path (name + "-dto_gen.hxx"),
              tm,
              bp,
              &dto::generate);
    }

  private:
    void
    emit (path const& file,
          emission::table_model const& tm,
          string const& bp,
          void (*gen) ())
    {
      ostringstream os;
      generator::artifact a;
      a.file = file;

      {
        ind_filter ind (os);
        sloc_filter sloc (os);

        context ctx (os, ops_, model_, tm, bp);
        gen ();

        a.sloc = sloc.stream ().count ();
      }

      a.text = os.str ();

      if (size_t l = unbalanced (a.text))
      {
        error () << "generated code for table '" << tm.table << "' is " <<
          "malformed (" << file << ":" << l << ")" << endl;
        cerr << a.text << endl;
        valid_ = false;
        return;
      }

      artifacts_.push_back (a);
    }

  private:
    options const& ops_;
    semantics::model& model_;
    template_ const* bp_;
    path const& bp_file_;
    generator::artifacts& artifacts_;
    bool& valid_;
  };
}

generator::artifacts generator::
render (options const& ops, semantics::model& m, path const& file)
{
  artifacts r;

  // Load the boilerplate template.
  //
  unique_ptr<template_> bp;
  path const& bp_file (m.boilerplate ());

  if (!bp_file.empty ())
  {
    ifstream is (bp_file.string ().c_str (), ios_base::in);

    if (!is.is_open ())
    {
      error (file) << "unable to open boilerplate file '" << bp_file <<
        "' in read mode" << endl;
      throw failed ();
    }

    ostringstream ss;
    ss << is.rdbuf ();

    if (is.bad ())
    {
      error (bp_file) << "io failure while reading boilerplate" << endl;
      throw failed ();
    }

    try
    {
      bp.reset (new template_ (ss.str ()));
    }
    catch (template_error const& e)
    {
      error (bp_file, e.line, 0) << e.description << endl;
      throw failed ();
    }
  }

  bool valid (true);

  traversal::model model;
  traversal::names names;
  table t (ops, m, bp.get (), bp_file, r, valid);

  model >> names >> t;
  model.dispatch (m);

  if (!valid)
    throw failed ();

  return r;
}

void generator::
generate (options const& ops, semantics::model& m, path const& file)
{
  artifacts as (render (ops, m, file));

  if (ops.to_stdout ())
  {
    for (artifacts::const_iterator i (as.begin ()); i != as.end (); ++i)
    {
      cout << i->text;

      if (ops.show_sloc ())
        cerr << i->file << ": " << i->sloc << endl;
    }

    return;
  }

  try
  {
    fs::auto_removes auto_rm;
    size_t sloc_total (0);

    for (artifacts::const_iterator i (as.begin ()); i != as.end (); ++i)
    {
      ofstream os (i->file.string ().c_str (), ios_base::out);

      if (!os.is_open ())
      {
        error () << "unable to open '" << i->file << "' in write mode" <<
          endl;
        throw failed ();
      }

      auto_rm.add (i->file);

      os << i->text;
      os.close ();

      if (os.fail ())
      {
        error () << "io failure while writing '" << i->file << "'" << endl;
        throw failed ();
      }

      if (ops.trace ())
        cerr << "wrote " << i->file << endl;

      if (ops.show_sloc ())
        cerr << i->file << ": " << i->sloc << endl;

      sloc_total += i->sloc;
    }

    if (ops.show_sloc ())
      cerr << "total: " << sloc_total << endl;

    auto_rm.cancel ();
  }
  catch (fs::error const& e)
  {
    error () << "unable to remove generated file: " << e.what () << endl;
    throw failed ();
  }
}
