// file      : cqlgen/semantics/elements.hxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef CQLGEN_SEMANTICS_ELEMENTS_HXX
#define CQLGEN_SEMANTICS_ELEMENTS_HXX

#include <map>
#include <list>
#include <string>
#include <cstddef> // std::size_t
#include <cassert>

#include <cutl/fs/path.hxx>

#include <cutl/container/graph.hxx>
#include <cutl/container/pointer-iterator.hxx>

#include <cutl/compiler/context.hxx>

namespace semantics
{
  using namespace cutl;

  using std::size_t;
  using std::string;

  using container::graph;
  using container::pointer_iterator;

  using compiler::context;

  using fs::path;
  using fs::invalid_path;

  //
  //
  class node;
  class edge;

  //
  //
  class edge: public context
  {
  public:
    virtual
    ~edge () {}

  public:
    template <typename X>
    bool
    is_a () const
    {
      return dynamic_cast<X const*> (this) != 0;
    }
  };

  //
  //
  class node: public context
  {
  public:
    virtual
    ~node () {}

    virtual string
    kind () const = 0;

  public:
    // Position of the node in the configuration file (0 if unknown).
    //
    size_t
    line () const
    {
      return line_;
    }

    size_t
    column () const
    {
      return column_;
    }

    void
    location (size_t line, size_t column)
    {
      line_ = line;
      column_ = column;
    }

  public:
    template <typename X>
    bool
    is_a () const
    {
      return dynamic_cast<X const*> (this) != 0;
    }

  public:
    node (): line_ (0), column_ (0) {}

    // Sink functions that allow extensions in the form of one-way
    // edges.
    //
    void
    add_edge_right (edge&)
    {
    }

  private:
    size_t line_;
    size_t column_;
  };

  //
  //
  class scope;
  class nameable;

  //
  //
  class names: public edge
  {
  public:
    typedef semantics::scope scope_type;
    typedef semantics::nameable nameable_type;

    string const&
    name () const
    {
      return name_;
    }

    scope_type&
    scope () const
    {
      return *scope_;
    }

    nameable_type&
    named () const
    {
      return *named_;
    }

  public:
    names (string const& name): name_ (name), scope_ (0), named_ (0) {}

    void
    set_left_node (scope_type& n)
    {
      scope_ = &n;
    }

    void
    set_right_node (nameable_type& n)
    {
      named_ = &n;
    }

  protected:
    string name_;
    scope_type* scope_;
    nameable_type* named_;
  };

  //
  //
  class nameable: public virtual node
  {
  public:
    typedef semantics::scope scope_type;

    string const&
    name () const
    {
      return named_->name ();
    }

    scope_type&
    scope () const
    {
      return named_->scope ();
    }

    names&
    named () const
    {
      return *named_;
    }

  public:
    nameable (): named_ (0) {}

    void
    add_edge_right (names& e)
    {
      assert (named_ == 0);
      named_ = &e;
    }

    using node::add_edge_right;

  private:
    names* named_;
  };

  // Thrown by scope::add_edge_left() if the name is already in use.
  //
  struct duplicate_name
  {
    typedef semantics::scope scope_type;
    typedef semantics::nameable nameable_type;

    duplicate_name (scope_type& s, nameable_type& o, nameable_type& d)
        : scope (s), orig (o), dup (d)
    {
    }

    scope_type& scope;
    nameable_type& orig;
    nameable_type& dup;
  };

  // Scope preserves the order in which names were added. This order is
  // significant: it is the order of tables in the configuration and the
  // order of columns in a table.
  //
  class scope: public virtual node
  {
  protected:
    typedef std::list<names*> names_list;
    typedef std::map<string, names_list::iterator> names_map;

  public:
    typedef pointer_iterator<names_list::iterator> names_iterator;
    typedef
    pointer_iterator<names_list::const_iterator>
    names_const_iterator;

  public:
    names_iterator
    names_begin ()
    {
      return names_.begin ();
    }

    names_iterator
    names_end ()
    {
      return names_.end ();
    }

    names_const_iterator
    names_begin () const
    {
      return names_.begin ();
    }

    names_const_iterator
    names_end () const
    {
      return names_.end ();
    }

    names_list::size_type
    names_size () const
    {
      return names_.size ();
    }

    bool
    names_empty () const
    {
      return names_.empty ();
    }

    // Return NULL if there is no such name or it is not of type T.
    //
    template <typename T>
    T*
    find (string const& name) const
    {
      names_map::const_iterator i (names_map_.find (name));
      return i != names_map_.end ()
        ? dynamic_cast<T*> (&(*i->second)->named ())
        : 0;
    }

  public:
    scope () {}

    void
    add_edge_left (names&);

  private:
    names_list names_;
    names_map names_map_;
  };
}

#endif // CQLGEN_SEMANTICS_ELEMENTS_HXX
