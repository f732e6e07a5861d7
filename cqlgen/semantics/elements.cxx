// file      : cqlgen/semantics/elements.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <cqlgen/semantics/elements.hxx>

namespace semantics
{
  // scope
  //
  void scope::
  add_edge_left (names& e)
  {
    nameable& n (e.named ());
    string const& name (e.name ());

    names_map::iterator i (names_map_.find (name));

    if (i == names_map_.end ())
      names_map_[name] = names_.insert (names_.end (), &e);
    else
      throw duplicate_name (*this, (*i->second)->named (), n);
  }

  // type info
  //
  namespace
  {
    struct init
    {
      init ()
      {
        using compiler::type_info;

        // node
        //
        insert (type_info (typeid (node)));

        // edge
        //
        insert (type_info (typeid (edge)));

        // names
        //
        {
          type_info ti (typeid (names));
          ti.add_base (typeid (edge));
          insert (ti);
        }

        // nameable
        //
        {
          type_info ti (typeid (nameable));
          ti.add_base (typeid (node));
          insert (ti);
        }

        // scope
        //
        {
          type_info ti (typeid (scope));
          ti.add_base (typeid (node));
          insert (ti);
        }
      }
    } init_;
  }
}
