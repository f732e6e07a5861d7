// file      : cqlgen/semantics/table.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <cqlgen/semantics/table.hxx>
#include <cqlgen/semantics/model.hxx>

namespace semantics
{
  table::model_type& table::
  model () const
  {
    return dynamic_cast<model_type&> (scope ());
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

        type_info ti (typeid (table));
        ti.add_base (typeid (nameable));
        ti.add_base (typeid (semantics::scope));
        insert (ti);
      }
    } init_;
  }
}
