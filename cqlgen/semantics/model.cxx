// file      : cqlgen/semantics/model.cxx
// copyright : Copyright (c) 2026 cqlgen contributors
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <cqlgen/semantics/model.hxx>

namespace semantics
{
  // type info
  //
  namespace
  {
    struct init
    {
      init ()
      {
        using compiler::type_info;

        type_info ti (typeid (model));
        ti.add_base (typeid (scope));
        insert (ti);
      }
    } init_;
  }
}
